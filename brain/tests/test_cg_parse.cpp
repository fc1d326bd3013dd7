#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/cg_parse.hpp"
#include "../src/errors.hpp"

using Catch::Approx;
using json = nlohmann::json;

TEST_CASE("Timeframe to OHLC day count", "[coingecko]") {
    REQUIRE(cg_days_for_timeframe("1h") == 1);
    REQUIRE(cg_days_for_timeframe("4h") == 30);
    REQUIRE(cg_days_for_timeframe("1d") == 365);
    REQUIRE(cg_days_for_timeframe("15m") == 30);
}

TEST_CASE("Parsing OHLC rows", "[coingecko]") {
    SECTION("Rows map to candles oldest first") {
        auto rows = json::parse(R"([
            [1700000000000, 100.0, 105.0, 99.0, 104.0],
            [1700014400000, 104.0, 108.5, 103.0, 107.0]
        ])");
        auto candles = parse_cg_ohlc(rows, 0);

        REQUIRE(candles.size() == 2);
        REQUIRE(candles[0].ts_ms == 1700000000000);
        REQUIRE(candles[0].open == Approx(100.0));
        REQUIRE(candles[0].high == Approx(105.0));
        REQUIRE(candles[0].low == Approx(99.0));
        REQUIRE(candles[1].close == Approx(107.0));
        REQUIRE(candles[1].volume == 0.0);
    }

    SECTION("Repeated timestamp keeps the newer row") {
        auto rows = json::parse(R"([
            [1700000000000, 100, 105, 99, 104],
            [1700014400000, 104, 108, 103, 107],
            [1700014400000, 104, 110, 103, 109]
        ])");
        auto candles = parse_cg_ohlc(rows, 0);

        REQUIRE(candles.size() == 2);
        REQUIRE(candles.back().close == Approx(109.0));
        REQUIRE(candles.back().high == Approx(110.0));
    }

    SECTION("Earlier timestamp never produces a backwards series") {
        auto rows = json::parse(R"([
            [1700000000000, 100, 105, 99, 104],
            [1700014400000, 104, 108, 103, 107],
            [1700007200000, 107, 109, 106, 108],
            [1700028800000, 108, 111, 107, 110]
        ])");
        auto candles = parse_cg_ohlc(rows, 0);

        REQUIRE(candles.size() == 3);
        for (size_t i = 1; i < candles.size(); ++i) {
            REQUIRE(candles[i].ts_ms > candles[i - 1].ts_ms);
        }
    }

    SECTION("Short and non-numeric rows are dropped") {
        auto rows = json::parse(R"([
            [1700000000000, 100, 105, 99],
            [1700014400000, 104, 108, 103, 107],
            [1700028800000, "108", 111, 107, 110],
            "garbage"
        ])");
        auto candles = parse_cg_ohlc(rows, 0);

        REQUIRE(candles.size() == 1);
        REQUIRE(candles[0].ts_ms == 1700014400000);
    }

    SECTION("Limit keeps the newest candles") {
        json rows = json::array();
        for (int i = 0; i < 10; ++i) {
            rows.push_back({1700000000000 + i * 14400000LL, 100 + i, 101 + i, 99 + i, 100.5 + i});
        }
        auto candles = parse_cg_ohlc(rows, 4);

        REQUIRE(candles.size() == 4);
        REQUIRE(candles.front().open == Approx(106.0));
        REQUIRE(candles.back().open == Approx(109.0));
    }

    SECTION("Non-array payload yields nothing") {
        REQUIRE(parse_cg_ohlc(json::parse(R"({"error": "rate limited"})"), 10).empty());
    }
}

TEST_CASE("Symbol mapping documents", "[coingecko]") {
    SECTION("Defaults cover the default universe") {
        auto defaults = default_cg_symbol_map();
        for (const char* symbol : {"BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT", "XRPUSDT"}) {
            REQUIRE(defaults.count(symbol) == 1);
        }
        REQUIRE(defaults.at("BNBUSDT") == "binancecoin");
    }

    SECTION("Wrapped and flat forms") {
        auto wrapped = parse_cg_symbol_mapping(json::parse(R"({"mappings": {"PEPEUSDT": "pepe"}})"), "m.json");
        REQUIRE(wrapped.at("PEPEUSDT") == "pepe");

        auto flat = parse_cg_symbol_mapping(json::parse(R"({"WIFUSDT": "dogwifcoin"})"), "m.json");
        REQUIRE(flat.at("WIFUSDT") == "dogwifcoin");
    }

    SECTION("Non-string coin id is a configuration error") {
        REQUIRE_THROWS_AS(parse_cg_symbol_mapping(json::parse(R"({"BTCUSDT": 1})"), "m.json"), ConfigError);
        REQUIRE_THROWS_AS(parse_cg_symbol_mapping(json::parse(R"({"mappings": {"BTCUSDT": null}})"), "m.json"),
                          ConfigError);
    }

    SECTION("Empty or non-object mapping is a configuration error") {
        REQUIRE_THROWS_AS(parse_cg_symbol_mapping(json::parse("{}"), "m.json"), ConfigError);
        REQUIRE_THROWS_AS(parse_cg_symbol_mapping(json::parse(R"({"mappings": []})"), "m.json"), ConfigError);
        REQUIRE_THROWS_AS(parse_cg_symbol_mapping(json::parse("[1, 2]"), "m.json"), ConfigError);
    }
}
