#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/features.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

using Catch::Approx;

TEST_CASE("Feature window validation", "[features]") {
    FeatureEngine engine;

    SECTION("Longest lookback sets the minimum window") {
        REQUIRE(engine.params().required_candles() == 200);
    }

    SECTION("Short window raises InsufficientDataError") {
        auto candles = candles_from_closes(std::vector<double>(199, 100.0));
        REQUIRE_THROWS_AS(engine.compute("BTCUSDT", "4h", candles), InsufficientDataError);

        try {
            engine.compute("BTCUSDT", "4h", candles);
        } catch (const InsufficientDataError& e) {
            REQUIRE(e.have() == 199);
            REQUIRE(e.need() == 200);
        }
    }

    SECTION("Short window is a DataError") {
        auto candles = candles_from_closes(std::vector<double>(10, 100.0));
        REQUIRE_THROWS_AS(engine.compute("BTCUSDT", "4h", candles), DataError);
    }

    SECTION("Non-increasing timestamps are malformed") {
        auto candles = candles_from_closes(std::vector<double>(200, 100.0));
        candles[150].ts_ms = candles[149].ts_ms;
        REQUIRE_THROWS_AS(engine.compute("BTCUSDT", "4h", candles), DataError);
    }

    SECTION("Non-positive close is malformed") {
        auto candles = candles_from_closes(std::vector<double>(200, 100.0));
        candles[10].close = 0.0;
        REQUIRE_THROWS_AS(engine.compute("BTCUSDT", "4h", candles), DataError);
    }

    SECTION("Gaps in time are tolerated") {
        auto candles = candles_from_closes(std::vector<double>(200, 100.0));
        for (size_t i = 100; i < candles.size(); ++i) {
            candles[i].ts_ms += 10 * kStepMs;
        }
        REQUIRE_NOTHROW(engine.compute("BTCUSDT", "4h", candles));
    }
}

TEST_CASE("Feature values", "[features]") {
    FeatureEngine engine;

    SECTION("Flat series") {
        auto candles = candles_from_closes(std::vector<double>(200, 100.0));
        auto fs = engine.compute("BTCUSDT", "4h", candles);

        REQUIRE(fs.symbol == "BTCUSDT");
        REQUIRE(fs.timeframe == "4h");
        REQUIRE(fs.candle_count == 200);
        REQUIRE(fs.as_of_ms == candles.back().ts_ms);
        REQUIRE(fs.last_close == Approx(100.0));

        REQUIRE(fs.atr == Approx(1.0));
        REQUIRE(fs.volatility == Approx(1.0));
        REQUIRE(fs.volatility_history.size() == 20);
        REQUIRE(fs.volatility_ratio == Approx(1.0));

        REQUIRE(fs.ma_fast == Approx(100.0));
        REQUIRE(fs.ma_slow == Approx(100.0));
        REQUIRE(fs.ma_trend == Approx(100.0));
        REQUIRE(fs.dist_fast_pct == Approx(0.0).margin(1e-9));

        REQUIRE(fs.range_high == Approx(100.5));
        REQUIRE(fs.range_low == Approx(99.5));
        REQUIRE(fs.dist_high_pct == Approx(0.5));
        REQUIRE(fs.dist_low_pct == Approx(0.5));

        REQUIRE(fs.trend_strength == 0);
    }

    SECTION("Steady uptrend stacks the averages") {
        std::vector<double> closes;
        for (int i = 0; i < 200; ++i) closes.push_back(100.0 + i);
        auto fs = engine.compute("ETHUSDT", "1d", candles_from_closes(closes));

        REQUIRE(fs.last_close == Approx(299.0));
        REQUIRE(fs.ma_fast == Approx(289.5));
        REQUIRE(fs.ma_slow == Approx(274.5));
        REQUIRE(fs.ma_trend == Approx(199.5));
        REQUIRE(fs.dist_trend_pct == Approx((299.0 - 199.5) / 199.5 * 100.0));
        REQUIRE(fs.trend_strength == 100);
        REQUIRE(fs.trend_direction == Direction::Long);

        // Previous close sits one unit below, so every true range is 1.5
        REQUIRE(fs.atr == Approx(1.5));
    }

    SECTION("Steady downtrend") {
        std::vector<double> closes;
        for (int i = 0; i < 200; ++i) closes.push_back(500.0 - i);
        auto fs = engine.compute("SOLUSDT", "4h", candles_from_closes(closes));

        REQUIRE(fs.trend_strength == 100);
        REQUIRE(fs.trend_direction == Direction::Short);
        REQUIRE(fs.dist_fast_pct < 0.0);
    }

    SECTION("Volatility history is oldest first and excludes the current reading") {
        auto candles = rising_series_with_spike(260);
        auto fs = engine.compute("BTCUSDT", "4h", candles);

        REQUIRE(fs.volatility_history.size() == 20);
        // Closes rise while true range stays flat, so the history falls
        REQUIRE(fs.volatility_history.front() > fs.volatility_history.back());
        REQUIRE(fs.volatility > 2.0 * fs.volatility_history.back());
        REQUIRE(fs.volatility_ratio > 2.0);
        REQUIRE(fs.volatility_ratio < 3.0);
        REQUIRE(fs.atr == Approx((19 * 1.5 + 40.0) / 20.0));
    }
}

TEST_CASE("Trend strength scoring", "[features]") {
    REQUIRE(FeatureEngine::trend_strength(110, 105, 100, 95) == 100);
    REQUIRE(FeatureEngine::trend_strength(90, 95, 100, 105) == 100);
    REQUIRE(FeatureEngine::trend_strength(110, 100, 95, 105) == 50);
    REQUIRE(FeatureEngine::trend_strength(110, 95, 100, 105) == 0);
}

TEST_CASE("Structural reward/risk", "[features]") {
    FeatureSet fs;
    fs.last_close = 100.0;
    fs.range_high = 130.0;
    fs.range_low = 95.0;

    REQUIRE(fs.structural_reward_risk(Direction::Long) == Approx(6.0));
    REQUIRE(fs.structural_reward_risk(Direction::Short) == Approx(5.0 / 30.0));

    fs.range_low = 100.0;
    REQUIRE(fs.structural_reward_risk(Direction::Long) == 0.0);
}
