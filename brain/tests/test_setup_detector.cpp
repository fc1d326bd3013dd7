#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/setup_detector.hpp"

using Catch::Approx;

namespace {

// Quiet market: nothing fires.
FeatureSet quiet_features() {
    FeatureSet fs;
    fs.symbol = "BTCUSDT";
    fs.timeframe = "4h";
    fs.last_close = 100.0;
    fs.candle_count = 260;
    fs.atr = 2.0;
    fs.volatility = 2.0;
    fs.volatility_history = std::vector<double>(20, 2.0);
    fs.volatility_ratio = 1.0;
    fs.ma_fast = 100.0;
    fs.ma_slow = 100.0;
    fs.ma_trend = 100.0;
    fs.range_high = 110.0;
    fs.range_low = 90.0;
    fs.dist_high_pct = 10.0;
    fs.dist_low_pct = 10.0;
    fs.trend_strength = 0;
    fs.trend_direction = Direction::Long;
    return fs;
}

}  // namespace

TEST_CASE("Quiet market detects nothing", "[detector]") {
    SetupDetector detector;
    REQUIRE(detector.detect(quiet_features()).empty());
}

TEST_CASE("Rule order is fixed", "[detector]") {
    const auto& rules = SetupDetector::rules();
    REQUIRE(rules.size() == 5);
    REQUIRE(rules[0].name == "volatility_expansion");
    REQUIRE(rules[1].name == "range_break");
    REQUIRE(rules[2].name == "trend_acceleration");
    REQUIRE(rules[3].name == "compression_expansion");
    REQUIRE(rules[4].name == "trend_with_structure");
}

TEST_CASE("Volatility expansion rule", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();

    SECTION("Ratio at the threshold does not fire") {
        fs.volatility_ratio = 2.0;
        REQUIRE_FALSE(SetupDetector::volatility_expansion(fs, fs.volatility_history, t));
    }

    SECTION("Moderate expansion is MEDIUM in the trend direction") {
        fs.volatility_ratio = 2.5;
        fs.trend_direction = Direction::Short;
        auto c = SetupDetector::volatility_expansion(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->setup_type == "volatility_expansion");
        REQUIRE(c->confidence == Confidence::Medium);
        REQUIRE(c->direction == Direction::Short);
    }

    SECTION("Strong expansion is HIGH") {
        fs.volatility_ratio = 3.5;
        auto c = SetupDetector::volatility_expansion(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->confidence == Confidence::High);
    }
}

TEST_CASE("Range break rule", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();
    fs.volatility_ratio = 1.6;

    SECTION("Near the high goes LONG") {
        fs.dist_high_pct = 1.5;
        auto c = SetupDetector::range_break(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Long);
        REQUIRE(c->confidence == Confidence::Medium);
    }

    SECTION("Near the low goes SHORT") {
        fs.dist_low_pct = 1.0;
        auto c = SetupDetector::range_break(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Short);
    }

    SECTION("Closer extreme wins") {
        fs.dist_high_pct = 1.5;
        fs.dist_low_pct = 0.5;
        auto c = SetupDetector::range_break(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Short);
    }

    SECTION("Needs volatility above 1.5x") {
        fs.dist_high_pct = 1.0;
        fs.volatility_ratio = 1.5;
        REQUIRE_FALSE(SetupDetector::range_break(fs, fs.volatility_history, t));
    }
}

TEST_CASE("Trend acceleration rule", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();

    SECTION("Fast MA extension is MEDIUM") {
        fs.dist_fast_pct = 3.5;
        auto c = SetupDetector::trend_acceleration(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Long);
        REQUIRE(c->confidence == Confidence::Medium);
    }

    SECTION("Slow MA extension is HIGH and signed") {
        fs.dist_slow_pct = -7.0;
        auto c = SetupDetector::trend_acceleration(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Short);
        REQUIRE(c->confidence == Confidence::High);
    }

    SECTION("Within both thresholds") {
        fs.dist_fast_pct = 3.0;
        fs.dist_slow_pct = 6.0;
        REQUIRE_FALSE(SetupDetector::trend_acceleration(fs, fs.volatility_history, t));
    }
}

TEST_CASE("Compression then expansion rule", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();
    std::vector<double> history(10, 4.0);
    history.insert(history.end(), 10, 1.0);

    SECTION("Release of 2.5x the trough is HIGH") {
        fs.volatility = 2.5;
        auto c = SetupDetector::compression_expansion(fs, history, t);
        REQUIRE(c);
        REQUIRE(c->confidence == Confidence::High);
    }

    SECTION("Release of 1.8x the trough is MEDIUM") {
        fs.volatility = 1.8;
        auto c = SetupDetector::compression_expansion(fs, history, t);
        REQUIRE(c);
        REQUIRE(c->confidence == Confidence::Medium);
    }

    SECTION("No release yet") {
        fs.volatility = 1.4;
        REQUIRE_FALSE(SetupDetector::compression_expansion(fs, history, t));
    }

    SECTION("Trough must be well under the earlier peak") {
        std::vector<double> shallow(10, 1.2);
        shallow.insert(shallow.end(), 10, 1.0);
        fs.volatility = 2.5;
        REQUIRE_FALSE(SetupDetector::compression_expansion(fs, shallow, t));
    }
}

TEST_CASE("Trend with structure rule", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();
    fs.trend_strength = 100;
    fs.dist_trend_pct = 5.0;
    fs.range_high = 130.0;
    fs.range_low = 95.0;

    SECTION("Full alignment is HIGH") {
        auto c = SetupDetector::trend_with_structure(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->direction == Direction::Long);
        REQUIRE(c->confidence == Confidence::High);
    }

    SECTION("Partial alignment is MEDIUM") {
        fs.trend_strength = 50;
        auto c = SetupDetector::trend_with_structure(fs, fs.volatility_history, t);
        REQUIRE(c);
        REQUIRE(c->confidence == Confidence::Medium);
    }

    SECTION("Poor reward/risk blocks it") {
        fs.range_high = 104.0;
        REQUIRE_FALSE(SetupDetector::trend_with_structure(fs, fs.volatility_history, t));
    }

    SECTION("Too close to the trend MA") {
        fs.dist_trend_pct = 1.0;
        REQUIRE_FALSE(SetupDetector::trend_with_structure(fs, fs.volatility_history, t));
    }
}

TEST_CASE("Candidates carry a planned entry and stop", "[detector]") {
    DetectorThresholds t;
    auto fs = quiet_features();

    auto long_c = SetupDetector::make_candidate(fs, "range_break", Direction::Long,
                                                Confidence::Medium, "ctx", t);
    REQUIRE(long_c.entry_price == Approx(100.0));
    REQUIRE(long_c.stop_price == Approx(97.0));
    REQUIRE(long_c.setup_id() == "BTCUSDT:4h:range_break");

    auto short_c = SetupDetector::make_candidate(fs, "range_break", Direction::Short,
                                                 Confidence::Medium, "ctx", t);
    REQUIRE(short_c.stop_price == Approx(103.0));
}

TEST_CASE("Detection is ordered and deterministic", "[detector]") {
    SetupDetector detector;
    auto fs = quiet_features();
    fs.volatility_ratio = 3.5;
    fs.dist_high_pct = 1.0;
    fs.dist_fast_pct = 4.0;

    auto first = detector.detect(fs);
    auto second = detector.detect(fs);

    REQUIRE(first.size() == 3);
    REQUIRE(first[0].setup_type == "volatility_expansion");
    REQUIRE(first[1].setup_type == "range_break");
    REQUIRE(first[2].setup_type == "trend_acceleration");

    REQUIRE(second.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(second[i].setup_id() == first[i].setup_id());
        REQUIRE(second[i].direction == first[i].direction);
        REQUIRE(second[i].confidence == first[i].confidence);
        REQUIRE(second[i].stop_price == first[i].stop_price);
        REQUIRE(second[i].context == first[i].context);
    }
}
