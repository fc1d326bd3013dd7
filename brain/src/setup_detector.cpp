#include "setup_detector.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

SetupDetector::SetupDetector(const DetectorThresholds& thresholds) : thresholds_(thresholds) {}

SetupCandidate SetupDetector::make_candidate(const FeatureSet& f, const std::string& setup_type,
                                             Direction direction, Confidence confidence,
                                             const std::string& context, const DetectorThresholds& t) {
    SetupCandidate c;
    c.symbol = f.symbol;
    c.timeframe = f.timeframe;
    c.setup_type = setup_type;
    c.direction = direction;
    c.confidence = confidence;
    c.context = context;
    c.entry_price = f.last_close;

    double stop_distance = t.stop_atr_multiple * f.atr;
    c.stop_price = direction == Direction::Long ? f.last_close - stop_distance
                                                : f.last_close + stop_distance;
    return c;
}

std::optional<SetupCandidate> SetupDetector::volatility_expansion(
    const FeatureSet& f, const std::vector<double>&, const DetectorThresholds& t) {
    if (f.volatility_ratio <= t.expansion_ratio) {
        return std::nullopt;
    }
    auto confidence = f.volatility_ratio > t.expansion_high_ratio ? Confidence::High : Confidence::Medium;
    return make_candidate(f, "volatility_expansion", f.trend_direction, confidence,
                          fmt::format("Volatility {:.2f}x recent average", f.volatility_ratio), t);
}

std::optional<SetupCandidate> SetupDetector::range_break(
    const FeatureSet& f, const std::vector<double>&, const DetectorThresholds& t) {
    if (f.volatility_ratio <= t.range_break_min_ratio) {
        return std::nullopt;
    }
    bool near_high = f.dist_high_pct <= t.range_proximity_pct;
    bool near_low = f.dist_low_pct <= t.range_proximity_pct;
    if (!near_high && !near_low) {
        return std::nullopt;
    }

    // Closer extreme wins when both are in reach
    bool long_side = near_high && (!near_low || f.dist_high_pct <= f.dist_low_pct);
    if (long_side) {
        return make_candidate(f, "range_break", Direction::Long, Confidence::Medium,
                              fmt::format("{:.2f}% below range high {:.4f}, volatility {:.2f}x",
                                          f.dist_high_pct, f.range_high, f.volatility_ratio), t);
    }
    return make_candidate(f, "range_break", Direction::Short, Confidence::Medium,
                          fmt::format("{:.2f}% above range low {:.4f}, volatility {:.2f}x",
                                      f.dist_low_pct, f.range_low, f.volatility_ratio), t);
}

std::optional<SetupCandidate> SetupDetector::trend_acceleration(
    const FeatureSet& f, const std::vector<double>&, const DetectorThresholds& t) {
    if (std::fabs(f.dist_slow_pct) > t.accel_slow_pct) {
        auto dir = f.dist_slow_pct > 0 ? Direction::Long : Direction::Short;
        return make_candidate(f, "trend_acceleration", dir, Confidence::High,
                              fmt::format("{:+.2f}% from slow MA", f.dist_slow_pct), t);
    }
    if (std::fabs(f.dist_fast_pct) > t.accel_fast_pct) {
        auto dir = f.dist_fast_pct > 0 ? Direction::Long : Direction::Short;
        return make_candidate(f, "trend_acceleration", dir, Confidence::Medium,
                              fmt::format("{:+.2f}% from fast MA", f.dist_fast_pct), t);
    }
    return std::nullopt;
}

std::optional<SetupCandidate> SetupDetector::compression_expansion(
    const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t) {
    if (history.size() < 2) {
        return std::nullopt;
    }
    auto trough_it = std::min_element(history.begin(), history.end());
    if (trough_it == history.begin()) {
        return std::nullopt;
    }
    double trough = *trough_it;
    double peak = *std::max_element(history.begin(), trough_it);

    if (trough <= 0.0 || trough >= t.compression_factor * peak) {
        return std::nullopt;
    }
    if (f.volatility <= t.release_factor * trough) {
        return std::nullopt;
    }

    double multiple = f.volatility / trough;
    auto confidence = multiple >= t.release_high_multiple ? Confidence::High : Confidence::Medium;
    return make_candidate(f, "compression_expansion", f.trend_direction, confidence,
                          fmt::format("Volatility {:.2f}% off a {:.2f}% trough ({:.2f}x)",
                                      f.volatility, trough, multiple), t);
}

std::optional<SetupCandidate> SetupDetector::trend_with_structure(
    const FeatureSet& f, const std::vector<double>&, const DetectorThresholds& t) {
    if (f.trend_strength < t.structure_min_strength) {
        return std::nullopt;
    }
    if (std::fabs(f.dist_trend_pct) < t.structure_min_trend_pct) {
        return std::nullopt;
    }
    double rr = f.structural_reward_risk(f.trend_direction);
    if (rr < t.structure_min_reward_risk) {
        return std::nullopt;
    }
    auto confidence = f.trend_strength >= 100 ? Confidence::High : Confidence::Medium;
    return make_candidate(f, "trend_with_structure", f.trend_direction, confidence,
                          fmt::format("Trend strength {}/100, R:R {:.2f}", f.trend_strength, rr), t);
}

const std::vector<DetectorRule>& SetupDetector::rules() {
    static const std::vector<DetectorRule> ordered = {
        {"volatility_expansion", &SetupDetector::volatility_expansion},
        {"range_break", &SetupDetector::range_break},
        {"trend_acceleration", &SetupDetector::trend_acceleration},
        {"compression_expansion", &SetupDetector::compression_expansion},
        {"trend_with_structure", &SetupDetector::trend_with_structure},
    };
    return ordered;
}

std::vector<SetupCandidate> SetupDetector::detect(const FeatureSet& features,
                                                  const std::vector<double>& volatility_history) const {
    std::vector<SetupCandidate> found;
    for (const auto& rule : rules()) {
        auto candidate = rule.fn(features, volatility_history, thresholds_);
        if (candidate) {
            found.push_back(std::move(*candidate));
        }
    }
    return found;
}

std::vector<SetupCandidate> SetupDetector::detect(const FeatureSet& features) const {
    return detect(features, features.volatility_history);
}
