#pragma once

#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct DetectorThresholds {
    double expansion_ratio = 2.0;
    double expansion_high_ratio = 3.0;

    double range_proximity_pct = 2.0;
    double range_break_min_ratio = 1.5;

    double accel_fast_pct = 3.0;
    double accel_slow_pct = 6.0;

    double compression_factor = 0.7;   // trough vs the peak before it
    double release_factor = 1.5;       // current vs trough
    double release_high_multiple = 2.0;

    int structure_min_strength = 50;
    double structure_min_trend_pct = 2.0;
    double structure_min_reward_risk = 2.0;

    // Planned stop distance in ATRs
    double stop_atr_multiple = 1.5;
};

using DetectorRuleFn = std::function<std::optional<SetupCandidate>(
    const FeatureSet&, const std::vector<double>&, const DetectorThresholds&)>;

struct DetectorRule {
    std::string name;
    DetectorRuleFn fn;
};

class SetupDetector {
public:
    explicit SetupDetector(const DetectorThresholds& thresholds = DetectorThresholds());

    // Runs every rule, output in rule order.
    std::vector<SetupCandidate> detect(const FeatureSet& features,
                                       const std::vector<double>& volatility_history) const;
    std::vector<SetupCandidate> detect(const FeatureSet& features) const;

    static const std::vector<DetectorRule>& rules();

    static std::optional<SetupCandidate> volatility_expansion(
        const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t);
    static std::optional<SetupCandidate> range_break(
        const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t);
    static std::optional<SetupCandidate> trend_acceleration(
        const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t);
    static std::optional<SetupCandidate> compression_expansion(
        const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t);
    static std::optional<SetupCandidate> trend_with_structure(
        const FeatureSet& f, const std::vector<double>& history, const DetectorThresholds& t);

    static SetupCandidate make_candidate(const FeatureSet& f, const std::string& setup_type,
                                         Direction direction, Confidence confidence,
                                         const std::string& context, const DetectorThresholds& t);

private:
    DetectorThresholds thresholds_;
};
