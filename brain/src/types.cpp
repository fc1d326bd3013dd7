#include "types.hpp"

std::string to_string(Direction direction) {
    switch (direction) {
        case Direction::Long: return "LONG";
        case Direction::Short: return "SHORT";
        default: return "UNKNOWN";
    }
}

std::string to_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "HIGH";
        case Confidence::Medium: return "MEDIUM";
        case Confidence::Low: return "LOW";
        default: return "UNKNOWN";
    }
}

std::string to_string(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::Forming: return "forming";
        case DecisionStatus::Reject: return "reject";
        default: return "unknown";
    }
}

std::string to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::Stop: return "stop";
        case ExitReason::Target: return "target";
        case ExitReason::Manual: return "manual";
        default: return "unknown";
    }
}

std::optional<Direction> parse_direction(const std::string& value) {
    if (value == "LONG") return Direction::Long;
    if (value == "SHORT") return Direction::Short;
    return std::nullopt;
}

std::optional<Confidence> parse_confidence(const std::string& value) {
    if (value == "HIGH") return Confidence::High;
    if (value == "MEDIUM") return Confidence::Medium;
    if (value == "LOW") return Confidence::Low;
    return std::nullopt;
}

std::optional<ExitReason> parse_exit_reason(const std::string& value) {
    if (value == "stop") return ExitReason::Stop;
    if (value == "target") return ExitReason::Target;
    if (value == "manual") return ExitReason::Manual;
    return std::nullopt;
}

double FeatureSet::structural_reward_risk(Direction direction) const {
    double room_up = range_high - last_close;
    double room_down = last_close - range_low;

    double reward = direction == Direction::Long ? room_up : room_down;
    double risk = direction == Direction::Long ? room_down : room_up;

    if (risk <= 0.0 || reward <= 0.0) {
        return 0.0;
    }
    return reward / risk;
}

std::string SetupCandidate::setup_id() const {
    return symbol + ":" + timeframe + ":" + setup_type;
}
