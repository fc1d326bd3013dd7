#include "decision_engine.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>

DecisionEngine::DecisionEngine(const ScoringParams& params) : params_(params) {
    buckets_ = {
        {"trend_alignment", params_.trend_alignment_points, &DecisionEngine::trend_alignment},
        {"volatility_expansion", params_.volatility_points, &DecisionEngine::volatility_expansion},
        {"reward_risk", params_.reward_risk_points, &DecisionEngine::reward_risk},
        {"structure_clarity", params_.structure_points, &DecisionEngine::structure_clarity},
    };
}

bool DecisionEngine::trend_alignment(const SetupCandidate& c, const FeatureSet& f, const ScoringParams&) {
    return f.trend_strength == 100 && f.trend_direction == c.direction;
}

bool DecisionEngine::volatility_expansion(const SetupCandidate&, const FeatureSet& f, const ScoringParams& p) {
    return f.volatility_ratio >= p.min_volatility_ratio;
}

bool DecisionEngine::reward_risk(const SetupCandidate& c, const FeatureSet& f, const ScoringParams& p) {
    return f.structural_reward_risk(c.direction) >= p.min_reward_risk;
}

bool DecisionEngine::structure_clarity(const SetupCandidate& c, const FeatureSet&, const ScoringParams&) {
    return c.setup_type == "range_break" ||
           c.setup_type == "compression_expansion" ||
           c.setup_type == "trend_with_structure";
}

DecisionStatus DecisionEngine::status_for(int score) const {
    return score >= params_.min_forming_score ? DecisionStatus::Forming : DecisionStatus::Reject;
}

Confidence DecisionEngine::tier_for(int score) const {
    if (score >= params_.high_cutoff) return Confidence::High;
    if (score >= params_.medium_cutoff) return Confidence::Medium;
    return Confidence::Low;
}

std::string DecisionEngine::justify(const SetupCandidate& candidate, int score, DecisionStatus status,
                                    const std::vector<std::string>& fired_parts) const {
    std::string fired = fired_parts.empty() ? "none" : fmt::format("{}", fmt::join(fired_parts, ", "));

    if (status == DecisionStatus::Reject) {
        return fmt::format("rejected: score {} below {}; fired: {}",
                           score, params_.min_forming_score, fired);
    }
    return fmt::format("{} {} {} {}: {}; score {}/{} ({})",
                       candidate.setup_type, to_string(candidate.direction),
                       candidate.symbol, candidate.timeframe, fired,
                       score, params_.max_score, to_string(status));
}

Decision DecisionEngine::decide(const SetupCandidate& candidate, const FeatureSet& features) const {
    Decision d;
    d.candidate = candidate;

    std::vector<std::string> parts;
    int score = 0;
    for (const auto& bucket : buckets_) {
        if (bucket.awarded(candidate, features, params_)) {
            score += bucket.points;
            d.fired.push_back(bucket.name);
            parts.push_back(fmt::format("{} +{}", bucket.name, bucket.points));
        }
    }

    d.score = std::clamp(score, 0, params_.max_score);
    d.status = status_for(d.score);
    d.confidence = tier_for(d.score);
    d.justification = justify(candidate, d.score, d.status, parts);
    return d;
}

std::vector<Decision> DecisionEngine::decide_all(const std::vector<SetupCandidate>& candidates,
                                                 const FeatureSet& features) const {
    std::vector<Decision> decisions;
    decisions.reserve(candidates.size());
    for (const auto& c : candidates) {
        decisions.push_back(decide(c, features));
    }
    return decisions;
}
