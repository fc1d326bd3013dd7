#pragma once

#include "types.hpp"
#include <functional>
#include <string>
#include <vector>

struct ScoringParams {
    int trend_alignment_points = 30;
    int volatility_points = 25;
    int reward_risk_points = 25;
    int structure_points = 20;

    double min_volatility_ratio = 2.0;
    double min_reward_risk = 2.0;

    int min_forming_score = 50;
    int high_cutoff = 75;
    int medium_cutoff = 50;
    int max_score = 100;
};

using BucketFn = std::function<bool(const SetupCandidate&, const FeatureSet&, const ScoringParams&)>;

struct ScoringBucket {
    std::string name;
    int points;
    BucketFn awarded;
};

class DecisionEngine {
public:
    explicit DecisionEngine(const ScoringParams& params = ScoringParams());

    Decision decide(const SetupCandidate& candidate, const FeatureSet& features) const;
    std::vector<Decision> decide_all(const std::vector<SetupCandidate>& candidates,
                                     const FeatureSet& features) const;

    // Ordered; each bucket pays all of its points or none.
    const std::vector<ScoringBucket>& buckets() const { return buckets_; }

    DecisionStatus status_for(int score) const;
    Confidence tier_for(int score) const;

    static bool trend_alignment(const SetupCandidate& c, const FeatureSet& f, const ScoringParams& p);
    static bool volatility_expansion(const SetupCandidate& c, const FeatureSet& f, const ScoringParams& p);
    static bool reward_risk(const SetupCandidate& c, const FeatureSet& f, const ScoringParams& p);
    static bool structure_clarity(const SetupCandidate& c, const FeatureSet& f, const ScoringParams& p);

private:
    ScoringParams params_;
    std::vector<ScoringBucket> buckets_;

    std::string justify(const SetupCandidate& candidate, int score, DecisionStatus status,
                        const std::vector<std::string>& fired_parts) const;
};
