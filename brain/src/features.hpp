#pragma once

#include "types.hpp"
#include <string>
#include <vector>

struct FeatureParams {
    int ma_fast = 20;
    int ma_slow = 50;
    int ma_trend = 200;
    int volatility_period = 20;
    int volatility_history = 20;  // previous readings kept for the ratio
    int range_period = 20;

    size_t required_candles() const;
};

class FeatureEngine {
public:
    explicit FeatureEngine(const FeatureParams& params = FeatureParams());

    // Throws InsufficientDataError for short windows, DataError for malformed ones.
    FeatureSet compute(const std::string& symbol, const std::string& timeframe,
                       const std::vector<Candle>& candles) const;

    const FeatureParams& params() const { return params_; }

    static void validate_window(const std::vector<Candle>& candles);

    // `end` is the index of the last candle included.
    static double simple_moving_average(const std::vector<Candle>& candles, size_t end, int period);
    static double true_range(const std::vector<Candle>& candles, size_t i);
    static double average_true_range(const std::vector<Candle>& candles, size_t end, int period);

    static int trend_strength(double close, double fast, double slow, double trend);

private:
    FeatureParams params_;
};
