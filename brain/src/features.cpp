#include "features.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

size_t FeatureParams::required_candles() const {
    int vol_span = volatility_period + volatility_history + 1;
    return static_cast<size_t>(std::max({ma_fast, ma_slow, ma_trend, vol_span, range_period}));
}

FeatureEngine::FeatureEngine(const FeatureParams& params) : params_(params) {}

void FeatureEngine::validate_window(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        if (!(c.close > 0.0) || !std::isfinite(c.close)) {
            throw DataError("Non-positive close at index " + std::to_string(i));
        }
        if (c.high < c.low) {
            throw DataError("High below low at index " + std::to_string(i));
        }
        if (i > 0 && c.ts_ms <= candles[i - 1].ts_ms) {
            throw DataError("Timestamps not strictly increasing at index " + std::to_string(i));
        }
    }
}

double FeatureEngine::simple_moving_average(const std::vector<Candle>& candles, size_t end, int period) {
    double sum = 0.0;
    for (size_t i = end + 1 - period; i <= end; ++i) {
        sum += candles[i].close;
    }
    return sum / period;
}

double FeatureEngine::true_range(const std::vector<Candle>& candles, size_t i) {
    const auto& c = candles[i];
    double range = c.high - c.low;
    if (i == 0) {
        return range;
    }
    double prev_close = candles[i - 1].close;
    return std::max({range, std::fabs(c.high - prev_close), std::fabs(c.low - prev_close)});
}

double FeatureEngine::average_true_range(const std::vector<Candle>& candles, size_t end, int period) {
    double sum = 0.0;
    for (size_t i = end + 1 - period; i <= end; ++i) {
        sum += true_range(candles, i);
    }
    return sum / period;
}

int FeatureEngine::trend_strength(double close, double fast, double slow, double trend) {
    if ((close > fast && fast > slow && slow > trend) ||
        (close < fast && fast < slow && slow < trend)) {
        return 100;
    }
    if ((close > trend && fast > slow) || (close < trend && fast < slow)) {
        return 50;
    }
    return 0;
}

FeatureSet FeatureEngine::compute(const std::string& symbol, const std::string& timeframe,
                                  const std::vector<Candle>& candles) const {
    size_t need = params_.required_candles();
    if (candles.size() < need) {
        throw InsufficientDataError(
            symbol + " " + timeframe + ": " + std::to_string(candles.size()) +
            " candles, need " + std::to_string(need),
            candles.size(), need);
    }
    validate_window(candles);

    size_t last = candles.size() - 1;
    FeatureSet fs;
    fs.symbol = symbol;
    fs.timeframe = timeframe;
    fs.as_of_ms = candles[last].ts_ms;
    fs.last_close = candles[last].close;
    fs.candle_count = candles.size();

    // Volatility now and at each of the previous readings
    fs.atr = average_true_range(candles, last, params_.volatility_period);
    fs.volatility = fs.atr / fs.last_close * 100.0;

    fs.volatility_history.reserve(params_.volatility_history);
    for (int k = params_.volatility_history; k >= 1; --k) {
        size_t idx = last - k;
        double atr = average_true_range(candles, idx, params_.volatility_period);
        fs.volatility_history.push_back(atr / candles[idx].close * 100.0);
    }

    double hist_mean = 0.0;
    if (!fs.volatility_history.empty()) {
        hist_mean = std::accumulate(fs.volatility_history.begin(), fs.volatility_history.end(), 0.0) /
                    fs.volatility_history.size();
    }
    fs.volatility_ratio = hist_mean > 0.0 ? fs.volatility / hist_mean : 0.0;

    fs.ma_fast = simple_moving_average(candles, last, params_.ma_fast);
    fs.ma_slow = simple_moving_average(candles, last, params_.ma_slow);
    fs.ma_trend = simple_moving_average(candles, last, params_.ma_trend);
    fs.dist_fast_pct = (fs.last_close - fs.ma_fast) / fs.ma_fast * 100.0;
    fs.dist_slow_pct = (fs.last_close - fs.ma_slow) / fs.ma_slow * 100.0;
    fs.dist_trend_pct = (fs.last_close - fs.ma_trend) / fs.ma_trend * 100.0;

    fs.range_high = candles[last].high;
    fs.range_low = candles[last].low;
    for (size_t i = candles.size() - params_.range_period; i <= last; ++i) {
        fs.range_high = std::max(fs.range_high, candles[i].high);
        fs.range_low = std::min(fs.range_low, candles[i].low);
    }
    fs.dist_high_pct = std::max(0.0, (fs.range_high - fs.last_close) / fs.last_close * 100.0);
    fs.dist_low_pct = std::max(0.0, (fs.last_close - fs.range_low) / fs.last_close * 100.0);

    fs.trend_strength = trend_strength(fs.last_close, fs.ma_fast, fs.ma_slow, fs.ma_trend);
    fs.trend_direction = fs.last_close >= fs.ma_fast ? Direction::Long : Direction::Short;

    return fs;
}
