#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

struct Candle {
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    int64_t ts_ms = 0;
};

enum class Direction {
    Long,
    Short
};

enum class Confidence {
    High,
    Medium,
    Low
};

enum class DecisionStatus {
    Forming,
    Reject
};

enum class ExitReason {
    Stop,
    Target,
    Manual
};

std::string to_string(Direction direction);
std::string to_string(Confidence confidence);
std::string to_string(DecisionStatus status);
std::string to_string(ExitReason reason);

std::optional<Direction> parse_direction(const std::string& value);
std::optional<Confidence> parse_confidence(const std::string& value);
std::optional<ExitReason> parse_exit_reason(const std::string& value);

struct FeatureSet {
    std::string symbol;
    std::string timeframe;
    int64_t as_of_ms = 0;

    double last_close = 0.0;
    size_t candle_count = 0;

    // Average true range as % of close
    double atr = 0.0;
    double volatility = 0.0;
    std::vector<double> volatility_history;  // oldest first
    double volatility_ratio = 0.0;

    double ma_fast = 0.0;
    double ma_slow = 0.0;
    double ma_trend = 0.0;
    double dist_fast_pct = 0.0;
    double dist_slow_pct = 0.0;
    double dist_trend_pct = 0.0;

    double range_high = 0.0;
    double range_low = 0.0;
    double dist_high_pct = 0.0;
    double dist_low_pct = 0.0;

    int trend_strength = 0;  // 0, 50 or 100
    Direction trend_direction = Direction::Long;

    // Room to the range extreme ahead divided by room to the one behind.
    // 0 when the price sits on the extreme behind it.
    double structural_reward_risk(Direction direction) const;
};

struct SetupCandidate {
    std::string symbol;
    std::string timeframe;
    std::string setup_type;
    Direction direction = Direction::Long;
    Confidence confidence = Confidence::Medium;
    std::string context;
    double entry_price = 0.0;
    double stop_price = 0.0;

    // symbol:timeframe:setup_type
    std::string setup_id() const;
};

struct Decision {
    int score = 0;
    DecisionStatus status = DecisionStatus::Reject;
    Confidence confidence = Confidence::Low;
    std::string justification;
    std::vector<std::string> fired;
    SetupCandidate candidate;

    bool is_forming() const { return status == DecisionStatus::Forming; }
};

struct Account {
    double equity = 0.0;
    double initial_capital = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    int64_t updated_at_ms = 0;
};

struct Position {
    std::string symbol;
    std::string timeframe;
    Direction direction = Direction::Long;
    double entry_price = 0.0;
    double size = 0.0;
    double stop_price = 0.0;
    double target_price = 0.0;
    double risk_amount = 0.0;
    double equity_at_open = 0.0;
    int64_t opened_at_ms = 0;
    std::string setup_id;
    double high_water_mark = 0.0;
    double low_water_mark = 0.0;
};

struct ClosedTrade {
    Position position;
    double exit_price = 0.0;
    int64_t closed_at_ms = 0;
    double pnl = 0.0;
    double pnl_percent = 0.0;
    ExitReason exit_reason = ExitReason::Manual;
    int64_t duration_minutes = 0;
    double mfe_percent = 0.0;
    double mae_percent = 0.0;
};

struct PaperState {
    Account account;
    std::optional<Position> position;
};
