#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Where candles come from. Implementations throw on transport failure.
class CandleSource {
public:
    virtual ~CandleSource() = default;

    virtual std::vector<Candle> fetch_candles(const std::string& symbol,
                                              const std::string& timeframe,
                                              int limit) = 0;
    virtual std::optional<double> latest_price(const std::string& symbol) = 0;

    // Called once at the top of every cycle.
    virtual void begin_cycle() {}
};

struct LogEntry {
    std::string log_type;  // decision, scan, paper, error
    std::string symbol;
    std::string timeframe;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
    int64_t ts_ms = 0;
};

// Tabular persistence. Every failure is a PersistenceError.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // setup_id -> last recorded confidence
    virtual std::map<std::string, Confidence> load_setup_confidences() = 0;
    virtual void upsert_setup(const SetupCandidate& candidate, int64_t now_ms) = 0;

    virtual void write_log(const LogEntry& entry) = 0;

    virtual std::optional<Account> load_account() = 0;
    virtual void create_account(const Account& account) = 0;

    virtual std::optional<Position> load_open_trade() = 0;
    virtual void save_open_trade(const Position& position) = 0;
    virtual void update_water_marks(const Position& position) = 0;

    // Closed trade insert, open trade delete and account update as one unit.
    virtual void record_close(const ClosedTrade& trade, const Account& account) = 0;

    virtual bool ping() = 0;
};

// Fire-and-forget notifications; publish never throws.
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual void publish(const nlohmann::json& alert) = 0;
    virtual bool ping() = 0;
};
