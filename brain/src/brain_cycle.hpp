#pragma once

#include "collaborators.hpp"
#include "decision_engine.hpp"
#include "features.hpp"
#include "paper_trading.hpp"
#include "setup_detector.hpp"
#include "setup_recorder.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct CycleOptions {
    std::vector<std::string> symbols;
    std::vector<std::string> timeframes;
    int ohlc_limit = 260;
    bool paper_trading_enabled = false;
    double paper_initial_capital = 100000.0;
};

struct CycleStats {
    int cycle_num = 0;
    int64_t started_ms = 0;
    int64_t duration_ms = 0;

    int analysed = 0;
    int skipped = 0;
    int setups_detected = 0;
    int forming = 0;
    int rejected = 0;

    int setups_created = 0;
    int setups_updated = 0;
    int setups_skipped = 0;
    int setups_failed = 0;

    // disabled, flat, holding, opened, closed, closed+opened, error
    std::string paper_status = "disabled";

    nlohmann::json to_json() const;
};

class BrainCycle {
public:
    BrainCycle(const CycleOptions& options,
               std::shared_ptr<CandleSource> source,
               std::shared_ptr<RecordStore> store,
               std::shared_ptr<AlertSink> alerts,
               SetupRecorder recorder,
               const FeatureEngine& features = FeatureEngine(),
               const SetupDetector& detector = SetupDetector(),
               const DecisionEngine& decisions = DecisionEngine(),
               const PaperTradingEngine& paper = PaperTradingEngine());

    // One full pass. Per-pair, persistence and paper trading failures are
    // logged and counted; the cycle log is always written.
    CycleStats run(int cycle_num, int64_t now_ms);

    const SetupRecorder& recorder() const { return recorder_; }

private:
    CycleOptions options_;
    std::shared_ptr<CandleSource> source_;
    std::shared_ptr<RecordStore> store_;
    std::shared_ptr<AlertSink> alerts_;
    SetupRecorder recorder_;
    FeatureEngine features_;
    SetupDetector detector_;
    DecisionEngine decisions_;
    PaperTradingEngine paper_;

    void analyse(const std::string& symbol, const std::string& timeframe, int64_t now_ms,
                 CycleStats& stats, std::vector<Decision>& all_decisions,
                 std::map<std::string, double>& last_closes);
    void run_paper_trading(const std::vector<Decision>& decisions,
                           const std::map<std::string, double>& last_closes,
                           int64_t now_ms, CycleStats& stats);
    PaperState load_paper_state(int64_t now_ms);
    void persist_paper_result(const PaperCycleResult& result, int64_t now_ms);

    void write_log(const LogEntry& entry);
};
