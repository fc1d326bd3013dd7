#include "brain_cycle.hpp"
#include "alerts.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

nlohmann::json CycleStats::to_json() const {
    return {
        {"cycle", cycle_num},
        {"started_at", util::to_iso8601(started_ms)},
        {"duration_ms", duration_ms},
        {"analysed", analysed},
        {"skipped", skipped},
        {"setups_detected", setups_detected},
        {"forming", forming},
        {"rejected", rejected},
        {"setups_created", setups_created},
        {"setups_updated", setups_updated},
        {"setups_skipped", setups_skipped},
        {"setups_failed", setups_failed},
        {"paper_status", paper_status}
    };
}

BrainCycle::BrainCycle(const CycleOptions& options,
                       std::shared_ptr<CandleSource> source,
                       std::shared_ptr<RecordStore> store,
                       std::shared_ptr<AlertSink> alerts,
                       SetupRecorder recorder,
                       const FeatureEngine& features,
                       const SetupDetector& detector,
                       const DecisionEngine& decisions,
                       const PaperTradingEngine& paper)
    : options_(options)
    , source_(std::move(source))
    , store_(std::move(store))
    , alerts_(std::move(alerts))
    , recorder_(std::move(recorder))
    , features_(features)
    , detector_(detector)
    , decisions_(decisions)
    , paper_(paper) {}

void BrainCycle::write_log(const LogEntry& entry) {
    try {
        store_->write_log(entry);
    } catch (const PersistenceError& e) {
        spdlog::error("Failed to write {} log for {} {}: {}",
                      entry.log_type, entry.symbol, entry.timeframe, e.what());
    }
}

void BrainCycle::analyse(const std::string& symbol, const std::string& timeframe, int64_t now_ms,
                         CycleStats& stats, std::vector<Decision>& all_decisions,
                         std::map<std::string, double>& last_closes) {
    std::vector<Candle> candles;
    try {
        candles = source_->fetch_candles(symbol, timeframe, options_.ohlc_limit);
    } catch (const std::exception& e) {
        spdlog::warn("Skipping {} {}: candle fetch failed: {}", symbol, timeframe, e.what());
        stats.skipped++;

        LogEntry entry;
        entry.log_type = "error";
        entry.symbol = symbol;
        entry.timeframe = timeframe;
        entry.message = fmt::format("candle fetch failed: {}", e.what());
        entry.ts_ms = now_ms;
        write_log(entry);
        return;
    }

    if (candles.empty()) {
        spdlog::warn("Skipping {} {}: no candles returned", symbol, timeframe);
        stats.skipped++;
        return;
    }

    FeatureSet fs;
    try {
        fs = features_.compute(symbol, timeframe, candles);
    } catch (const DataError& e) {
        spdlog::warn("Skipping {} {}: {}", symbol, timeframe, e.what());
        stats.skipped++;
        return;
    }

    stats.analysed++;
    last_closes[symbol] = fs.last_close;
    spdlog::debug("{} {}: close={:.4f} vol={:.2f}% ratio={:.2f} strength={} dist_fast={:+.2f}%",
                  symbol, timeframe, fs.last_close, fs.volatility, fs.volatility_ratio,
                  fs.trend_strength, fs.dist_fast_pct);

    auto candidates = detector_.detect(fs);
    stats.setups_detected += static_cast<int>(candidates.size());

    for (auto& decision : decisions_.decide_all(candidates, fs)) {
        const auto& c = decision.candidate;
        if (decision.is_forming()) {
            stats.forming++;
            spdlog::info("FORMING {} [{} {}] {}", c.setup_id(), decision.score,
                         to_string(decision.confidence), decision.justification);
        } else {
            stats.rejected++;
            spdlog::info("REJECT {} [{}] {}", c.setup_id(), decision.score, decision.justification);
        }

        LogEntry entry;
        entry.log_type = "decision";
        entry.symbol = c.symbol;
        entry.timeframe = c.timeframe;
        entry.message = decision.justification;
        entry.details = decision_details(decision);
        entry.ts_ms = now_ms;
        write_log(entry);

        if (decision.is_forming()) {
            alerts_->publish(build_setup_alert(decision, now_ms));
        }
        all_decisions.push_back(std::move(decision));
    }
}

PaperState BrainCycle::load_paper_state(int64_t now_ms) {
    PaperState state;

    auto account = store_->load_account();
    if (account) {
        state.account = *account;
    } else {
        state.account = PaperTradingEngine::new_account(options_.paper_initial_capital, now_ms);
        store_->create_account(state.account);
        spdlog::info("Paper account created with {:.2f}", state.account.initial_capital);
    }

    state.position = store_->load_open_trade();
    return state;
}

void BrainCycle::persist_paper_result(const PaperCycleResult& result, int64_t now_ms) {
    if (result.closed) {
        store_->record_close(*result.closed, result.state.account);
        alerts_->publish(build_trade_closed_alert(*result.closed, result.state.account, now_ms));

        LogEntry entry;
        entry.log_type = "paper";
        entry.symbol = result.closed->position.symbol;
        entry.timeframe = result.closed->position.timeframe;
        entry.message = fmt::format("closed {} on {} pnl {:.2f}", result.closed->position.setup_id,
                                    to_string(result.closed->exit_reason), result.closed->pnl);
        entry.details = account_json(result.state.account);
        entry.ts_ms = now_ms;
        write_log(entry);
    }

    if (result.opened) {
        store_->save_open_trade(*result.opened);
        alerts_->publish(build_trade_opened_alert(*result.opened, now_ms));

        LogEntry entry;
        entry.log_type = "paper";
        entry.symbol = result.opened->symbol;
        entry.timeframe = result.opened->timeframe;
        entry.message = fmt::format("opened {}", result.opened->setup_id);
        entry.details = position_json(*result.opened);
        entry.ts_ms = now_ms;
        write_log(entry);
    } else if (result.water_marks_changed && result.state.position) {
        store_->update_water_marks(*result.state.position);
    }
}

void BrainCycle::run_paper_trading(const std::vector<Decision>& decisions,
                                   const std::map<std::string, double>& last_closes,
                                   int64_t now_ms, CycleStats& stats) {
    try {
        auto state = load_paper_state(now_ms);

        PriceLookup lookup = [this, &last_closes](const std::string& symbol) -> std::optional<double> {
            auto it = last_closes.find(symbol);
            if (it != last_closes.end()) {
                return it->second;
            }
            return source_->latest_price(symbol);
        };

        auto result = paper_.run_cycle(state, decisions, lookup, now_ms);
        persist_paper_result(result, now_ms);

        if (result.closed && result.opened) {
            stats.paper_status = "closed+opened";
        } else if (result.closed) {
            stats.paper_status = "closed";
        } else if (result.opened) {
            stats.paper_status = "opened";
        } else if (result.state.position) {
            stats.paper_status = "holding";
        } else {
            stats.paper_status = "flat";
        }
    } catch (const std::exception& e) {
        stats.paper_status = "error";
        spdlog::error("Paper trading failed (non-fatal): {}", e.what());

        LogEntry entry;
        entry.log_type = "error";
        entry.message = fmt::format("paper trading failed: {}", e.what());
        entry.ts_ms = now_ms;
        write_log(entry);
    }
}

CycleStats BrainCycle::run(int cycle_num, int64_t now_ms) {
    auto wall_start = util::current_timestamp_ms();

    CycleStats stats;
    stats.cycle_num = cycle_num;
    stats.started_ms = now_ms;

    spdlog::info("Cycle {} starting: {} symbols x {} timeframes", cycle_num,
                 options_.symbols.size(), options_.timeframes.size());

    source_->begin_cycle();

    std::vector<Decision> all_decisions;
    std::map<std::string, double> last_closes;

    for (const auto& symbol : options_.symbols) {
        for (const auto& timeframe : options_.timeframes) {
            analyse(symbol, timeframe, now_ms, stats, all_decisions, last_closes);
        }
    }

    std::vector<SetupCandidate> forming;
    for (const auto& d : all_decisions) {
        if (d.is_forming()) {
            forming.push_back(d.candidate);
        }
    }

    try {
        auto summary = recorder_.record(forming, *store_, now_ms);
        stats.setups_created = summary.created;
        stats.setups_updated = summary.updated;
        stats.setups_skipped = summary.skipped;
        stats.setups_failed = summary.failed;
    } catch (const std::exception& e) {
        spdlog::error("Setup recording failed: {}", e.what());
    }

    if (options_.paper_trading_enabled) {
        run_paper_trading(all_decisions, last_closes, now_ms, stats);
    }

    stats.duration_ms = util::current_timestamp_ms() - wall_start;

    LogEntry entry;
    entry.log_type = "scan";
    entry.message = fmt::format("cycle {}: {} analysed, {} skipped, {} setups ({} forming, {} rejected)",
                                cycle_num, stats.analysed, stats.skipped, stats.setups_detected,
                                stats.forming, stats.rejected);
    entry.details = stats.to_json();
    entry.ts_ms = now_ms;
    write_log(entry);

    spdlog::info("Cycle {} complete in {} ms: {} analysed, {} skipped, {} forming, {} rejected, "
                 "setups {}c/{}u/{}s, paper {}",
                 cycle_num, stats.duration_ms, stats.analysed, stats.skipped, stats.forming,
                 stats.rejected, stats.setups_created, stats.setups_updated, stats.setups_skipped,
                 stats.paper_status);
    return stats;
}
