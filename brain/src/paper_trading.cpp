#include "paper_trading.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

PaperTradingEngine::PaperTradingEngine(const PositionSizer& sizer) : sizer_(sizer) {}

Account PaperTradingEngine::new_account(double initial_capital, int64_t now_ms) {
    Account account;
    account.equity = initial_capital;
    account.initial_capital = initial_capital;
    account.updated_at_ms = now_ms;
    return account;
}

std::optional<ExitReason> PaperTradingEngine::exit_trigger(const Position& position, double price) {
    // Stop wins if a single price crosses both levels
    if (position.direction == Direction::Long) {
        if (price <= position.stop_price) return ExitReason::Stop;
        if (price >= position.target_price) return ExitReason::Target;
    } else {
        if (price >= position.stop_price) return ExitReason::Stop;
        if (price <= position.target_price) return ExitReason::Target;
    }
    return std::nullopt;
}

bool PaperTradingEngine::update_water_marks(Position& position, double price) {
    bool changed = false;
    if (price > position.high_water_mark) {
        position.high_water_mark = price;
        changed = true;
    }
    if (price < position.low_water_mark) {
        position.low_water_mark = price;
        changed = true;
    }
    return changed;
}

ClosedTrade PaperTradingEngine::settle(const Position& position, double exit_price,
                                       int64_t now_ms, ExitReason reason) {
    ClosedTrade trade;
    trade.position = position;
    update_water_marks(trade.position, exit_price);

    const auto& p = trade.position;
    double move = p.direction == Direction::Long ? exit_price - p.entry_price
                                                 : p.entry_price - exit_price;

    trade.exit_price = exit_price;
    trade.closed_at_ms = now_ms;
    trade.pnl = move * p.size;
    trade.pnl_percent = move / p.entry_price * 100.0;
    trade.exit_reason = reason;
    trade.duration_minutes = std::max<int64_t>(0, (now_ms - p.opened_at_ms) / 60000);

    if (p.direction == Direction::Long) {
        trade.mfe_percent = (p.high_water_mark - p.entry_price) / p.entry_price * 100.0;
        trade.mae_percent = (p.low_water_mark - p.entry_price) / p.entry_price * 100.0;
    } else {
        trade.mfe_percent = (p.entry_price - p.low_water_mark) / p.entry_price * 100.0;
        trade.mae_percent = (p.entry_price - p.high_water_mark) / p.entry_price * 100.0;
    }
    return trade;
}

void PaperTradingEngine::validate(const PaperState& state) const {
    if (!std::isfinite(state.account.equity)) {
        throw SimulationError("Account equity is not a finite number");
    }
    if (state.position) {
        const auto& p = *state.position;
        if (!(p.entry_price > 0.0) || !(p.size > 0.0) || !std::isfinite(p.stop_price) ||
            !std::isfinite(p.target_price)) {
            throw SimulationError("Open position " + p.setup_id + " has unusable levels");
        }
    }
}

void PaperTradingEngine::apply_close(PaperCycleResult& result, double exit_price,
                                     int64_t now_ms, ExitReason reason) const {
    auto trade = settle(*result.state.position, exit_price, now_ms, reason);

    auto& account = result.state.account;
    account.total_trades++;
    if (trade.pnl > 0.0) {
        account.winning_trades++;
    } else {
        account.losing_trades++;
    }
    account.equity += trade.pnl;
    account.updated_at_ms = now_ms;

    spdlog::info("Paper trade closed: {} {} {} @ {:.4f} pnl={:.2f} ({:+.2f}%) equity={:.2f}",
                 trade.position.symbol, to_string(trade.position.direction), to_string(reason),
                 exit_price, trade.pnl, trade.pnl_percent, account.equity);

    result.state.position.reset();
    result.closed = std::move(trade);
}

std::optional<Position> PaperTradingEngine::select_and_open(const Account& account,
                                                            const std::vector<Decision>& decisions,
                                                            const std::string& excluded_symbol,
                                                            int64_t now_ms) const {
    std::vector<const Decision*> ranked;
    for (const auto& d : decisions) {
        if (d.is_forming() && d.candidate.symbol != excluded_symbol) {
            ranked.push_back(&d);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const Decision* a, const Decision* b) {
        return a->score > b->score;
    });

    for (const auto* d : ranked) {
        const auto& c = d->candidate;
        try {
            auto sized = sizer_.size(c.direction, account.equity, c.entry_price, c.stop_price);

            Position pos;
            pos.symbol = c.symbol;
            pos.timeframe = c.timeframe;
            pos.direction = c.direction;
            pos.entry_price = sized.entry_price;
            pos.size = sized.size;
            pos.stop_price = sized.stop_price;
            pos.target_price = sized.target_price;
            pos.risk_amount = sized.risk_amount;
            pos.equity_at_open = account.equity;
            pos.opened_at_ms = now_ms;
            pos.setup_id = c.setup_id();
            pos.high_water_mark = sized.entry_price;
            pos.low_water_mark = sized.entry_price;

            spdlog::info("Paper trade opened: {} {} size={:.6f} entry={:.4f} stop={:.4f} target={:.4f} (score {})",
                         pos.setup_id, to_string(pos.direction), pos.size, pos.entry_price,
                         pos.stop_price, pos.target_price, d->score);
            return pos;
        } catch (const ComputationError& e) {
            spdlog::warn("Paper trading rejected {}: {}", c.setup_id(), e.what());
        }
    }
    return std::nullopt;
}

PaperCycleResult PaperTradingEngine::run_cycle(const PaperState& state,
                                               const std::vector<Decision>& decisions,
                                               const PriceLookup& price_lookup,
                                               int64_t now_ms) const {
    try {
        validate(state);

        PaperCycleResult result;
        result.state = state;
        std::string closed_symbol;

        if (result.state.position) {
            auto& pos = *result.state.position;
            auto price = price_lookup(pos.symbol);

            if (!price || !(*price > 0.0) || !std::isfinite(*price)) {
                spdlog::warn("No price for open paper position {}, keeping it open", pos.symbol);
            } else if (auto reason = exit_trigger(pos, *price)) {
                closed_symbol = pos.symbol;
                apply_close(result, *price, now_ms, *reason);
            } else {
                result.water_marks_changed = update_water_marks(pos, *price);
                spdlog::debug("Paper position {} @ {:.4f} (hwm {:.4f}, lwm {:.4f})",
                              pos.symbol, *price, pos.high_water_mark, pos.low_water_mark);
            }
        }

        if (!result.state.position) {
            auto opened = select_and_open(result.state.account, decisions, closed_symbol, now_ms);
            if (opened) {
                result.state.position = opened;
                result.opened = std::move(opened);
            }
        }

        return result;
    } catch (const SimulationError&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationError(std::string("Paper trading cycle failed: ") + e.what());
    }
}

PaperCycleResult PaperTradingEngine::close_position(const PaperState& state, double exit_price,
                                                    int64_t now_ms, ExitReason reason) const {
    try {
        validate(state);
        if (!state.position) {
            throw SimulationError("No open paper position to close");
        }
        if (!(exit_price > 0.0)) {
            throw SimulationError("Exit price must be positive");
        }

        PaperCycleResult result;
        result.state = state;
        apply_close(result, exit_price, now_ms, reason);
        return result;
    } catch (const SimulationError&) {
        throw;
    } catch (const std::exception& e) {
        throw SimulationError(std::string("Paper close failed: ") + e.what());
    }
}
