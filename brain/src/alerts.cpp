#include "alerts.hpp"
#include "util.hpp"
#include <fmt/format.h>

nlohmann::json decision_details(const Decision& decision) {
    const auto& c = decision.candidate;
    return {
        {"setup_id", c.setup_id()},
        {"setup_type", c.setup_type},
        {"direction", to_string(c.direction)},
        {"detector_confidence", to_string(c.confidence)},
        {"context", c.context},
        {"entry_price", c.entry_price},
        {"stop_price", c.stop_price},
        {"score", decision.score},
        {"status", to_string(decision.status)},
        {"confidence", to_string(decision.confidence)},
        {"fired", decision.fired},
        {"justification", decision.justification}
    };
}

nlohmann::json position_json(const Position& p) {
    return {
        {"symbol", p.symbol},
        {"timeframe", p.timeframe},
        {"direction", to_string(p.direction)},
        {"entry_price", p.entry_price},
        {"position_size", p.size},
        {"stop_loss", p.stop_price},
        {"take_profit", p.target_price},
        {"risk_amount", p.risk_amount},
        {"equity_at_open", p.equity_at_open},
        {"opened_at", util::to_iso8601(p.opened_at_ms)},
        {"setup_id", p.setup_id},
        {"high_water_mark", p.high_water_mark},
        {"low_water_mark", p.low_water_mark}
    };
}

nlohmann::json account_json(const Account& a) {
    return {
        {"equity", a.equity},
        {"initial_capital", a.initial_capital},
        {"total_trades", a.total_trades},
        {"winning_trades", a.winning_trades},
        {"losing_trades", a.losing_trades},
        {"updated_at", util::to_iso8601(a.updated_at_ms)}
    };
}

nlohmann::json build_setup_alert(const Decision& decision, int64_t now_ms) {
    const auto& c = decision.candidate;
    std::string severity = decision.confidence == Confidence::High ? "high" : "medium";

    return {
        {"type", "setup_forming"},
        {"severity", severity},
        {"symbol", c.symbol},
        {"timeframe", c.timeframe},
        {"setup_type", c.setup_type},
        {"direction", to_string(c.direction)},
        {"price", c.entry_price},
        {"confidence", decision.score},
        {"lines", {c.context, decision.justification}},
        {"plan", fmt::format("{} from {:.4f}, stop {:.4f}", to_string(c.direction),
                             c.entry_price, c.stop_price)},
        {"ts", util::to_iso8601(now_ms)}
    };
}

nlohmann::json build_trade_opened_alert(const Position& p, int64_t now_ms) {
    return {
        {"type", "paper_trade_opened"},
        {"severity", "info"},
        {"symbol", p.symbol},
        {"price", p.entry_price},
        {"lines", {
            fmt::format("{} {} size {:.6f}", to_string(p.direction), p.setup_id, p.size),
            fmt::format("Risk {:.2f} of equity {:.2f}", p.risk_amount, p.equity_at_open)
        }},
        {"plan", fmt::format("stop {:.4f}, target {:.4f}", p.stop_price, p.target_price)},
        {"ts", util::to_iso8601(now_ms)}
    };
}

nlohmann::json build_trade_closed_alert(const ClosedTrade& t, const Account& account, int64_t now_ms) {
    const auto& p = t.position;
    return {
        {"type", "paper_trade_closed"},
        {"severity", t.pnl > 0.0 ? "win" : "loss"},
        {"symbol", p.symbol},
        {"price", t.exit_price},
        {"exit_reason", to_string(t.exit_reason)},
        {"pnl", t.pnl},
        {"pnl_percent", t.pnl_percent},
        {"lines", {
            fmt::format("{} {} closed on {} after {} min", to_string(p.direction), p.setup_id,
                        to_string(t.exit_reason), t.duration_minutes),
            fmt::format("P&L {:.2f} ({:+.2f}%), MFE {:+.2f}%, MAE {:+.2f}%",
                        t.pnl, t.pnl_percent, t.mfe_percent, t.mae_percent),
            fmt::format("Equity {:.2f} ({}W / {}L)", account.equity,
                        account.winning_trades, account.losing_trades)
        }},
        {"ts", util::to_iso8601(now_ms)}
    };
}
