#pragma once

#include "types.hpp"
#include "position_sizer.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Latest price for a symbol, nullopt when unknown.
using PriceLookup = std::function<std::optional<double>(const std::string& symbol)>;

struct PaperCycleResult {
    PaperState state;
    std::optional<Position> opened;
    std::optional<ClosedTrade> closed;
    bool water_marks_changed = false;
};

// Single-slot paper ledger. State goes in, the next state comes out; nothing
// is kept between calls.
class PaperTradingEngine {
public:
    explicit PaperTradingEngine(const PositionSizer& sizer = PositionSizer());

    // Monitor the open position, then try to fill an empty slot from the
    // forming decisions. Any fault surfaces as SimulationError.
    PaperCycleResult run_cycle(const PaperState& state,
                               const std::vector<Decision>& decisions,
                               const PriceLookup& price_lookup,
                               int64_t now_ms) const;

    PaperCycleResult close_position(const PaperState& state, double exit_price,
                                    int64_t now_ms, ExitReason reason = ExitReason::Manual) const;

    static Account new_account(double initial_capital, int64_t now_ms);

    static std::optional<ExitReason> exit_trigger(const Position& position, double price);
    static bool update_water_marks(Position& position, double price);
    static ClosedTrade settle(const Position& position, double exit_price,
                              int64_t now_ms, ExitReason reason);

    const PositionSizer& sizer() const { return sizer_; }

private:
    PositionSizer sizer_;

    void validate(const PaperState& state) const;
    void apply_close(PaperCycleResult& result, double exit_price,
                     int64_t now_ms, ExitReason reason) const;
    std::optional<Position> select_and_open(const Account& account,
                                            const std::vector<Decision>& decisions,
                                            const std::string& excluded_symbol,
                                            int64_t now_ms) const;
};
