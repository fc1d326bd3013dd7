#include "position_sizer.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <cmath>

PositionSizer::PositionSizer(double risk_fraction, double reward_multiple)
    : risk_fraction_(risk_fraction), reward_multiple_(reward_multiple) {
    if (!(risk_fraction_ > 0.0 && risk_fraction_ < 1.0)) {
        throw ComputationError(fmt::format("Risk fraction {} outside (0, 1)", risk_fraction_));
    }
    if (!(reward_multiple_ > 0.0)) {
        throw ComputationError(fmt::format("Reward multiple {} must be positive", reward_multiple_));
    }
}

SizedPosition PositionSizer::size(Direction direction, double equity, double entry, double stop) const {
    if (!(equity > 0.0)) {
        throw ComputationError(fmt::format("Equity {} must be positive", equity));
    }
    if (!(entry > 0.0) || !(stop > 0.0)) {
        throw ComputationError(fmt::format("Prices must be positive (entry {}, stop {})", entry, stop));
    }
    if (entry == stop) {
        throw InvalidStopError(fmt::format("Stop equals entry {}", entry));
    }
    if (direction == Direction::Long && stop > entry) {
        throw InvalidStopError(fmt::format("LONG stop {} above entry {}", stop, entry));
    }
    if (direction == Direction::Short && stop < entry) {
        throw InvalidStopError(fmt::format("SHORT stop {} below entry {}", stop, entry));
    }

    double distance = std::fabs(entry - stop);
    double target = direction == Direction::Long ? entry + reward_multiple_ * distance
                                                 : entry - reward_multiple_ * distance;
    if (!(target > 0.0)) {
        throw ComputationError(fmt::format("Target {} not positive for entry {}", target, entry));
    }

    SizedPosition sized;
    sized.direction = direction;
    sized.entry_price = entry;
    sized.risk_amount = equity * risk_fraction_;
    sized.size = sized.risk_amount / distance;
    sized.stop_price = stop;
    sized.target_price = target;
    return sized;
}
