#pragma once

#include "types.hpp"

struct SizedPosition {
    Direction direction = Direction::Long;
    double entry_price = 0.0;
    double size = 0.0;
    double stop_price = 0.0;
    double target_price = 0.0;
    double risk_amount = 0.0;
};

// Fixed-fractional sizing: a stop-out loses risk_fraction of equity.
class PositionSizer {
public:
    explicit PositionSizer(double risk_fraction = 0.01, double reward_multiple = 2.0);

    // Throws InvalidStopError when the stop is missing or on the wrong side,
    // ComputationError for any other unusable input.
    SizedPosition size(Direction direction, double equity, double entry, double stop) const;

    double risk_fraction() const { return risk_fraction_; }
    double reward_multiple() const { return reward_multiple_; }

private:
    double risk_fraction_;
    double reward_multiple_;
};
