#pragma once

#include <cmath>
#include <stdexcept>

// All costs are percentages of the fill price, so they subtract directly
// from a trade's percentage P&L.
struct ExecutionCosts {
    double fee_pct_per_side = 0.0;       // exchange taker fee
    double slippage_pct_per_side = 0.0;

    double per_side_cost_pct() const {
        return fee_pct_per_side + slippage_pct_per_side;
    }

    // Round-trip cost: entry side + exit side.
    double round_trip_cost_pct() const {
        return 2.0 * per_side_cost_pct();
    }

    void validate() const {
        if (!std::isfinite(fee_pct_per_side) || fee_pct_per_side < 0.0) {
            throw std::invalid_argument("ExecutionCosts: fee_pct_per_side must be >= 0");
        }
        if (!std::isfinite(slippage_pct_per_side) || slippage_pct_per_side < 0.0) {
            throw std::invalid_argument("ExecutionCosts: slippage_pct_per_side must be >= 0");
        }
    }
};
