#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "risk/inventory_engine.hpp"

namespace dnmm {

// Emergency quoting: instead of rejecting a request that fails a gate, or
// one that would drain a leg sitting just above its floor, quote a small
// clamped amount at a configured emergency spread.
class AomqPlanner {
public:
    AomqPlanner(AomqConfig aomq, FeeConfig fee, FeatureFlags flags);

    bool enabled() const;

    // Gate failures that may be answered with an emergency quote.
    static bool routes_gate_failure(ErrorCode code);

    // Paying out `projected_out` would leave the leg within floor_epsilon_bps
    // of the reserve above its floor. An empty reserve is always near floor.
    bool near_floor(const uint256& reserve, const uint256& headroom, const uint256& projected_out) const;

    // max(fee, emergency spread), capped.
    Bps emergency_fee(Bps fee_bps) const;

    // Largest input worth at most min_quote_notional.
    uint256 clamp_amount_in(const uint256& amount_in,
                            bool is_base_in,
                            const uint256& mid,
                            const InventoryEngine& inventory) const;

private:
    AomqConfig   aomq_;
    FeeConfig    fee_;
    FeatureFlags flags_;
};

} // namespace dnmm
