#pragma once

#include "config/engine_config.hpp"
#include "math/fixed_point.hpp"

#include <cstdint>

namespace dnmm {

struct FeeState {
    Bps      last_fee_bps = 0;
    uint64_t last_block   = 0;

    bool operator==(const FeeState&) const = default;
};

// Direction of a trade relative to the inventory target.
enum class TiltDirection : uint8_t { Neutral, Worsens, Restores };

struct FeeInputs {
    Bps           conf_bps                = 0;
    Bps           inventory_deviation_bps = 0;
    TiltDirection tilt                    = TiltDirection::Neutral;
    Bps           spread_bps              = 0;
    bool          has_spread              = false;
    Bps           sigma_bps               = 0;
    uint256       trade_notional          = 0;   // quote native units
    Bps           haircut_bps             = 0;
    uint64_t      block                   = 0;
};

struct FeeBreakdown {
    Bps  conf_term    = 0;
    Bps  inv_term     = 0;   // after tilt
    Bps  size_term    = 0;
    Bps  lvr_term     = 0;
    Bps  haircut_term = 0;
    Bps  fresh_bps    = 0;   // clamp(base + terms, base, cap)
    Bps  carried_bps  = 0;   // decayed previous fee, 0 when nothing carries
    Bps  floor_bps    = 0;   // BBO floor, 0 when disabled
    Bps  fee_bps      = 0;   // persisted value
    bool tilt_applied = false;
    bool size_applied = false;
};

class FeeEngine {
public:
    FeeEngine(FeeConfig fee, InventoryConfig inventory, MakerConfig maker, FeatureFlags flags);

    FeeBreakdown compute(const FeeState& prev, const FeeInputs& in) const;

    // Fee state after a trade settles at `fee_bps` in `block`.
    FeeState settle(const FeeBreakdown& breakdown, uint64_t block) const;

    // Previous fee decayed toward base for the ticks elapsed up to `block`.
    Bps decayed_fee(const FeeState& prev, uint64_t block) const;

    // Rebate applied after floor and cap; never below max(base, min(floor, cap)).
    Bps apply_rebate(const FeeBreakdown& breakdown, Bps rebate_bps) const;

    Bps conf_term(Bps conf_bps) const;
    Bps inventory_term(const FeeInputs& in, bool& tilt_applied) const;
    Bps size_term(const uint256& trade_notional) const;
    Bps lvr_term(Bps sigma_bps) const;
    Bps bbo_floor(Bps spread_bps, bool has_spread) const;

    const FeeConfig& config() const { return fee_; }

private:
    FeeConfig       fee_;
    InventoryConfig inventory_;
    MakerConfig     maker_;
    FeatureFlags    flags_;
};

} // namespace dnmm
