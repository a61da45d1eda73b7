#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "oracle/oracle_types.hpp"
#include "risk/inventory_engine.hpp"

#include <cstdint>

namespace dnmm {

struct RecenterState {
    bool     armed          = true;
    uint32_t healthy_streak = 0;
    uint64_t commits        = 0;

    bool operator==(const RecenterState&) const = default;
};

struct RecenterOutcome {
    InventoryState inventory;
    RecenterState  recenter;
    bool           committed     = false;
    Bps            deviation_bps = 0;
};

// Idle -> Eligible (price moved past the threshold, cooldown elapsed, armed)
// -> Committed (target reset to a 50/50 value split at the mid) -> Idle.
// A commit disarms the controller until enough healthy observations
// have been seen. Every healthy swap is an observation, whether or not
// automatic commits are enabled.
class RecenterController {
public:
    RecenterController(InventoryConfig config, const InventoryEngine& inventory);

    // Price move since the last recenter, in bps. A zero reference price
    // counts as fully deviated.
    Bps deviation_bps(const InventoryState& s, const uint256& mid) const;

    bool threshold_met(Bps deviation_bps) const;
    bool cooldown_elapsed(const InventoryState& s, uint64_t now) const;

    // Automatic trigger, evaluated after each swap. Never fails.
    RecenterOutcome step(const InventoryState& inv,
                         const RecenterState& rs,
                         const FusedQuote& fused,
                         uint64_t now) const;

    // Counts one observation toward re-arming. A disarmed controller re-arms
    // after recenter_healthy_required consecutive mids back under the
    // threshold. Fallback mids are not observations.
    RecenterState observe(const InventoryState& inv,
                          const RecenterState& rs,
                          const FusedQuote& fused) const;

    // Permissionless trigger. Leaves nothing changed on failure.
    Result<RecenterOutcome> manual(const InventoryState& inv,
                                   const RecenterState& rs,
                                   const FusedQuote& fused,
                                   uint64_t now) const;

private:
    RecenterOutcome commit(const InventoryState& inv,
                           const RecenterState& rs,
                           const uint256& mid,
                           Bps deviation,
                           uint64_t now) const;

    InventoryConfig        config_;
    const InventoryEngine& inventory_;
};

} // namespace dnmm
