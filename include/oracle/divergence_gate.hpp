#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "oracle/oracle_types.hpp"

#include <cstdint>

namespace dnmm {

struct DivergenceState {
    bool    active         = false;
    Bps     last_delta_bps = 0;
    uint8_t healthy_streak = 0;

    bool operator==(const DivergenceState&) const = default;
};

struct DivergenceOutcome {
    DivergenceState next;
    Bps             haircut_bps = 0;
};

// Bands over the primary/secondary disagreement:
//   delta <= accept          healthy, counts toward clearing `active`
//   accept < delta < hard    haircut = min + slope * (delta - accept)
//   delta >= hard            OracleDiverged
class DivergenceGate {
public:
    DivergenceGate(OracleConfig config, FeatureFlags flags);

    Result<DivergenceOutcome> evaluate(const DivergenceState& prev, const FusedQuote& fused) const;

    // Hysteresis transition for one checkable sample, rejected or not.
    DivergenceState observe(const DivergenceState& prev, Bps delta_bps) const;

    Bps haircut_for(Bps delta_bps) const;

private:
    OracleConfig config_;
    FeatureFlags flags_;
};

} // namespace dnmm
