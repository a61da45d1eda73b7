#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "oracle/oracle_types.hpp"

namespace dnmm {

struct FusionOutcome {
    FusedQuote  quote;
    OracleState next_state;
};

class OracleFusion {
public:
    OracleFusion(OracleConfig config, FeatureFlags flags);

    // Picks the mid (primary, then EMA, then secondary), measures the
    // disagreement with the secondary source and blends confidence.
    // A consulted source that reports an error fails the call.
    Result<FusionOutcome> fuse(const OracleReadings& readings,
                               OracleMode mode,
                               const OracleState& prev,
                               uint64_t block) const;

    // Strict mode rejects once the uncapped blend exceeds its cap.
    Status enforce_confidence_cap(const FusedQuote& fused, OracleMode mode) const;

    // |a - b| * 10000 / min(a, b)
    static Bps delta_bps(const uint256& a, const uint256& b);

    OracleState advance_sigma(const OracleState& prev, const uint256& mid, uint64_t block) const;

private:
    bool fresh(const OracleSample& s, uint64_t max_age) const;
    uint64_t secondary_max_age(OracleMode mode) const;
    Bps conf_cap(OracleMode mode) const;

    OracleConfig config_;
    FeatureFlags flags_;
};

} // namespace dnmm
