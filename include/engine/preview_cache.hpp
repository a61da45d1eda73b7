#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "oracle/oracle_types.hpp"

#include <memory>

namespace dnmm {

// Oracle-derived inputs captured by an explicit refresh. Immutable once
// published; previews read it through a shared pointer.
struct PreviewSnapshot {
    uint64_t timestamp      = 0;
    uint64_t block          = 0;
    uint256  mid_used       = 0;
    Bps      sigma_bps      = 0;
    Bps      conf_bps       = 0;
    Bps      divergence_bps = 0;
    Bps      spread_bps     = 0;
    bool     has_spread     = false;
    Bps      haircut_bps    = 0;
    bool     used_fallback  = false;

    bool operator==(const PreviewSnapshot&) const = default;
};

using SnapshotPtr = std::shared_ptr<const PreviewSnapshot>;

class PreviewCache {
public:
    explicit PreviewCache(PreviewConfig config);

    // The snapshot previews may use at `now`. PreviewSnapshotStale when none
    // exists, or when it is older than max_age_sec and stale previews revert.
    Result<SnapshotPtr> read(const SnapshotPtr& current, uint64_t now) const;

    // PreviewSnapshotCooldown while the previous snapshot is younger than the
    // refresh cooldown.
    Status admit_refresh(const SnapshotPtr& current, uint64_t now) const;

    static SnapshotPtr make(const FusedQuote& fused, Bps haircut_bps, const BlockTime& at);

    uint64_t age(const PreviewSnapshot& snap, uint64_t now) const;

private:
    PreviewConfig config_;
};

} // namespace dnmm
