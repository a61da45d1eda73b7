#include "engine/preview_cache.hpp"

namespace dnmm {

PreviewCache::PreviewCache(PreviewConfig config) : config_(config) {}

uint64_t PreviewCache::age(const PreviewSnapshot& snap, uint64_t now) const {
    return now > snap.timestamp ? now - snap.timestamp : 0;
}

Result<SnapshotPtr> PreviewCache::read(const SnapshotPtr& current, uint64_t now) const {
    if (!current) {
        return Unexpected(ErrorCode::PreviewSnapshotStale);
    }
    if (config_.revert_on_stale_preview && age(*current, now) > config_.max_age_sec) {
        return Unexpected(ErrorCode::PreviewSnapshotStale);
    }
    return current;
}

Status PreviewCache::admit_refresh(const SnapshotPtr& current, uint64_t now) const {
    if (current && config_.snapshot_cooldown_sec > 0 &&
        age(*current, now) < config_.snapshot_cooldown_sec) {
        return Unexpected(ErrorCode::PreviewSnapshotCooldown);
    }
    return {};
}

SnapshotPtr PreviewCache::make(const FusedQuote& fused, Bps haircut_bps, const BlockTime& at) {
    return std::make_shared<const PreviewSnapshot>(PreviewSnapshot{
        .timestamp      = at.timestamp,
        .block          = at.block,
        .mid_used       = fused.mid_used,
        .sigma_bps      = fused.sigma_bps,
        .conf_bps       = fused.conf_bps,
        .divergence_bps = fused.delta_bps,
        .spread_bps     = fused.spread_bps,
        .has_spread     = fused.has_spread,
        .haircut_bps    = haircut_bps,
        .used_fallback  = fused.used_fallback,
    });
}

} // namespace dnmm
