#include "risk/recenter_controller.hpp"

namespace dnmm {

RecenterController::RecenterController(InventoryConfig config, const InventoryEngine& inventory)
    : config_(config), inventory_(inventory) {}

Bps RecenterController::deviation_bps(const InventoryState& s, const uint256& mid) const {
    if (s.last_rebalance_price == 0) return kBps;
    return fp::to_bps(fp::abs_diff(mid, s.last_rebalance_price), s.last_rebalance_price);
}

bool RecenterController::threshold_met(Bps deviation_bps) const {
    return deviation_bps >= config_.recenter_threshold_pct * 100;
}

bool RecenterController::cooldown_elapsed(const InventoryState& s, uint64_t now) const {
    return now >= s.last_rebalance_at + config_.recenter_cooldown_sec;
}

RecenterOutcome RecenterController::commit(const InventoryState& inv,
                                           const RecenterState& rs,
                                           const uint256& mid,
                                           Bps deviation,
                                           uint64_t now) const {
    RecenterOutcome out{.inventory = inv, .recenter = rs, .committed = true, .deviation_bps = deviation};
    out.inventory.target_base_star     = inventory_.balanced_target(inv, mid);
    out.inventory.last_rebalance_price = mid;
    out.inventory.last_rebalance_at    = now;
    out.recenter.armed          = config_.recenter_healthy_required == 0;
    out.recenter.healthy_streak = 0;
    ++out.recenter.commits;
    return out;
}

RecenterOutcome RecenterController::step(const InventoryState& inv,
                                         const RecenterState& rs,
                                         const FusedQuote& fused,
                                         uint64_t now) const {
    RecenterOutcome out{.inventory = inv, .recenter = rs};
    if (fused.used_fallback || fused.mid_used == 0) {
        return out;
    }

    const Bps deviation = deviation_bps(inv, fused.mid_used);
    out.deviation_bps = deviation;

    if (!rs.armed) {
        out.recenter = observe(inv, rs, fused);
        return out;
    }

    if (threshold_met(deviation) && cooldown_elapsed(inv, now)) {
        return commit(inv, rs, fused.mid_used, deviation, now);
    }
    return out;
}

RecenterState RecenterController::observe(const InventoryState& inv,
                                          const RecenterState& rs,
                                          const FusedQuote& fused) const {
    RecenterState next = rs;
    if (rs.armed || fused.used_fallback || fused.mid_used == 0) {
        return next;
    }
    if (threshold_met(deviation_bps(inv, fused.mid_used))) {
        next.healthy_streak = 0;
        return next;
    }
    ++next.healthy_streak;
    if (next.healthy_streak >= config_.recenter_healthy_required) {
        next.armed = true;
        next.healthy_streak = 0;
    }
    return next;
}

Result<RecenterOutcome> RecenterController::manual(const InventoryState& inv,
                                                   const RecenterState& rs,
                                                   const FusedQuote& fused,
                                                   uint64_t now) const {
    if (fused.used_fallback || fused.mid_used == 0) {
        return Unexpected(ErrorCode::OracleStale);
    }
    const Bps deviation = deviation_bps(inv, fused.mid_used);
    if (!threshold_met(deviation)) {
        return Unexpected(ErrorCode::RecenterThreshold);
    }
    if (!cooldown_elapsed(inv, now) || !rs.armed) {
        return Unexpected(ErrorCode::RecenterCooldown);
    }
    return commit(inv, rs, fused.mid_used, deviation, now);
}

} // namespace dnmm
