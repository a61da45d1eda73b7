#include "oracle/divergence_gate.hpp"

namespace dnmm {

DivergenceGate::DivergenceGate(OracleConfig config, FeatureFlags flags)
    : config_(config), flags_(flags) {}

Bps DivergenceGate::haircut_for(Bps delta_bps) const {
    if (delta_bps <= config_.divergence_accept_bps) return 0;
    uint256 over = delta_bps - config_.divergence_accept_bps;
    uint256 haircut = uint256(config_.haircut_min_bps) + uint256(config_.haircut_slope_bps) * over;
    return fp::saturate_bps(haircut);
}

DivergenceState DivergenceGate::observe(const DivergenceState& prev, Bps delta_bps) const {
    DivergenceState next = prev;
    next.last_delta_bps = delta_bps;

    if (delta_bps > config_.divergence_accept_bps) {
        next.active = true;
        next.healthy_streak = 0;
        return next;
    }
    if (!prev.active) {
        next.healthy_streak = 0;
        return next;
    }
    ++next.healthy_streak;
    if (next.healthy_streak >= config_.divergence_healthy_required) {
        next.active = false;
        next.healthy_streak = 0;
    }
    return next;
}

Result<DivergenceOutcome> DivergenceGate::evaluate(const DivergenceState& prev,
                                                   const FusedQuote& fused) const {
    // No comparison possible: the primary is trusted outright.
    if (!fused.divergence_checkable) {
        return DivergenceOutcome{.next = prev, .haircut_bps = 0};
    }

    const Bps delta = fused.delta_bps;

    if (!flags_.enable_soft_divergence) {
        if (delta > config_.divergence_bps) {
            return Unexpected(ErrorCode::OracleDiverged);
        }
        DivergenceState next = prev;
        next.last_delta_bps = delta;
        return DivergenceOutcome{.next = next, .haircut_bps = 0};
    }

    if (delta >= config_.divergence_hard_bps) {
        return Unexpected(ErrorCode::OracleDiverged);
    }
    return DivergenceOutcome{.next = observe(prev, delta), .haircut_bps = haircut_for(delta)};
}

} // namespace dnmm
