#include "oracle/oracle_fusion.hpp"

#include <algorithm>

namespace dnmm {

OracleFusion::OracleFusion(OracleConfig config, FeatureFlags flags)
    : config_(config), flags_(flags) {}

Bps OracleFusion::delta_bps(const uint256& a, const uint256& b) {
    uint256 lo = a < b ? a : b;
    if (lo == 0) return kBps;
    return fp::saturate_bps(fp::mul_div(fp::abs_diff(a, b), kBps, lo));
}

bool OracleFusion::fresh(const OracleSample& s, uint64_t max_age) const {
    return s.status == OracleStatus::Ok && s.mid > 0 && s.age_sec <= max_age;
}

uint64_t OracleFusion::secondary_max_age(OracleMode mode) const {
    return mode == OracleMode::Strict ? config_.secondary_max_age_sec_strict
                                      : config_.secondary_max_age_sec;
}

Bps OracleFusion::conf_cap(OracleMode mode) const {
    return mode == OracleMode::Strict ? config_.conf_cap_bps_strict : config_.conf_cap_bps_spot;
}

OracleState OracleFusion::advance_sigma(const OracleState& prev, const uint256& mid, uint64_t block) const {
    if (prev.last_mid == 0) {
        return OracleState{.last_mid = mid, .sigma_bps = prev.sigma_bps, .last_block = block};
    }
    if (block <= prev.last_block) {
        return prev;
    }
    // sigma = (lambda * sigma + (1 - lambda) * |move|) per block
    uint256 move = fp::to_bps(fp::abs_diff(mid, prev.last_mid), prev.last_mid);
    uint256 lambda = config_.sigma_ewma_lambda_bps;
    uint256 blended = (lambda * prev.sigma_bps + (uint256(kBps) - lambda) * move) / kBps;
    return OracleState{.last_mid = mid, .sigma_bps = fp::saturate_bps(blended), .last_block = block};
}

Result<FusionOutcome> OracleFusion::fuse(const OracleReadings& readings,
                                         OracleMode mode,
                                         const OracleState& prev,
                                         uint64_t block) const {
    const OracleSample& primary = readings.primary;
    if (primary.status == OracleStatus::Error) {
        return Unexpected(ErrorCode::OracleReadFailed);
    }
    if (readings.secondary && readings.secondary->status == OracleStatus::Error) {
        return Unexpected(ErrorCode::OracleReadFailed);
    }

    const uint64_t sec_age = secondary_max_age(mode);
    const bool secondary_fresh = readings.secondary && fresh(*readings.secondary, sec_age);

    FusedQuote q;
    const OracleSample* used = nullptr;

    if (fresh(primary, config_.max_age_sec)) {
        used = &primary;
        q.source_reason = SourceReason::Primary;
    } else if (config_.allow_ema_fallback && readings.primary_ema) {
        if (readings.primary_ema->status == OracleStatus::Error) {
            return Unexpected(ErrorCode::OracleReadFailed);
        }
        if (fresh(*readings.primary_ema, config_.max_age_sec)) {
            used = &*readings.primary_ema;
            q.source_reason = SourceReason::EmaFallback;
            q.used_fallback = true;
        }
    }
    if (used == nullptr && secondary_fresh) {
        used = &*readings.secondary;
        q.source_reason = SourceReason::SecondaryFallback;
        q.used_fallback = true;
    }

    if (used == nullptr) {
        bool any_mid = primary.mid > 0 ||
                       (readings.primary_ema && readings.primary_ema->mid > 0) ||
                       (readings.secondary && readings.secondary->mid > 0);
        return Unexpected(any_mid ? ErrorCode::OracleStale : ErrorCode::MidUnset);
    }

    q.mid_used = used->mid;

    if (q.source_reason == SourceReason::Primary && primary.bid && primary.ask &&
        *primary.ask >= *primary.bid && *primary.bid > 0) {
        q.spread_bps = fp::to_bps(*primary.ask - *primary.bid, q.mid_used);
        q.has_spread = true;
    }

    if (q.source_reason != SourceReason::SecondaryFallback && secondary_fresh) {
        q.divergence_checkable = true;
        q.delta_bps = delta_bps(q.mid_used, readings.secondary->mid);
    }

    OracleState next = advance_sigma(prev, q.mid_used, block);
    q.sigma_bps = next.sigma_bps;

    // Source-native component: the book spread when observable, otherwise
    // the confidence the chosen source reports about itself.
    Bps native = q.has_spread ? q.spread_bps : used->conf_bps;
    Bps blended = native;
    if (flags_.blend_on) {
        Bps spread_c = fp::saturate_bps(fp::mul_div(native, config_.conf_weight_spread_bps, kBps));
        Bps sigma_c  = fp::saturate_bps(fp::mul_div(q.sigma_bps, config_.conf_weight_sigma_bps, kBps));
        Bps sec_c    = 0;
        if (secondary_fresh) {
            sec_c = fp::saturate_bps(fp::mul_div(readings.secondary->conf_bps,
                                                 config_.conf_weight_secondary_bps, kBps));
        }
        blended = std::max({spread_c, sigma_c, sec_c});
    }
    q.conf_bps_raw = blended;
    q.conf_bps = std::min(blended, conf_cap(mode));

    return FusionOutcome{.quote = q, .next_state = next};
}

Status OracleFusion::enforce_confidence_cap(const FusedQuote& fused, OracleMode mode) const {
    if (mode == OracleMode::Strict && fused.conf_bps_raw > config_.conf_cap_bps_strict) {
        return Unexpected(ErrorCode::ConfCapExceeded);
    }
    return {};
}

} // namespace dnmm
