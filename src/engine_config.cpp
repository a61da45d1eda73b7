#include "config/engine_config.hpp"

namespace dnmm {

Status validate_fee_config(const FeeConfig& c) {
    if (c.cap_bps > kMaxFeeCapBps) return Unexpected(ErrorCode::FeeCapTooHigh);
    if (c.base_bps > c.cap_bps) return Unexpected(ErrorCode::FeeBaseAboveCap);
    if (c.alpha_conf_den == 0 || c.beta_inv_dev_den == 0) return Unexpected(ErrorCode::InvalidConfig);
    if (c.decay_pct_per_block > 100) return Unexpected(ErrorCode::InvalidConfig);
    return {};
}

Status validate_oracle_config(const OracleConfig& c) {
    if (c.max_age_sec == 0 || c.secondary_max_age_sec == 0 || c.secondary_max_age_sec_strict == 0) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    if (!(c.divergence_accept_bps < c.divergence_soft_bps &&
          c.divergence_soft_bps < c.divergence_hard_bps &&
          c.divergence_hard_bps <= kBps)) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    if (c.conf_cap_bps_strict > c.conf_cap_bps_spot || c.conf_cap_bps_spot > kBps) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    if (c.conf_weight_spread_bps > kBps || c.conf_weight_sigma_bps > kBps ||
        c.conf_weight_secondary_bps > kBps) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    if (c.sigma_ewma_lambda_bps >= kBps) return Unexpected(ErrorCode::InvalidConfig);
    if (c.divergence_bps == 0 || c.divergence_bps > kBps) return Unexpected(ErrorCode::InvalidConfig);
    if (c.haircut_min_bps > kBps || c.haircut_slope_bps > kBps) return Unexpected(ErrorCode::InvalidConfig);
    if (c.divergence_healthy_required == 0) return Unexpected(ErrorCode::InvalidConfig);
    return {};
}

Status validate_inventory_config(const InventoryConfig& c) {
    if (c.floor_bps > kMaxFloorBps) return Unexpected(ErrorCode::InvalidConfig);
    if (c.recenter_threshold_pct == 0 || c.recenter_threshold_pct > 100) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    if (c.inv_tilt_max_bps > kBps || c.inv_tilt_bps_per_1pct > kBps) return Unexpected(ErrorCode::InvalidConfig);
    if (c.tilt_conf_weight_bps > kBps || c.tilt_spread_weight_bps > kBps) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    return {};
}

Status validate_maker_config(const MakerConfig& c) {
    if (c.s0_notional == 0 || c.ttl_ms == 0) return Unexpected(ErrorCode::InvalidConfig);
    if (c.alpha_bbo_bps > kBps || c.beta_floor_bps > kBps) return Unexpected(ErrorCode::InvalidConfig);
    return {};
}

Status validate_aomq_config(const AomqConfig& c) {
    if (c.emergency_spread_bps > kBps || c.floor_epsilon_bps > kBps) {
        return Unexpected(ErrorCode::InvalidConfig);
    }
    return {};
}

Status validate_preview_config(const PreviewConfig& c) {
    if (c.max_age_sec == 0) return Unexpected(ErrorCode::InvalidConfig);
    return {};
}

Status validate_engine_config(const EngineConfig& c) {
    if (auto s = validate_fee_config(c.fee); !s) return s;
    if (auto s = validate_oracle_config(c.oracle); !s) return s;
    if (auto s = validate_inventory_config(c.inventory); !s) return s;
    if (auto s = validate_maker_config(c.maker); !s) return s;
    if (auto s = validate_aomq_config(c.aomq); !s) return s;
    if (auto s = validate_preview_config(c.preview); !s) return s;

    // An emergency quote may never price above the fee cap.
    if (c.aomq.emergency_spread_bps > c.fee.cap_bps) return Unexpected(ErrorCode::InvalidConfig);
    return {};
}

} // namespace dnmm
