#pragma once

#include "basics/errors.hpp"
#include "math/fixed_point.hpp"

#include <cstdint>

namespace dnmm {

inline constexpr Bps kMaxFeeCapBps = 5'000;
inline constexpr Bps kMaxFloorBps  = 5'000;
inline constexpr Bps kMaxRebateBps = 25;

struct FeeConfig {
    Bps      base_bps            = 15;
    uint32_t alpha_conf_num      = 6;     // confTerm = conf * num / den
    uint32_t alpha_conf_den      = 10;
    uint32_t beta_inv_dev_num    = 1;     // invTerm = deviation * num / den
    uint32_t beta_inv_dev_den    = 10;
    Bps      cap_bps             = 150;
    uint32_t decay_pct_per_block = 20;    // 0 disables the carry
    Bps      gamma_size_lin_bps  = 0;     // per 1.0x of S0 notional
    Bps      gamma_size_quad_bps = 0;
    Bps      size_fee_cap_bps    = 0;
    Bps      kappa_lvr_bps       = 0;
    Bps      lvr_fee_cap_bps     = 0;
};

struct OracleConfig {
    uint64_t max_age_sec                  = 48;
    uint64_t secondary_max_age_sec        = 60;
    uint64_t secondary_max_age_sec_strict = 15;
    bool     allow_ema_fallback           = true;
    Bps      conf_cap_bps_spot            = 100;
    Bps      conf_cap_bps_strict          = 100;
    Bps      conf_weight_spread_bps       = 10'000;
    Bps      conf_weight_sigma_bps        = 10'000;
    Bps      conf_weight_secondary_bps    = 10'000;
    Bps      sigma_ewma_lambda_bps        = 9'000;
    Bps      divergence_bps               = 50;    // single threshold when soft divergence is off
    Bps      divergence_accept_bps        = 30;
    Bps      divergence_soft_bps          = 50;
    Bps      divergence_hard_bps          = 75;
    Bps      haircut_min_bps              = 3;
    Bps      haircut_slope_bps            = 1;
    uint8_t  divergence_healthy_required  = 3;
};

struct InventoryConfig {
    Bps      floor_bps                 = 300;
    uint32_t recenter_threshold_pct    = 5;
    uint64_t recenter_cooldown_sec     = 120;
    uint32_t recenter_healthy_required = 2;
    Bps      inv_tilt_bps_per_1pct     = 0;
    Bps      inv_tilt_max_bps          = 0;
    Bps      tilt_conf_weight_bps      = 0;
    Bps      tilt_spread_weight_bps    = 0;
};

struct MakerConfig {
    uint256  s0_notional    = uint256(5'000'000'000ULL); // quote native units
    uint64_t ttl_ms         = 300;
    Bps      alpha_bbo_bps  = 5'000;  // share of the observed spread used as fee floor
    Bps      beta_floor_bps = 10;     // floor when no spread is observable
};

struct AomqConfig {
    uint256 min_quote_notional   = 0;   // quote native units; 0 disables AOMQ quoting
    Bps     emergency_spread_bps = 50;
    Bps     floor_epsilon_bps    = 100;
};

struct PreviewConfig {
    uint64_t max_age_sec             = 10;
    uint64_t snapshot_cooldown_sec   = 0;
    bool     revert_on_stale_preview = true;
    bool     enable_preview_fresh    = false;
};

struct FeatureFlags {
    bool blend_on               = true;
    bool enable_soft_divergence = true;
    bool enable_size_fee        = false;
    bool enable_bbo_floor       = false;
    bool enable_inv_tilt        = false;
    bool enable_aomq            = false;
    bool enable_rebates         = false;
    bool enable_auto_recenter   = false;
    bool enable_lvr_fee         = false;
};

struct EngineConfig {
    FeeConfig       fee;
    OracleConfig    oracle;
    InventoryConfig inventory;
    MakerConfig     maker;
    AomqConfig      aomq;
    PreviewConfig   preview;
    FeatureFlags    flags;
};

Status validate_fee_config(const FeeConfig& c);
Status validate_oracle_config(const OracleConfig& c);
Status validate_inventory_config(const InventoryConfig& c);
Status validate_maker_config(const MakerConfig& c);
Status validate_aomq_config(const AomqConfig& c);
Status validate_preview_config(const PreviewConfig& c);

// Validates every part plus the rules spanning more than one struct.
Status validate_engine_config(const EngineConfig& c);

} // namespace dnmm
