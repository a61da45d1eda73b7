#include "strategy/fee_engine.hpp"

#include <algorithm>

namespace dnmm {

namespace {

// Size ratios beyond this many multiples of S0 saturate the size term.
constexpr uint64_t kMaxSizeMultiple = 1'000'000;

} // namespace

FeeEngine::FeeEngine(FeeConfig fee, InventoryConfig inventory, MakerConfig maker, FeatureFlags flags)
    : fee_(fee), inventory_(inventory), maker_(maker), flags_(flags) {}

Bps FeeEngine::conf_term(Bps conf_bps) const {
    return fp::saturate_bps(fp::mul_div(conf_bps, fee_.alpha_conf_num, fee_.alpha_conf_den));
}

Bps FeeEngine::inventory_term(const FeeInputs& in, bool& tilt_applied) const {
    tilt_applied = false;
    uint256 term = fp::mul_div(in.inventory_deviation_bps, fee_.beta_inv_dev_num, fee_.beta_inv_dev_den);

    if (!flags_.enable_inv_tilt || in.tilt == TiltDirection::Neutral) {
        return fp::saturate_bps(term);
    }

    // tilt = bps per 1% of deviation
    uint256 tilt = fp::mul_div(inventory_.inv_tilt_bps_per_1pct, in.inventory_deviation_bps, 100);
    const uint256 tilt_max = inventory_.inv_tilt_max_bps;
    if (tilt == 0 || tilt_max == 0) {
        return fp::saturate_bps(term);
    }

    if (in.tilt == TiltDirection::Worsens) {
        // 1 + conf * wc + spread * ws, all in bps
        uint256 weight = uint256(kBps)
                       + uint256(in.conf_bps) * inventory_.tilt_conf_weight_bps / kBps
                       + uint256(in.spread_bps) * inventory_.tilt_spread_weight_bps / kBps;
        uint256 adj = fp::mul_div(tilt, weight, kBps);
        term += std::min(adj, tilt_max);
    } else {
        uint256 adj = std::min({tilt, tilt_max, term});
        term -= adj;
    }
    tilt_applied = true;
    return fp::saturate_bps(term);
}

Bps FeeEngine::size_term(const uint256& trade_notional) const {
    if (!flags_.enable_size_fee || fee_.size_fee_cap_bps == 0 || trade_notional == 0) return 0;

    uint256 ratio_wad;
    if (trade_notional / maker_.s0_notional >= kMaxSizeMultiple) {
        ratio_wad = uint256(kMaxSizeMultiple) * kWad;
    } else {
        ratio_wad = fp::mul_div(trade_notional, kWad, maker_.s0_notional);
    }

    uint256 lin  = fp::mul_div(fee_.gamma_size_lin_bps, ratio_wad, kWad);
    uint256 quad = fp::mul_div(fee_.gamma_size_quad_bps, fp::wmul(ratio_wad, ratio_wad), kWad);
    uint256 total = lin + quad;
    return fp::saturate_bps(std::min(total, uint256(fee_.size_fee_cap_bps)));
}

Bps FeeEngine::lvr_term(Bps sigma_bps) const {
    if (!flags_.enable_lvr_fee || fee_.kappa_lvr_bps == 0 || fee_.lvr_fee_cap_bps == 0) return 0;

    // sqrt(ttl in seconds) scaled by 1000
    uint64_t sqrt_ttl_milli = fp::isqrt(maker_.ttl_ms * 1000);
    uint256 term = uint256(fee_.kappa_lvr_bps) * sigma_bps * sqrt_ttl_milli / (uint256(kBps) * 1000);
    return fp::saturate_bps(std::min(term, uint256(fee_.lvr_fee_cap_bps)));
}

Bps FeeEngine::bbo_floor(Bps spread_bps, bool has_spread) const {
    if (!flags_.enable_bbo_floor) return 0;
    if (!has_spread) return maker_.beta_floor_bps;
    return fp::saturate_bps(fp::mul_div(spread_bps, maker_.alpha_bbo_bps, kBps));
}

Bps FeeEngine::decayed_fee(const FeeState& prev, uint64_t block) const {
    if (fee_.decay_pct_per_block == 0 || block <= prev.last_block) return 0;
    if (prev.last_fee_bps <= fee_.base_bps) return fee_.base_bps;

    uint64_t elapsed = block - prev.last_block;
    uint64_t excess = prev.last_fee_bps - fee_.base_bps;
    const uint64_t keep = 100 - fee_.decay_pct_per_block;
    for (uint64_t i = 0; i < elapsed && excess > 0; ++i) {
        excess = excess * keep / 100;
    }
    return static_cast<Bps>(fee_.base_bps + excess);
}

FeeBreakdown FeeEngine::compute(const FeeState& prev, const FeeInputs& in) const {
    FeeBreakdown b;
    b.conf_term    = conf_term(in.conf_bps);
    b.inv_term     = inventory_term(in, b.tilt_applied);
    b.size_term    = size_term(in.trade_notional);
    b.size_applied = b.size_term > 0;
    b.lvr_term     = lvr_term(in.sigma_bps);
    b.haircut_term = in.haircut_bps;

    uint256 sum = uint256(fee_.base_bps) + b.conf_term + b.inv_term + b.size_term
                + b.lvr_term + b.haircut_term;
    b.fresh_bps = fp::clamp_bps(fp::saturate_bps(sum), fee_.base_bps, fee_.cap_bps);

    // Same-tick calls price from fresh signals only.
    b.carried_bps = decayed_fee(prev, in.block);
    Bps fee = std::max(b.fresh_bps, b.carried_bps);

    b.floor_bps = bbo_floor(in.spread_bps, in.has_spread);
    fee = std::max(fee, b.floor_bps);
    b.fee_bps = std::min(fee, fee_.cap_bps);
    return b;
}

FeeState FeeEngine::settle(const FeeBreakdown& breakdown, uint64_t block) const {
    return FeeState{.last_fee_bps = breakdown.fee_bps, .last_block = block};
}

Bps FeeEngine::apply_rebate(const FeeBreakdown& breakdown, Bps rebate_bps) const {
    if (!flags_.enable_rebates || rebate_bps == 0) return breakdown.fee_bps;
    Bps lower = std::max(fee_.base_bps, std::min(breakdown.floor_bps, fee_.cap_bps));
    Bps discounted = breakdown.fee_bps > rebate_bps ? breakdown.fee_bps - rebate_bps : 0;
    return std::max(discounted, lower);
}

} // namespace dnmm
