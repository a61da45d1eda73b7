#include "risk/inventory_engine.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace dnmm {

InventoryEngine::InventoryEngine(InventoryConfig config, TokenPair tokens)
    : config_(config), tokens_(std::move(tokens)) {}

uint256 InventoryEngine::quote_price(const uint256& mid) const {
    return mid * tokens_.quote.scale;
}

uint256 InventoryEngine::floor_amount(const uint256& reserve) const {
    return fp::apply_bps(reserve, config_.floor_bps);
}

uint256 InventoryEngine::output_reserve(const InventoryState& s, bool is_base_in) const {
    return is_base_in ? s.quote_reserves : s.base_reserves;
}

uint256 InventoryEngine::headroom(const InventoryState& s, bool is_base_in) const {
    const uint256& reserve = is_base_in ? s.quote_reserves : s.base_reserves;
    return reserve - floor_amount(reserve);
}

// quote = base * mid * quoteScale / (WAD * baseScale)
uint256 InventoryEngine::base_to_quote(const uint256& base_amount, const uint256& mid) const {
    return fp::mul_div(base_amount, quote_price(mid),
                       kWad * tokens_.base.scale);
}

uint256 InventoryEngine::base_to_quote_up(const uint256& base_amount, const uint256& mid) const {
    return fp::mul_div_up(base_amount, quote_price(mid),
                          kWad * tokens_.base.scale);
}

uint256 InventoryEngine::quote_to_base(const uint256& quote_amount, const uint256& mid) const {
    return fp::mul_div(quote_amount, kWad * tokens_.base.scale,
                       quote_price(mid));
}

uint256 InventoryEngine::quote_to_base_up(const uint256& quote_amount, const uint256& mid) const {
    return fp::mul_div_up(quote_amount, kWad * tokens_.base.scale,
                          quote_price(mid));
}

Bps InventoryEngine::deviation_bps(const InventoryState& s, const uint256& mid) const {
    if (mid == 0) return 0;
    uint256 base_notional   = base_to_quote(s.base_reserves, mid);
    uint256 target_notional = base_to_quote(s.target_base_star, mid);
    uint256 total = base_notional + s.quote_reserves;
    if (total == 0) return 0;
    return std::min(fp::to_bps(fp::abs_diff(base_notional, target_notional), total), kBps);
}

Status InventoryEngine::check_amount(const InventoryState& s,
                                     const uint256& amount_in,
                                     bool is_base_in,
                                     const uint256& mid) const {
    const uint256 max = std::numeric_limits<uint256>::max();
    const uint256& in_reserve = is_base_in ? s.base_reserves : s.quote_reserves;
    if (amount_in > max - in_reserve) return Unexpected(ErrorCode::InvalidAmount);

    const uint256 base_after  = is_base_in ? s.base_reserves + amount_in : s.base_reserves;
    const uint256 quote_after = is_base_in ? s.quote_reserves : s.quote_reserves + amount_in;
    auto base_notional = fp::try_mul_div(base_after, quote_price(mid), kWad * tokens_.base.scale);
    if (!base_notional || *base_notional > max - quote_after) {
        return Unexpected(ErrorCode::InvalidAmount);
    }
    if (!is_base_in && !fp::try_mul_div(amount_in, kWad * tokens_.base.scale, quote_price(mid))) {
        return Unexpected(ErrorCode::InvalidAmount);
    }
    return {};
}

TiltDirection InventoryEngine::tilt_direction(const InventoryState& s, bool is_base_in) const {
    if (s.base_reserves == s.target_base_star) return TiltDirection::Neutral;
    bool base_heavy = s.base_reserves > s.target_base_star;
    // Selling base into a base-heavy pool pushes it further from target.
    return (base_heavy == is_base_in) ? TiltDirection::Worsens : TiltDirection::Restores;
}

Result<FillResult> InventoryEngine::fill(const InventoryState& s,
                                         const uint256& amount_in,
                                         bool is_base_in,
                                         const uint256& mid,
                                         Bps fee_bps) const {
    if (amount_in == 0) return Unexpected(ErrorCode::InvalidAmount);
    if (mid == 0) return Unexpected(ErrorCode::MidUnset);
    if (fee_bps >= kBps) return Unexpected(ErrorCode::InvalidConfig);

    const uint256 available = headroom(s, is_base_in);
    if (available == 0) return Unexpected(ErrorCode::FloorReached);

    const uint256 keep_bps = kBps - fee_bps;
    uint256 gross = is_base_in ? base_to_quote(amount_in, mid) : quote_to_base(amount_in, mid);
    uint256 out = fp::mul_div(gross, keep_bps, kBps);

    if (out <= available) {
        return FillResult{.amount_in = amount_in, .amount_out = out, .partial = false};
    }

    // Smallest input whose post-fee output covers `available`.
    uint256 gross_needed = fp::mul_div_up(available, kBps, keep_bps);
    uint256 in_needed = is_base_in ? quote_to_base_up(gross_needed, mid)
                                   : base_to_quote_up(gross_needed, mid);
    return FillResult{
        .amount_in  = std::min(in_needed, amount_in),
        .amount_out = available,
        .partial    = true,
    };
}

InventoryState InventoryEngine::apply(const InventoryState& s, const FillResult& fill, bool is_base_in) const {
    InventoryState next = s;
    if (is_base_in) {
        next.base_reserves  += fill.amount_in;
        next.quote_reserves -= fill.amount_out;
    } else {
        next.quote_reserves += fill.amount_in;
        next.base_reserves  -= fill.amount_out;
    }
    return next;
}

uint256 InventoryEngine::balanced_target(const InventoryState& s, const uint256& mid) const {
    if (mid == 0) return s.target_base_star;
    uint256 total_quote = base_to_quote(s.base_reserves, mid) + s.quote_reserves;
    return quote_to_base(total_quote / 2, mid);
}

} // namespace dnmm
