#include "strategy/aomq_planner.hpp"

#include <algorithm>
#include <utility>

namespace dnmm {

AomqPlanner::AomqPlanner(AomqConfig aomq, FeeConfig fee, FeatureFlags flags)
    : aomq_(std::move(aomq)), fee_(fee), flags_(flags) {}

bool AomqPlanner::enabled() const {
    return flags_.enable_aomq && aomq_.min_quote_notional > 0;
}

bool AomqPlanner::routes_gate_failure(ErrorCode code) {
    return code == ErrorCode::OracleDiverged || code == ErrorCode::ConfCapExceeded;
}

bool AomqPlanner::near_floor(const uint256& reserve,
                             const uint256& headroom,
                             const uint256& projected_out) const {
    if (reserve == 0) return true;
    if (projected_out >= headroom) return true;
    return headroom - projected_out <= fp::apply_bps(reserve, aomq_.floor_epsilon_bps);
}

Bps AomqPlanner::emergency_fee(Bps fee_bps) const {
    return std::min(std::max(fee_bps, aomq_.emergency_spread_bps), fee_.cap_bps);
}

uint256 AomqPlanner::clamp_amount_in(const uint256& amount_in,
                                     bool is_base_in,
                                     const uint256& mid,
                                     const InventoryEngine& inventory) const {
    uint256 max_in = is_base_in ? inventory.quote_to_base(aomq_.min_quote_notional, mid)
                                : aomq_.min_quote_notional;
    return std::min(amount_in, max_in);
}

} // namespace dnmm
