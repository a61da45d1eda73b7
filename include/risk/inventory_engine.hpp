#pragma once

#include "basics/errors.hpp"
#include "config/engine_config.hpp"
#include "config/token_config.hpp"
#include "strategy/fee_engine.hpp"

#include <cstdint>

namespace dnmm {

struct InventoryState {
    uint256  base_reserves        = 0;   // base native units
    uint256  quote_reserves       = 0;   // quote native units
    uint256  target_base_star     = 0;   // base native units
    uint256  last_rebalance_price = 0;   // WAD
    uint64_t last_rebalance_at    = 0;

    bool operator==(const InventoryState&) const = default;
};

struct FillResult {
    uint256 amount_in  = 0;   // input actually consumed
    uint256 amount_out = 0;
    bool    partial    = false;
};

class InventoryEngine {
public:
    InventoryEngine(InventoryConfig config, TokenPair tokens);

    // reserve * floor_bps / 10000
    uint256 floor_amount(const uint256& reserve) const;

    // Reserve left above the floor on the leg a trade pays out of.
    uint256 headroom(const InventoryState& s, bool is_base_in) const;
    uint256 output_reserve(const InventoryState& s, bool is_base_in) const;

    uint256 base_to_quote(const uint256& base_amount, const uint256& mid) const;
    uint256 base_to_quote_up(const uint256& base_amount, const uint256& mid) const;
    uint256 quote_to_base(const uint256& quote_amount, const uint256& mid) const;
    uint256 quote_to_base_up(const uint256& quote_amount, const uint256& mid) const;

    // |base notional - target notional| / total notional, in bps. Symmetric in
    // which side is heavy.
    Bps deviation_bps(const InventoryState& s, const uint256& mid) const;

    // InvalidAmount when booking amount_in, or valuing the pool after it,
    // would not fit in 256 bits.
    Status check_amount(const InventoryState& s,
                        const uint256& amount_in,
                        bool is_base_in,
                        const uint256& mid) const;

    TiltDirection tilt_direction(const InventoryState& s, bool is_base_in) const;

    // Converts at the mid less fee and clamps the output so the paying leg
    // ends exactly at its floor. FloorReached when nothing is left to pay.
    Result<FillResult> fill(const InventoryState& s,
                            const uint256& amount_in,
                            bool is_base_in,
                            const uint256& mid,
                            Bps fee_bps) const;

    InventoryState apply(const InventoryState& s, const FillResult& fill, bool is_base_in) const;

    // Base amount holding half of the pool's value at `mid`.
    uint256 balanced_target(const InventoryState& s, const uint256& mid) const;

    const TokenPair& tokens() const { return tokens_; }

private:
    // mid scaled to quote native units per whole base, times WAD
    uint256 quote_price(const uint256& mid) const;

    InventoryConfig config_;
    TokenPair       tokens_;
};

} // namespace dnmm
