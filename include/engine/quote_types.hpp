#pragma once

#include "math/fixed_point.hpp"
#include "oracle/oracle_types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dnmm {

enum class QuoteReason : uint8_t { Ok, Floor, AomqClamp };

const char* to_string(QuoteReason reason);

// Regime bits reported with every quote.
enum ClampFlag : uint16_t {
    kClampAomq      = 1u << 0,
    kClampFallback  = 1u << 1,
    kClampNearFloor = 1u << 2,
    kClampSizeFee   = 1u << 3,
    kClampInvTilt   = 1u << 4,
    kClampFloor     = 1u << 5,
};

// Comma-separated flag names, "none" when empty.
std::string describe_clamp_flags(uint16_t flags);

struct QuoteRequest {
    uint256     amount_in  = 0;
    bool        is_base_in = true;
    OracleMode  mode       = OracleMode::Spot;
    std::string caller;             // rebate allowlist key, may be empty
};

struct QuoteResult {
    uint256      amount_out             = 0;
    uint256      mid_used               = 0;
    Bps          fee_bps_used           = 0;
    uint256      partial_fill_amount_in = 0;   // input actually consumed
    bool         used_fallback          = false;
    SourceReason source                 = SourceReason::Primary;
    QuoteReason  reason                 = QuoteReason::Ok;
    uint16_t     clamp_flags            = 0;
    Bps          divergence_haircut_bps = 0;

    bool has_flag(ClampFlag f) const { return (clamp_flags & f) != 0; }
};

// Fees for a trader buying base (ask, quote in) and selling base (bid, base in).
struct PreviewFees {
    std::vector<Bps> ask_fee_bps;
    std::vector<Bps> bid_fee_bps;
};

struct PreviewLadderRow {
    uint256 size        = 0;   // base native units
    Bps     ask_fee_bps = 0;
    Bps     bid_fee_bps = 0;
    bool    ask_clamped = false;
    bool    bid_clamped = false;
};

struct PreviewLadder {
    std::vector<PreviewLadderRow> rows;
    uint64_t snapshot_timestamp = 0;
    uint256  mid_used           = 0;
};

// Ladder rung multiples of the S0 size.
inline constexpr uint32_t kLadderMultiples[] = {1, 2, 5, 10, 20, 50};

} // namespace dnmm
