#pragma once

#include "math/fixed_point.hpp"

#include <cstdint>
#include <optional>

namespace dnmm {

enum class OracleStatus : uint8_t { Ok, Stale, Error };

// Spot caps the blended confidence; Strict rejects above its cap and
// tightens the secondary age bound.
enum class OracleMode : uint8_t { Spot, Strict };

enum class SourceReason : uint8_t { Primary, EmaFallback, SecondaryFallback };

const char* to_string(OracleMode mode);
const char* to_string(SourceReason reason);

// One reading from one source. Prices are WAD quote-per-base.
struct OracleSample {
    uint256                mid      = 0;
    std::optional<uint256> bid;
    std::optional<uint256> ask;
    Bps                    conf_bps = 0;
    uint64_t               age_sec  = 0;
    OracleStatus           status   = OracleStatus::Ok;

    bool operator==(const OracleSample&) const = default;
};

struct OracleReadings {
    OracleSample                primary;
    std::optional<OracleSample> primary_ema;
    std::optional<OracleSample> secondary;
};

struct FusedQuote {
    uint256      mid_used             = 0;
    bool         used_fallback        = false;
    SourceReason source_reason        = SourceReason::Primary;
    Bps          delta_bps            = 0;     // primary vs secondary, 0 when not checkable
    bool         divergence_checkable = false;
    Bps          conf_bps             = 0;     // blended, capped at the mode cap
    Bps          conf_bps_raw         = 0;     // blended before the cap
    Bps          spread_bps           = 0;
    bool         has_spread           = false;
    Bps          sigma_bps            = 0;
};

// Per-block volatility memory carried between calls.
struct OracleState {
    uint256  last_mid   = 0;
    Bps      sigma_bps  = 0;
    uint64_t last_block = 0;

    bool operator==(const OracleState&) const = default;
};

struct BlockTime {
    uint64_t timestamp = 0;   // seconds
    uint64_t block     = 0;
};

// Build the secondary BASE/QUOTE sample from two USD-denominated feeds.
OracleSample derive_pair_sample(const OracleSample& base_usd, const OracleSample& quote_usd);

} // namespace dnmm
