#include "oracle/oracle_types.hpp"

#include <algorithm>

namespace dnmm {

const char* to_string(OracleMode mode) {
    switch (mode) {
        case OracleMode::Spot:   return "spot";
        case OracleMode::Strict: return "strict";
    }
    return "unknown";
}

const char* to_string(SourceReason reason) {
    switch (reason) {
        case SourceReason::Primary:           return "primary";
        case SourceReason::EmaFallback:       return "ema_fallback";
        case SourceReason::SecondaryFallback: return "secondary_fallback";
    }
    return "unknown";
}

OracleSample derive_pair_sample(const OracleSample& base_usd, const OracleSample& quote_usd) {
    OracleSample out;
    out.age_sec = std::max(base_usd.age_sec, quote_usd.age_sec);
    out.status  = std::max(base_usd.status, quote_usd.status);

    uint256 conf = uint256(base_usd.conf_bps) + uint256(quote_usd.conf_bps);
    out.conf_bps = fp::saturate_bps(conf);

    if (quote_usd.mid == 0) {
        out.mid = 0;
        if (out.status == OracleStatus::Ok) out.status = OracleStatus::Stale;
        return out;
    }
    out.mid = fp::wdiv(base_usd.mid, quote_usd.mid);
    return out;
}

} // namespace dnmm
