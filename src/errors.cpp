#include "basics/errors.hpp"

namespace dnmm {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OracleStale:             return "OracleStale";
        case ErrorCode::MidUnset:                return "MidUnset";
        case ErrorCode::OracleReadFailed:        return "OracleReadFailed";
        case ErrorCode::ConfCapExceeded:         return "ConfCapExceeded";
        case ErrorCode::OracleDiverged:          return "OracleDiverged";
        case ErrorCode::PreviewSnapshotStale:    return "PreviewSnapshotStale";
        case ErrorCode::PreviewSnapshotCooldown: return "PreviewSnapshotCooldown";
        case ErrorCode::RecenterThreshold:       return "RecenterThreshold";
        case ErrorCode::RecenterCooldown:        return "RecenterCooldown";
        case ErrorCode::InvalidConfig:           return "InvalidConfig";
        case ErrorCode::FeeCapTooHigh:           return "FeeCapTooHigh";
        case ErrorCode::FeeBaseAboveCap:         return "FeeBaseAboveCap";
        case ErrorCode::InvalidAmount:           return "InvalidAmount";
        case ErrorCode::FloorReached:            return "FloorReached";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << to_string(code);
}

} // namespace dnmm
