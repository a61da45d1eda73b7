#pragma once

#include "basics/expected.hpp"

#include <cstdint>
#include <ostream>
#include <string_view>

namespace dnmm {

enum class ErrorCode : uint8_t {
    // oracle fusion
    OracleStale,          // a mid exists but every source is past its age bound
    MidUnset,             // no source produced a mid at all
    OracleReadFailed,     // a source read errored or timed out
    ConfCapExceeded,      // strict mode, blended confidence above the strict cap
    // divergence
    OracleDiverged,       // delta at or above the hard band
    // preview
    PreviewSnapshotStale,
    PreviewSnapshotCooldown,
    // recenter
    RecenterThreshold,
    RecenterCooldown,
    // governance
    InvalidConfig,
    FeeCapTooHigh,
    FeeBaseAboveCap,
    // swap
    InvalidAmount,
    FloorReached,
};

std::string_view to_string(ErrorCode code);

std::ostream& operator<<(std::ostream& os, ErrorCode code);

template <class T>
using Result = Expected<T, ErrorCode>;

using Status = Expected<void, ErrorCode>;

} // namespace dnmm
