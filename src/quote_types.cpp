#include "engine/quote_types.hpp"

namespace dnmm {

const char* to_string(QuoteReason reason) {
    switch (reason) {
        case QuoteReason::Ok:        return "ok";
        case QuoteReason::Floor:     return "floor";
        case QuoteReason::AomqClamp: return "aomq_clamp";
    }
    return "unknown";
}

std::string describe_clamp_flags(uint16_t flags) {
    static constexpr struct {
        ClampFlag   flag;
        const char* name;
    } kNames[] = {
        {kClampAomq, "AOMQ"},
        {kClampFallback, "Fallback"},
        {kClampNearFloor, "NearFloor"},
        {kClampSizeFee, "SizeFee"},
        {kClampInvTilt, "InvTilt"},
        {kClampFloor, "Floor"},
    };

    std::string out;
    for (const auto& entry : kNames) {
        if ((flags & entry.flag) == 0) continue;
        if (!out.empty()) out += ",";
        out += entry.name;
    }
    return out.empty() ? "none" : out;
}

} // namespace dnmm
