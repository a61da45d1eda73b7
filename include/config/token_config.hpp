#pragma once

#include "math/fixed_point.hpp"

#include <cstdint>

namespace dnmm {

struct TokenLegInfo {
    uint8_t decimals = 18;
    uint256 scale    = kWad;   // 10^decimals
};

struct TokenPair {
    TokenLegInfo base;
    TokenLegInfo quote;
};

inline TokenLegInfo make_leg(uint8_t decimals) {
    return TokenLegInfo{.decimals = decimals, .scale = fp::pow10(decimals)};
}

inline TokenPair make_token_pair(uint8_t base_decimals, uint8_t quote_decimals) {
    return TokenPair{.base = make_leg(base_decimals), .quote = make_leg(quote_decimals)};
}

} // namespace dnmm
