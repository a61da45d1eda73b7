#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace dnmm {

using uint256 = boost::multiprecision::uint256_t;
using uint512 = boost::multiprecision::uint512_t;

using Bps = uint32_t; // basis points, 1/10000

inline constexpr Bps kBps = 10'000;
inline const uint256 kWad{1'000'000'000'000'000'000ULL}; // 1e18

namespace fp {

// floor(a * b / d) with a 512-bit intermediate.
// Throws std::domain_error on d == 0 and std::overflow_error when the
// quotient does not fit in 256 bits.
uint256 mul_div(const uint256& a, const uint256& b, const uint256& d);

// mul_div that reports d == 0 or overflow as nullopt instead of throwing.
std::optional<uint256> try_mul_div(const uint256& a, const uint256& b, const uint256& d);

// ceil(a * b / d)
uint256 mul_div_up(const uint256& a, const uint256& b, const uint256& d);

inline uint256 wmul(const uint256& a, const uint256& b) { return mul_div(a, b, kWad); }
inline uint256 wdiv(const uint256& a, const uint256& b) { return mul_div(a, kWad, b); }

// amount * bps / 10000, rounded down
inline uint256 apply_bps(const uint256& amount, Bps bps) { return mul_div(amount, bps, kBps); }

// numerator / denominator expressed in bps, saturated to the Bps range.
// Returns 0 when denominator is 0.
Bps to_bps(const uint256& numerator, const uint256& denominator);

// Narrow a 256-bit value to Bps, saturating instead of wrapping.
Bps saturate_bps(const uint256& value);

inline uint256 abs_diff(const uint256& a, const uint256& b) { return a > b ? a - b : b - a; }

inline Bps clamp_bps(Bps value, Bps lo, Bps hi) {
    if (value < lo) return lo;
    if (value > hi) return hi;
    return value;
}

// floor(sqrt(x))
uint64_t isqrt(uint64_t x);

// 10^decimals
uint256 pow10(uint8_t decimals);

// Parse a non-negative decimal string ("12", "0.25", "1e3" is not accepted)
// into an integer scaled by 10^decimals. Extra fractional digits beyond
// `decimals` are truncated. Returns nullopt on malformed input.
std::optional<uint256> parse_units(const std::string& text, uint8_t decimals);

// Parse an unsigned integer string. Returns nullopt on malformed input.
std::optional<uint256> parse_uint256(const std::string& text);

// Render an integer scaled by 10^decimals as a decimal string.
std::string format_units(const uint256& value, uint8_t decimals);

} // namespace fp
} // namespace dnmm
