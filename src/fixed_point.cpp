#include "math/fixed_point.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace dnmm::fp {

namespace {

const uint512 kMaxUint256 = uint512(std::numeric_limits<uint256>::max());

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

uint256 mul_div(const uint256& a, const uint256& b, const uint256& d) {
    if (d == 0) {
        throw std::domain_error("mul_div: division by zero");
    }
    uint512 wide = uint512(a) * uint512(b);
    wide /= uint512(d);
    if (wide > kMaxUint256) {
        throw std::overflow_error("mul_div: result exceeds 256 bits");
    }
    return static_cast<uint256>(wide);
}

std::optional<uint256> try_mul_div(const uint256& a, const uint256& b, const uint256& d) {
    if (d == 0) return std::nullopt;
    uint512 wide = uint512(a) * uint512(b);
    wide /= uint512(d);
    if (wide > kMaxUint256) return std::nullopt;
    return static_cast<uint256>(wide);
}

uint256 mul_div_up(const uint256& a, const uint256& b, const uint256& d) {
    if (d == 0) {
        throw std::domain_error("mul_div_up: division by zero");
    }
    uint512 wide = uint512(a) * uint512(b);
    uint512 q = wide / uint512(d);
    if (q * uint512(d) != wide) {
        q += 1;
    }
    if (q > kMaxUint256) {
        throw std::overflow_error("mul_div_up: result exceeds 256 bits");
    }
    return static_cast<uint256>(q);
}

Bps to_bps(const uint256& numerator, const uint256& denominator) {
    if (denominator == 0) return 0;
    return saturate_bps(mul_div(numerator, kBps, denominator));
}

Bps saturate_bps(const uint256& value) {
    if (value > std::numeric_limits<Bps>::max()) {
        return std::numeric_limits<Bps>::max();
    }
    return static_cast<Bps>(value);
}

uint64_t isqrt(uint64_t x) {
    if (x < 2) return x;
    // Newton iteration from an over-estimate converges monotonically down.
    uint64_t r = x;
    uint64_t y = (r + 1) / 2;
    while (y < r) {
        r = y;
        y = (r + x / r) / 2;
    }
    return r;
}

uint256 pow10(uint8_t decimals) {
    uint256 result = 1;
    for (uint8_t i = 0; i < decimals; ++i) {
        result *= 10;
    }
    return result;
}

std::optional<uint256> parse_uint256(const std::string& text) {
    if (!all_digits(text) || text.size() > 78) {
        return std::nullopt;
    }
    uint512 value = 0;
    for (char c : text) {
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value > kMaxUint256) {
        return std::nullopt;
    }
    return static_cast<uint256>(value);
}

std::optional<uint256> parse_units(const std::string& text, uint8_t decimals) {
    auto dot = text.find('.');
    std::string int_part = text.substr(0, dot);
    std::string frac_part = (dot == std::string::npos) ? std::string{} : text.substr(dot + 1);

    if (int_part.empty() && frac_part.empty()) return std::nullopt;
    if (int_part.empty()) int_part = "0";
    if (dot != std::string::npos && frac_part.empty()) return std::nullopt;
    if (!all_digits(int_part)) return std::nullopt;
    if (!frac_part.empty() && !all_digits(frac_part)) return std::nullopt;

    if (frac_part.size() > decimals) {
        frac_part.resize(decimals);
    }
    frac_part.append(decimals - frac_part.size(), '0');

    return parse_uint256(int_part + frac_part);
}

std::string format_units(const uint256& value, uint8_t decimals) {
    std::string digits = value.str();
    if (decimals == 0) return digits;
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    std::string out = digits.substr(0, digits.size() - decimals);
    std::string frac = digits.substr(digits.size() - decimals);
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    if (!frac.empty()) {
        out += "." + frac;
    }
    return out;
}

} // namespace dnmm::fp
