#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// GCC/Clang builtin; wide enough for a whole ULID.
using u128 = unsigned __int128;

namespace u128hlp {

    constexpr u128 make(uint64_t hi, uint64_t lo) {
        return (static_cast<u128>(hi) << 64) | lo;
    }

    constexpr uint64_t high(u128 v) { return static_cast<uint64_t>(v >> 64); }
    constexpr uint64_t low(u128 v) { return static_cast<uint64_t>(v); }

    // low n bits set, n in [0, 128]
    constexpr u128 mask(int bits) {
        return bits >= 128 ? ~static_cast<u128>(0) : ((static_cast<u128>(1) << bits) - 1);
    }

    constexpr u128 max() { return ~static_cast<u128>(0); }

    // Base-10 rendering, no sign, no leading zeros ("0" for zero).
    std::string to_decimal(u128 value);

    // Parses an unsigned base-10 integer. A leading '+' is accepted.
    // Returns nullopt on empty input, non-digits, or values above 2^128-1.
    std::optional<u128> from_decimal(std::string_view text);

} // namespace u128hlp
