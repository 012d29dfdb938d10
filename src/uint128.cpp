#include "uint128.hpp"
#include <algorithm>

namespace u128hlp {

std::string to_decimal(u128 value) {
    if (value == 0) return "0";
    std::string out;
    out.reserve(39); // 2^128-1 has 39 digits
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<u128> from_decimal(std::string_view text) {
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;

    constexpr u128 limit = max();
    u128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        unsigned digit = static_cast<unsigned>(c - '0');
        // value * 10 + digit must not exceed 2^128-1
        if (value > (limit - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace u128hlp
