#include "datetime.hpp"
#include <iomanip>
#include <sstream>

using namespace std::chrono;

namespace {

    // Reads exactly `width` digits at `pos`; advances pos on success.
    bool read_fixed(std::string_view s, size_t& pos, int width, int& out) {
        if (pos + width > s.size()) return false;
        int v = 0;
        for (int i = 0; i < width; ++i) {
            char c = s[pos + i];
            if (c < '0' || c > '9') return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        pos += width;
        return true;
    }

    // Four or five year digits; five cover timestamps up to 2^48-1 ms.
    bool read_year(std::string_view s, size_t& pos, int& out) {
        size_t end = pos;
        while (end < s.size() && s[end] >= '0' && s[end] <= '9') ++end;
        const size_t width = end - pos;
        if (width < 4 || width > 5) return false;
        return read_fixed(s, pos, static_cast<int>(width), out);
    }

    bool expect(std::string_view s, size_t& pos, char c) {
        if (pos >= s.size() || s[pos] != c) return false;
        ++pos;
        return true;
    }
}

namespace dt {

uint64_t unix_millis(sys_ms tp) {
    auto ms = tp.time_since_epoch().count();
    return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

sys_ms now() {
    return std::chrono::floor<milliseconds>(system_clock::now());
}

sys_ms from_unix_millis(uint64_t ms) {
    return sys_ms(milliseconds(static_cast<int64_t>(ms)));
}

std::string to_rfc3339(sys_ms tp) {
    const sys_days date = std::chrono::floor<days>(tp);
    const year_month_day ymd(date);
    auto in_day = (tp - date).count(); // ms since midnight

    const int64_t msec = in_day % 1000; in_day /= 1000;
    const int64_t sec  = in_day % 60;   in_day /= 60;
    const int64_t min  = in_day % 60;   in_day /= 60;
    const int64_t hour = in_day;

    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << static_cast<int>(ymd.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
       << std::setw(2) << hour << ':'
       << std::setw(2) << min << ':'
       << std::setw(2) << sec << '.'
       << std::setw(3) << msec << "+00:00";
    return ss.str();
}

std::optional<sys_ms> parse(std::string_view s) {
    size_t pos = 0;
    int y = 0, mo = 0, d = 0;
    if (!read_year(s, pos, y) || !expect(s, pos, '-') ||
        !read_fixed(s, pos, 2, mo) || !expect(s, pos, '-') ||
        !read_fixed(s, pos, 2, d)) {
        return std::nullopt;
    }
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    int hh = 0, mm = 0, ss = 0;
    milliseconds frac{0};
    minutes offset{0};

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
        ++pos;
        if (!read_fixed(s, pos, 2, hh) || !expect(s, pos, ':') || !read_fixed(s, pos, 2, mm)) {
            return std::nullopt;
        }
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!read_fixed(s, pos, 2, ss)) return std::nullopt;
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                ++pos;
                int digits = 0, ms = 0;
                while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                    if (digits < 3) ms = ms * 10 + (s[pos] - '0');
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (int i = digits; i < 3; ++i) ms *= 10;
                frac = milliseconds(ms);
            }
        }
        // 23:59:60 leap seconds are not representable in system_clock
        if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

        if (pos < s.size()) {
            char c = s[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!read_fixed(s, pos, 2, oh)) return std::nullopt;
                if (pos < s.size() && s[pos] == ':') ++pos;
                if (!read_fixed(s, pos, 2, om)) return std::nullopt;
                if (oh > 23 || om > 59) return std::nullopt;
                offset = hours(oh) + minutes(om);
                if (c == '-') offset = -offset;
            } else {
                return std::nullopt;
            }
        }
        if (pos != s.size()) return std::nullopt;
    }

    // local wall time minus its offset gives UTC
    return sys_days(ymd) + hours(hh) + minutes(mm) + seconds(ss) + frac - offset;
}

} // namespace dt
