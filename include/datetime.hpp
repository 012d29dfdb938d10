#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using sys_ms = std::chrono::sys_time<std::chrono::milliseconds>;

namespace dt {

    // Milliseconds since the Unix epoch, clamped to 0 for earlier points.
    uint64_t unix_millis(sys_ms tp);

    // Wall clock truncated to milliseconds.
    sys_ms now();

    sys_ms from_unix_millis(uint64_t ms);

    // RFC 3339 in UTC with millisecond precision: 2024-03-19T11:46:00.000+00:00
    std::string to_rfc3339(sys_ms tp);

    /**
     * @brief Parses an ISO 8601 / RFC 3339 date-time.
     *
     * Accepted: YYYY-MM-DD (or a five digit year up to the ULID limit), then optionally 'T' or ' ' followed by HH:MM,
     * HH:MM:SS, or HH:MM:SS.fraction, then optionally 'Z' or an offset
     * (+HH:MM, -HH:MM, +HHMM). Values without an offset are UTC.
     * Fractions below one millisecond are dropped.
     *
     * @return the instant, or nullopt when the text is not a valid date-time
     */
    std::optional<sys_ms> parse(std::string_view text);

} // namespace dt
