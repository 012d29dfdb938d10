#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include "datetime.hpp"
#include "uint128.hpp"

/**************** payload selection */
enum class PayloadKind { Random, Fixed, Zeros, Ones };

// How the 80 low bits of a new ULID are filled. `value` is read only for Fixed.
struct PayloadMode {
    PayloadKind kind = PayloadKind::Random;
    u128        value = 0;

    static PayloadMode random() { return {PayloadKind::Random, 0}; }
    static PayloadMode fixed(u128 v) { return {PayloadKind::Fixed, v}; }
    static PayloadMode zeros() { return {PayloadKind::Zeros, 0}; }
    static PayloadMode ones() { return {PayloadKind::Ones, 0}; }
};

const char* payload_kind_name(PayloadKind kind);

struct GenerateOptions {
    std::optional<sys_ms> timestamp; // empty = now
    PayloadMode payload;
};

/**************** parsing */
enum class ParseError { None, InvalidLength, InvalidCharacter, Overflow };

const char* parse_error_name(ParseError error);

struct ParseResult; // fw decl

// Timestamp and payload of a ULID in inspection form.
struct UlidParts {
    sys_ms      timestamp;  // UTC
    std::string random;     // payload in base 10
};

/**
 * Universally Unique Lexicographically Sortable Identifier.
 *
 * 128 bits: a 48 bit millisecond Unix timestamp followed by an 80 bit payload.
 * Text form is 26 characters of Crockford's Base32, the first 10 carrying the
 * timestamp. Text order and numeric order agree.
 */
class ULID {
public:
    static constexpr int    TIME_BITS = 48;
    static constexpr int    RAND_BITS = 80;
    static constexpr size_t LENGTH = 26;   // text form
    static constexpr size_t BYTES = 16;    // binary form
    static constexpr size_t TIME_CHARS = 10;
    // Crockford's Base32 alphabet (no I, L, O, U)
    static constexpr const char* CROCKFORD = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    constexpr ULID() = default;
    explicit constexpr ULID(u128 value) : value_(value) {}

    /**
     * @brief Builds a ULID from its two parts.
     *
     * Bits above the field widths are dropped: the timestamp keeps its low 48
     * bits and the payload its low 80 bits.
     */
    static ULID from_parts(uint64_t timestamp_ms, u128 random);

    // Payload drawn from the thread's random source.
    static ULID from_datetime(sys_ms tp);

    static ULID generate(const GenerateOptions& options = {});
    static ULID generate(std::optional<sys_ms> timestamp, PayloadMode payload);

    static ULID nil() { return ULID(); }

    /**
     * @brief Decodes the 26 character text form.
     *
     * Surrounding whitespace is ignored and letters may be in either case.
     * On failure the result carries the error and, for a bad character, its
     * index in @p text.
     */
    static ParseResult parse(std::string_view text);

    // Same as parse() but throws ulid_error(ErrorKind::Malformed) on failure.
    static ULID from_string(std::string_view text);

    static ULID from_bytes(const std::array<uint8_t, BYTES>& bytes);

    // Generate a new ULID string for the current time.
    static std::string get_id() { return generate().to_string(); }

    uint64_t timestamp_ms() const { return static_cast<uint64_t>(value_ >> RAND_BITS); }
    u128 random() const { return value_ & u128hlp::mask(RAND_BITS); }
    u128 value() const { return value_; }
    sys_ms datetime() const { return dt::from_unix_millis(timestamp_ms()); }
    bool is_nil() const { return value_ == 0; }

    std::string to_string() const;
    std::array<uint8_t, BYTES> to_bytes() const;

    bool operator==(const ULID& other) const { return value_ == other.value_; }
    bool operator!=(const ULID& other) const { return value_ != other.value_; }
    bool operator<(const ULID& other) const { return value_ < other.value_; }
    bool operator<=(const ULID& other) const { return value_ <= other.value_; }
    bool operator>(const ULID& other) const { return value_ > other.value_; }
    bool operator>=(const ULID& other) const { return value_ >= other.value_; }

private:
    u128 value_ = 0;
};

struct ParseResult {
    bool       ok{false};
    ULID       ulid{};
    ParseError error{ParseError::None};
    size_t     position{0}; // offending index for InvalidCharacter

    // every failure is some form of malformed text
    bool is_malformed() const { return !ok; }
    explicit operator bool() const { return ok; }
};

inline std::string format(const ULID& ulid) { return ulid.to_string(); }

UlidParts split(const ULID& ulid);

inline std::ostream& operator<<(std::ostream& os, const ULID& ulid) { return os << ulid.to_string(); }

namespace std {
    template<> struct hash<ULID> {
        size_t operator()(const ULID& ulid) const {
            u128 v = ulid.value();
            return std::hash<uint64_t>{}(u128hlp::high(v)) ^ (std::hash<uint64_t>{}(u128hlp::low(v)) << 1);
        }
    };
}
