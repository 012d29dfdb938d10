#include "ulid.hpp"
#include <cctype>
#include "lib.hpp"
#include "random.hpp"

namespace {

    constexpr uint8_t NO_VALUE = 0xFF;

    // Crockford digit values for every byte; upper and lower case map alike.
    constexpr std::array<uint8_t, 256> make_decoding() {
        std::array<uint8_t, 256> table{};
        for (auto& v : table) v = NO_VALUE;
        for (uint8_t i = 0; i < 32; ++i) {
            char c = ULID::CROCKFORD[i];
            table[static_cast<uint8_t>(c)] = i;
            if (c >= 'A' && c <= 'Z') table[static_cast<uint8_t>(c - 'A' + 'a')] = i;
        }
        return table;
    }

    constexpr std::array<uint8_t, 256> DECODING = make_decoding();

    // Largest leading digit: 26 * 5 = 130 bits, the top two must be zero.
    constexpr uint8_t MAX_FIRST_DIGIT = 7;

    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

const char* payload_kind_name(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::Random: return "random";
        case PayloadKind::Fixed : return "fixed";
        case PayloadKind::Zeros : return "zeros";
        case PayloadKind::Ones  : return "ones";
    }
    return "random";
}

const char* parse_error_name(ParseError error) {
    switch (error) {
        case ParseError::None            : return "none";
        case ParseError::InvalidLength   : return "invalid length";
        case ParseError::InvalidCharacter: return "invalid character";
        case ParseError::Overflow        : return "value overflows 128 bits";
    }
    return "none";
}

ULID ULID::from_parts(uint64_t timestamp_ms, u128 random) {
    u128 ts = static_cast<u128>(timestamp_ms) & u128hlp::mask(TIME_BITS);
    u128 rnd = random & u128hlp::mask(RAND_BITS);
    return ULID((ts << RAND_BITS) | rnd);
}

ULID ULID::from_datetime(sys_ms tp) {
    return from_parts(dt::unix_millis(tp), Random::local().bits(RAND_BITS));
}

ULID ULID::generate(const GenerateOptions& options) {
    uint64_t timestamp = dt::unix_millis(options.timestamp ? *options.timestamp : dt::now());

    u128 random = 0;
    switch (options.payload.kind) {
        case PayloadKind::Random: random = Random::local().bits(RAND_BITS); break;
        case PayloadKind::Fixed : random = options.payload.value; break;
        case PayloadKind::Zeros : random = 0; break;
        case PayloadKind::Ones  : random = u128hlp::max(); break;
    }
    return from_parts(timestamp, random);
}

ULID ULID::generate(std::optional<sys_ms> timestamp, PayloadMode payload) {
    return generate(GenerateOptions{timestamp, payload});
}

ParseResult ULID::parse(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    std::string_view s = text.substr(begin, end - begin);

    ParseResult result;
    if (s.size() != LENGTH) {
        result.error = ParseError::InvalidLength;
        return result;
    }

    u128 value = 0;
    for (size_t i = 0; i < LENGTH; ++i) {
        uint8_t digit = DECODING[static_cast<uint8_t>(s[i])];
        if (digit == NO_VALUE) {
            result.error = ParseError::InvalidCharacter;
            result.position = begin + i;
            return result;
        }
        if (i == 0 && digit > MAX_FIRST_DIGIT) {
            result.error = ParseError::Overflow;
            result.position = begin;
            return result;
        }
        value = (value << 5) | digit;
    }

    result.ok = true;
    result.ulid = ULID(value);
    return result;
}

ULID ULID::from_string(std::string_view text) {
    ParseResult r = parse(text);
    if (!r.ok) {
        std::string shown(text);
        if (r.error == ParseError::InvalidCharacter) {
            THROW_AS(ErrorKind::Malformed, "'%s': %s at position %zu", shown.c_str(), parse_error_name(r.error), r.position);
        }
        THROW_AS(ErrorKind::Malformed, "'%s': %s", shown.c_str(), parse_error_name(r.error));
    }
    return r.ulid;
}

ULID ULID::from_bytes(const std::array<uint8_t, BYTES>& bytes) {
    u128 value = 0;
    for (uint8_t b : bytes) value = (value << 8) | b;
    return ULID(value);
}

std::array<uint8_t, ULID::BYTES> ULID::to_bytes() const {
    std::array<uint8_t, BYTES> bytes{};
    // big endian: 6 timestamp bytes, then 10 payload bytes
    for (size_t i = 0; i < BYTES; ++i) {
        bytes[i] = static_cast<uint8_t>(value_ >> (8 * (BYTES - 1 - i)));
    }
    return bytes;
}

std::string ULID::to_string() const {
    const auto bytes = to_bytes();

    // 26 * 5 = 130 bits: the stream starts with two zero pad bits.
    constexpr int PAD_BITS = 2;

    char ulid[LENGTH + 1] = {};
    int bit = 0;
    for (size_t i = 0; i < LENGTH; ++i) {
        int idx = 0;
        for (int j = 0; j < 5; ++j) {
            idx <<= 1;
            int data_bit = bit + j - PAD_BITS;
            if (data_bit < 0) continue;
            int byte_pos = data_bit / 8;
            int bit_pos = 7 - (data_bit % 8);
            idx |= (bytes[byte_pos] >> bit_pos) & 0x01;
        }
        ulid[i] = CROCKFORD[idx];
        bit += 5;
    }
    ulid[LENGTH] = '\0';
    return std::string(ulid);
}

UlidParts split(const ULID& ulid) {
    return UlidParts{ulid.datetime(), u128hlp::to_decimal(ulid.random())};
}
