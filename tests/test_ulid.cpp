#include "catch.hpp"
#include "ulid.hpp"
#include "random.hpp"
#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

using namespace std::chrono;

static const std::string ALPHABET = ULID::CROCKFORD;

TEST_CASE("Known ULID decodes to its timestamp and payload", "[ulid][codec]") {
    ULID u = ULID::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    REQUIRE(u.timestamp_ms() == 1469922850259ULL);
    REQUIRE(u128hlp::to_decimal(u.random()) == "1012768647078601740696923");
    REQUIRE(u.to_string() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST_CASE("from_parts places the timestamp in the first 10 characters", "[ulid][codec]") {
    const uint64_t ts = 1710848760000ULL;
    REQUIRE(ULID::from_parts(ts, 0).to_string() == "01HSB8GP600000000000000000");
    REQUIRE(ULID::from_parts(ts, 12345).to_string() == "01HSB8GP600000000000000C1S");
    REQUIRE(ULID::from_parts(ts, u128hlp::max()).to_string() == "01HSB8GP60ZZZZZZZZZZZZZZZZ");
    REQUIRE(ULID::from_parts(ts + 1, 0).to_string() == "01HSB8GP610000000000000000");
}

TEST_CASE("Extreme values encode with zero padding", "[ulid][codec]") {
    REQUIRE(ULID::nil().to_string() == "00000000000000000000000000");
    REQUIRE(ULID(1).to_string() == "00000000000000000000000001");
    REQUIRE(ULID(u128hlp::max()).to_string() == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(ULID::from_parts((1ULL << 48) - 1, 0).to_string() == "7ZZZZZZZZZ0000000000000000");
}

TEST_CASE("Out of range parts are truncated to their field width", "[ulid][codec]") {
    // bit 48 of the timestamp and bit 80 of the payload are dropped
    ULID u = ULID::from_parts((1ULL << 48) | 7, (static_cast<u128>(1) << 80) | 9);
    REQUIRE(u.timestamp_ms() == 7);
    REQUIRE((u.random() == 9));
    REQUIRE((u.value() == ((static_cast<u128>(7) << 80) | 9)));
}

TEST_CASE("Round trip over random values", "[ulid][codec][roundtrip]") {
    Random rng(42);
    for (int i = 0; i < 500; ++i) {
        ULID u(rng.bits(128));
        std::string text = format(u);
        REQUIRE(text.size() == ULID::LENGTH);
        REQUIRE(std::all_of(text.begin(), text.end(), [](char c) { return ALPHABET.find(c) != std::string::npos; }));
        auto r = ULID::parse(text);
        REQUIRE(r.ok);
        REQUIRE(r.ulid == u);
    }
}

TEST_CASE("Text order follows timestamp order whatever the payload", "[ulid][order]") {
    Random rng(7);
    std::vector<uint64_t> stamps = {0, 1, 999, 1000, 1469922850259ULL, 1710848760000ULL, (1ULL << 48) - 1};
    for (size_t i = 0; i + 1 < stamps.size(); ++i) {
        ULID a = ULID::from_parts(stamps[i], u128hlp::max());
        ULID b = ULID::from_parts(stamps[i + 1], 0);
        REQUIRE(a < b);
        REQUIRE(format(a) < format(b));

        ULID c = ULID::from_parts(stamps[i], rng.bits(80));
        ULID d = ULID::from_parts(stamps[i + 1], rng.bits(80));
        REQUIRE(format(c) < format(d));
    }
}

TEST_CASE("Binary form is 16 big endian bytes", "[ulid][bytes]") {
    ULID u = ULID::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAV");
    auto bytes = u.to_bytes();
    REQUIRE(bytes.size() == ULID::BYTES);
    // 1469922850259 = 0x01563DF36E53
    REQUIRE(bytes[0] == 0x01);
    REQUIRE(bytes[1] == 0x56);
    REQUIRE(bytes[5] == 0x53);
    REQUIRE(ULID::from_bytes(bytes) == u);
}

TEST_CASE("split exposes the date and the decimal payload", "[ulid][split]") {
    ULID u = ULID::from_parts(1710848760000ULL, 12345);
    UlidParts parts = split(u);
    REQUIRE(parts.timestamp.time_since_epoch().count() == 1710848760000LL);
    REQUIRE(parts.random == "12345");
    REQUIRE(dt::to_rfc3339(parts.timestamp) == "2024-03-19T11:46:00.000+00:00");

    REQUIRE(split(ULID::from_parts(0, u128hlp::max())).random == "1208925819614629174706175");
}

TEST_CASE("ULIDs work as hash keys and stream as text", "[ulid]") {
    std::unordered_set<ULID> set;
    set.insert(ULID::from_parts(1, 1));
    set.insert(ULID::from_parts(1, 1));
    set.insert(ULID::from_parts(1, 2));
    REQUIRE(set.size() == 2);

    std::ostringstream ss;
    ss << ULID::nil();
    REQUIRE(ss.str() == "00000000000000000000000000");
    REQUIRE(ULID::nil().is_nil());
}

TEST_CASE("get_id returns a fresh ULID string", "[ulid]") {
    std::string a = ULID::get_id();
    std::string b = ULID::get_id();
    REQUIRE(a.size() == 26);
    REQUIRE(a != b);
    REQUIRE(ULID::parse(a).ok);
}
