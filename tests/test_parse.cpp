#include "catch.hpp"
#include "lib.hpp"
#include "ulid.hpp"
#include <algorithm>
#include <cctype>
#include <string>

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

TEST_CASE("parse rejects text that is not 26 characters", "[parse][error]") {
    for (const char* text : {"", "short", "01ARZ3NDEKTSV4RRFFQ69G5FA", "01ARZ3NDEKTSV4RRFFQ69G5FAVV"}) {
        auto r = ULID::parse(text);
        REQUIRE_FALSE(r.ok);
        REQUIRE(r.is_malformed());
        REQUIRE(r.error == ParseError::InvalidLength);
    }
}

TEST_CASE("parse rejects characters outside the alphabet", "[parse][error]") {
    auto r = ULID::parse("ILLEGALCHARSxxxxxxxxxxxxxx");
    REQUIRE_FALSE(r);
    REQUIRE(r.error == ParseError::InvalidCharacter);
    REQUIRE(r.position == 0);

    // the excluded letters I, L, O, U in either case
    for (char bad : {'I', 'L', 'O', 'U', 'i', 'l', 'o', 'u', '-', ' ', '*'}) {
        std::string text = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
        text[12] = bad;
        auto res = ULID::parse(text);
        REQUIRE_FALSE(res.ok);
        REQUIRE(res.error == ParseError::InvalidCharacter);
        REQUIRE(res.position == 12);
    }
}

TEST_CASE("parse rejects values above 128 bits", "[parse][error]") {
    REQUIRE(ULID::parse("7ZZZZZZZZZZZZZZZZZZZZZZZZZ").ok);
    auto r = ULID::parse("8ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE_FALSE(r.ok);
    REQUIRE(r.error == ParseError::Overflow);
    REQUIRE(r.is_malformed());
}

TEST_CASE("parse is case insensitive", "[parse]") {
    const std::string text = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
    auto upper = ULID::parse(text);
    auto low = ULID::parse(lower(text));
    auto mixed = ULID::parse("01arZ3NdeKTSv4RRffQ69G5FAV");
    REQUIRE(upper.ok);
    REQUIRE(low.ok);
    REQUIRE(mixed.ok);
    REQUIRE(upper.ulid == low.ulid);
    REQUIRE(upper.ulid == mixed.ulid);
    // re-formatting always yields upper case
    REQUIRE(low.ulid.to_string() == text);
}

TEST_CASE("parse ignores surrounding whitespace", "[parse]") {
    auto r = ULID::parse("  01ARZ3NDEKTSV4RRFFQ69G5FAV\n");
    REQUIRE(r.ok);
    REQUIRE(r.ulid.to_string() == "01ARZ3NDEKTSV4RRFFQ69G5FAV");

    // positions refer to the untrimmed input
    auto bad = ULID::parse("  01ARZ3NDEKTSV4RRFFQ69G5FAU");
    REQUIRE(bad.error == ParseError::InvalidCharacter);
    REQUIRE(bad.position == 27);
}

TEST_CASE("from_string throws a Malformed ulid_error", "[parse][error]") {
    REQUIRE_THROWS_AS(ULID::from_string("short"), ulid_error);
    try {
        ULID::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAU");
        FAIL("expected ulid_error");
    } catch (const ulid_error& e) {
        REQUIRE(e.kind() == ErrorKind::Malformed);
        REQUIRE(e.message().find("01ARZ3NDEKTSV4RRFFQ69G5FAU") != std::string::npos);
        REQUIRE(e.message().find("position 25") != std::string::npos);
        // what() carries the source location as well
        REQUIRE(std::string(e.what()).find("ulid.cpp:") != std::string::npos);
    }
}
