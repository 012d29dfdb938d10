#include "record.hpp"
#include <optional>
#include "lib.hpp"

namespace {

    sys_ms to_timestamp(const jval& value) {
        if (!value.IsString()) {
            THROW_AS(ErrorKind::InvalidInputType, "'%s' must be a date, got %s", K_TS, jhlp::type_name(value));
        }
        auto tp = dt::parse(value.GetString());
        if (!tp) {
            THROW_AS(ErrorKind::InvalidDate, "'%s' is not a valid date-time", value.GetString());
        }
        return *tp;
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }
}

PayloadMode selected_payload(const GenerateFlags& flags, const jval* random) {
    if (flags.zeroed && flags.oned) {
        THROW_AS(ErrorKind::ConflictingOptions, "Cannot set --zeroed and --oned at the same time");
    }
    if (flags.zeroed) return PayloadMode::zeros();
    if (flags.oned) return PayloadMode::ones();
    if (random == nullptr) return PayloadMode::random();

    if (random->IsString()) {
        auto v = u128hlp::from_decimal(random->GetString());
        if (!v) {
            THROW_AS(ErrorKind::NumericParse, "'%s' is not an unsigned 128 bit integer", random->GetString());
        }
        return PayloadMode::fixed(*v);
    }
    if (random->IsUint64()) {
        return PayloadMode::fixed(static_cast<u128>(random->GetUint64()));
    }
    if (random->IsInt64()) {
        // negative values wrap to their two's complement
        return PayloadMode::fixed(static_cast<u128>(static_cast<__int128>(random->GetInt64())));
    }
    THROW_AS(ErrorKind::NumericParse, "%s is not a valid number", jhlp::val2str(*random).c_str());
}

GenerateOptions resolve_options(const jval* input, const GenerateFlags& flags) {
    GenerateOptions opts;
    if (input == nullptr || input->IsNull()) {
        opts.payload = selected_payload(flags);
        return opts;
    }
    if (input->IsString()) {
        opts.timestamp = to_timestamp(*input);
        opts.payload = selected_payload(flags);
        return opts;
    }
    if (input->IsObject()) {
        if (const jval* ts = jhlp::find(*input, K_TS)) {
            opts.timestamp = to_timestamp(*ts);
        }
        opts.payload = selected_payload(flags, jhlp::find(*input, K_RND));
        return opts;
    }
    THROW_AS(ErrorKind::InvalidInputType, "Input type of %s is not supported", jhlp::type_name(*input));
}

GenerateOptions resolve_options(const std::string& input, const GenerateFlags& flags) {
    std::string text = trim(input);
    if (text.empty()) return resolve_options(static_cast<const jval*>(nullptr), flags);

    jdoc doc;
    if (jhlp::parse_str(text, doc)) return resolve_options(&doc, flags);

    // not JSON: a bare date-time
    jval date(text.c_str(), doc.GetAllocator());
    return resolve_options(&date, flags);
}

std::string random_ulid(const std::string& input, const GenerateFlags& flags) {
    return ULID::generate(resolve_options(input, flags)).to_string();
}

void parts_to_json(const UlidParts& parts, jdoc& doc) {
    doc.SetObject();
    jhlp::set(doc, K_TS, dt::to_rfc3339(parts.timestamp));
    jhlp::set(doc, K_RND, parts.random);
}

std::string parse_ulid(const std::string& text, bool pretty) {
    ULID ulid = ULID::from_string(text);
    jdoc doc;
    parts_to_json(split(ulid), doc);
    return jhlp::stringify(doc, pretty);
}
