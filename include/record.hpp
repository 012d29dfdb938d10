#pragma once
#include <string>
#include "jsonhlp.hpp"
#include "ulid.hpp"

/****************** RECORD FIELD NAMES */
#define K_TS  "timestamp"
#define K_RND "random"

// Mutually exclusive payload switches of the `random` command.
struct GenerateFlags {
    bool zeroed = false; // fill the payload with zeros
    bool oned = false;   // fill the payload with ones
};

/**
 * @brief Picks the payload mode from the switches and an optional explicit value.
 *
 * zeroed and oned together throw ConflictingOptions. Either switch wins over
 * @p random. Without switches a string @p random must be an unsigned decimal
 * (NumericParse otherwise) and an integer is taken as its 128 bit two's
 * complement. No switches and no value means Random.
 */
PayloadMode selected_payload(const GenerateFlags& flags, const jval* random = nullptr);

/**
 * @brief Resolves a `random` command input into generate options.
 *
 * Accepted shapes:
 *  - nullptr or null: now
 *  - string: a date-time (see dt::parse), InvalidDate if it is not one
 *  - object with optional K_TS (date-time string) and K_RND (decimal string or integer)
 * Anything else throws InvalidInputType.
 */
GenerateOptions resolve_options(const jval* input, const GenerateFlags& flags);

/**
 * @brief Same as above for raw command-line text.
 *
 * Empty text means no input. Text that is not JSON is read as a bare
 * date-time, so `2024-03-19T11:46:00` works without quotes.
 */
GenerateOptions resolve_options(const std::string& input, const GenerateFlags& flags);

// Resolves the input and formats the new ULID.
std::string random_ulid(const std::string& input, const GenerateFlags& flags);

// {"timestamp": "<rfc3339>", "random": "<decimal>"}
void parts_to_json(const UlidParts& parts, jdoc& doc);

// Parses ULID text and returns its parts as a JSON record; throws Malformed.
std::string parse_ulid(const std::string& text, bool pretty = false);
