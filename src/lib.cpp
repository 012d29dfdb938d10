#include "lib.hpp"
#include <vector>
#include <sstream>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInputType  : return "invalid input";
        case ErrorKind::Malformed         : return "malformed ulid";
        case ErrorKind::NumericParse      : return "invalid number";
        case ErrorKind::ConflictingOptions: return "flag error";
        case ErrorKind::InvalidDate       : return "invalid date";
    }
    return "error";
}

// Formats a printf-style message, tags it with the call site and throws ulid_error.
void error(ErrorKind kind, const char* file, int line, const char* msg, ...) {
    va_list args;
    va_start(args, msg);

    // Two passes: size the buffer first, then write into it.
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line;

    throw ulid_error(kind, ss.str(), std::string(buffer.data()));
}
