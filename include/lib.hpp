#pragma once
#include <stdexcept>
#include <string>
#include <cstdarg>
#include <cstdio>

// Failure classes reported by the codec and its host boundary.
enum class ErrorKind { InvalidInputType, Malformed, NumericParse, ConflictingOptions, InvalidDate };

const char* error_kind_name(ErrorKind kind);

class ulid_error : public std::runtime_error {
public:
    ulid_error(ErrorKind kind, const std::string& where, const std::string& message)
        : std::runtime_error(where + ": " + message), kind_(kind), message_(message) {}

    ErrorKind kind() const { return kind_; }
    // message without the file:line prefix, for end users
    const std::string& message() const { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

[[noreturn]] void error(ErrorKind kind, const char* file, int line, const char* msg, ...);
// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW_AS(kind, msg, ...) error(kind, __FILE__, __LINE__, msg, ##__VA_ARGS__)
