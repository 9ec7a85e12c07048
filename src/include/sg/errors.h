#pragma once

#include <sg/field_path.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace sg {

// Per-field violation kinds. The string forms are part of the report format.
enum class ErrorKind {
    MissingField,
    TypeMismatch,
    InvalidEmail,
    InvalidDate,
    PatternMismatch,
    OutOfRange,
    NotInEnum,
    LengthViolation,
    InvalidName,
    UnexpectedField,
    SchemaError
};

std::string to_string(ErrorKind kind);

struct FieldError {
    FieldPath path;
    ErrorKind kind = ErrorKind::TypeMismatch;
    std::string message;
    std::string suggestion;

    bool operator==(const FieldError& rhs) const {
        return path == rhs.path && kind == rhs.kind && message == rhs.message && suggestion == rhs.suggestion;
    }
    bool operator!=(const FieldError& rhs) const { return !(*this == rhs); }

    // {"loc": [...], "type": "...", "msg": "...", "suggestion": "..."}
    Dictionary to_dictionary() const;
};

// A schema description that cannot be turned into validators. Raised before
// any payload data is looked at.
struct CompilationError : public std::runtime_error {
    FieldPath path;
    CompilationError(const std::string& msg, FieldPath p) : std::runtime_error(msg), path(std::move(p)) {}
};

// Lookup of a named schema failed (unknown name, unreadable or malformed file).
struct SchemaSourceError : public std::runtime_error {
    explicit SchemaSourceError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace sg
