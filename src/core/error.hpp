#pragma once

#include <string>
#include <utility>

namespace asmhom {

enum class ErrorKind {
    kNone = 0,

    // User input errors
    kInvalidArgument,
    kNoSuchNamespace,
    kInvalidSketch,
    kIncompatibleNamespaces,
    kIncompatibleSketches,

    // Collaborator-level signals, reinterpreted by the engine
    kNoSuchSequence,
    kNotASketch,
    kNoSuchImplementation,
    kDuplicateImplementation,

    // System errors
    kStorageFailure,
    kCapabilityInit,
    kCapabilityFailure,
    kMisconfigured,
    kDataCorruption,
};

struct Error {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;
    std::string namespace_id;    // namespace the error concerns, if any
    std::string implementation;  // capability name, if any
    std::string tool_output;     // diagnostic output of an external tool; never user facing

    explicit operator bool() const { return kind != ErrorKind::kNone; }
};

inline Error make_error(ErrorKind kind, std::string message) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}

// True for errors caused by the caller's input, false for system errors.
inline bool is_user_error(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidArgument:
        case ErrorKind::kNoSuchNamespace:
        case ErrorKind::kInvalidSketch:
        case ErrorKind::kIncompatibleNamespaces:
        case ErrorKind::kIncompatibleSketches:
            return true;
        default:
            return false;
    }
}

const char* error_kind_name(ErrorKind kind);

} // namespace asmhom
