#include "core/error.hpp"

namespace asmhom {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:                    return "none";
        case ErrorKind::kInvalidArgument:         return "invalid_argument";
        case ErrorKind::kNoSuchNamespace:         return "no_such_namespace";
        case ErrorKind::kInvalidSketch:           return "invalid_sketch";
        case ErrorKind::kIncompatibleNamespaces:  return "incompatible_namespaces";
        case ErrorKind::kIncompatibleSketches:    return "incompatible_sketches";
        case ErrorKind::kNoSuchSequence:          return "no_such_sequence";
        case ErrorKind::kNotASketch:              return "not_a_sketch";
        case ErrorKind::kNoSuchImplementation:    return "no_such_implementation";
        case ErrorKind::kDuplicateImplementation: return "duplicate_implementation";
        case ErrorKind::kStorageFailure:          return "storage_failure";
        case ErrorKind::kCapabilityInit:          return "capability_init";
        case ErrorKind::kCapabilityFailure:       return "capability_failure";
        case ErrorKind::kMisconfigured:           return "misconfigured";
        case ErrorKind::kDataCorruption:          return "data_corruption";
    }
    return "unknown";
}

} // namespace asmhom
