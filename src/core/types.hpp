#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace asmhom {

// Sketch construction parameters. Exactly one of sketch_size / scaling is set.
struct ParameterSet {
    int kmer_size = 0;
    std::optional<uint32_t> sketch_size;
    std::optional<uint32_t> scaling;
    std::optional<uint64_t> hash_seed;
};

struct SketchDatabase {
    std::string name;            // namespace ID, or kQueryDbName for the query
    std::string implementation;  // capability name the database was built with
    std::string location;        // file path
    ParameterSet params;
    uint64_t sequence_count = 0;
};

struct Namespace {
    std::string id;
    std::string load_id;
    std::string data_source_id;
    std::string source_database_id;
    std::string description;
    int64_t modification_time = 0;  // epoch milliseconds
    SketchDatabase sketch_db;
};

struct DistanceRecord {
    std::string reference_db;  // name of the sketch database the sequence belongs to
    std::string sequence_id;
    double distance = 0.0;
};

struct SequenceMetadata {
    std::string id;
    std::string source_id;
    std::optional<std::string> scientific_name;
    std::map<std::string, std::string> related_ids;
    int64_t creation_time = 0;  // epoch milliseconds
};

struct MatchResult {
    std::string namespace_id;
    DistanceRecord distance;
    SequenceMetadata metadata;
};

struct ImplementationInfo {
    std::string name;
    std::string version;
};

struct SequenceMatches {
    std::vector<Namespace> namespaces;
    ImplementationInfo implementation;
    std::vector<MatchResult> matches;
    std::vector<std::string> warnings;  // sorted, unique
};

// Namespace IDs: ASCII letters, digits and underscore, 1..kMaxNamespaceIdLength chars.
inline constexpr size_t kMaxNamespaceIdLength = 256;

inline bool is_valid_namespace_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxNamespaceIdLength) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

// Canonical result order: ascending distance, then namespace, then sequence ID.
inline bool distance_less(const DistanceRecord& a, const DistanceRecord& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    if (a.reference_db != b.reference_db) return a.reference_db < b.reference_db;
    return a.sequence_id < b.sequence_id;
}

} // namespace asmhom
