#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capability/capability_registry.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "store/store.hpp"
#include "util/logger.hpp"

namespace asmhom {

struct MatchRequest {
    std::vector<std::string> namespace_ids;  // duplicates are ignored
    std::string query_path;                  // untrusted sketch file
    int return_count = kDefaultReturnCount;  // outside [1, kMaxReturnCount] -> default
    bool strict = true;
};

// Matches a query sketch against the sketch databases of one or more
// namespaces and joins the nearest hits to stored sequence metadata.
//
// The engine holds no per-request state; const members may be called
// concurrently. Each measure_distance() call works in its own temporary
// directory under temp_root, removed before the call returns.
class MatchEngine {
public:
    MatchEngine(std::shared_ptr<const Store> store,
                std::shared_ptr<const CapabilityRegistry> registry,
                std::string temp_root,
                Logger logger = Logger(Logger::kInfo));

    bool get_namespaces(std::vector<Namespace>& out, Error& err) const;

    // Namespaces for the given IDs, sorted by ID. Fails with
    // kInvalidArgument for malformed IDs, kNoSuchNamespace for unknown ones.
    bool get_namespaces(const std::vector<std::string>& ids,
                        std::vector<Namespace>& out, Error& err) const;

    bool get_namespace(const std::string& id, Namespace& out, Error& err) const;

    // Fails with kNoSuchImplementation for unregistered names.
    bool expected_file_extension(const std::string& implementation,
                                 std::optional<std::string>& out,
                                 Error& err) const;

    // Run a distance search. On failure err.kind tells user errors
    // (is_user_error) from system errors; system errors are logged here
    // with full detail.
    bool measure_distance(const MatchRequest& req,
                          SequenceMatches& out,
                          Error& err) const;

    const CapabilityRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const Store> store_;
    std::shared_ptr<const CapabilityRegistry> registry_;
    std::string temp_root_;
    Logger logger_;

    bool run_measure(const MatchRequest& req, SequenceMatches& out, Error& err) const;
    void log_failure(const Error& err) const;
};

} // namespace asmhom
