#pragma once

#include <string>
#include <vector>

#include "capability/capability.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "store/store.hpp"

namespace asmhom {

// Invoke the capability once over all namespaces' sketch databases and
// return at most `return_count` records in canonical order (ascending
// distance, then namespace, then sequence ID). `return_count` must already
// be sanitized. Any capability failure is returned as kCapabilityFailure.
bool compute_distances(CapabilityInstance& impl,
                       const SketchDatabase& query,
                       const std::vector<Namespace>& namespaces,
                       int return_count,
                       bool strict,
                       std::vector<DistanceRecord>& out,
                       Error& err);

// Join distance records to their sequence metadata with one store lookup
// per namespace. A record that names an unknown database or a sequence
// missing from the store fails with kDataCorruption; other store failures
// are returned unchanged. Output order follows `distances`.
bool join_metadata(const Store& store,
                   const std::vector<Namespace>& namespaces,
                   const std::vector<DistanceRecord>& distances,
                   std::vector<MatchResult>& out,
                   Error& err);

} // namespace asmhom
