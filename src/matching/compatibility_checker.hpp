#pragma once

#include <string>
#include <vector>

#include "capability/capability_registry.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

namespace asmhom {

// Resolve the single capability shared by all namespaces' sketch databases.
// Fails with kIncompatibleNamespaces if more than one (case-insensitive)
// implementation name is present, kMisconfigured if the shared name is not
// registered.
const CapabilityProvider* resolve_implementation(const std::vector<Namespace>& namespaces,
                                                 const CapabilityRegistry& registry,
                                                 Error& err);

// Check the query sketch against every namespace's sketch database.
// Resolvable drift (lenient mode only) appends "Namespace <id>: <text>" to
// warnings. Fails with kIncompatibleSketches naming the first namespace that
// cannot be queried.
bool check_namespace_compatibility(const std::vector<Namespace>& namespaces,
                                   const SketchDatabase& query,
                                   bool strict,
                                   std::vector<std::string>& warnings,
                                   Error& err);

} // namespace asmhom
