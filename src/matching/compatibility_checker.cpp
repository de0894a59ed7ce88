#include "matching/compatibility_checker.hpp"

#include <set>

#include "core/sketch_compat.hpp"

namespace asmhom {

const CapabilityProvider* resolve_implementation(const std::vector<Namespace>& namespaces,
                                                 const CapabilityRegistry& registry,
                                                 Error& err) {
    std::set<std::string> names;
    for (const auto& ns : namespaces) {
        names.insert(to_lower(ns.sketch_db.implementation));
    }
    if (names.size() != 1) {
        err = make_error(ErrorKind::kIncompatibleNamespaces,
                         "The selected namespaces must share the same implementation");
        return nullptr;
    }

    const std::string& impl = *names.begin();
    Error lookup_err;
    const CapabilityProvider* provider = registry.lookup(impl, lookup_err);
    if (!provider) {
        err = make_error(ErrorKind::kMisconfigured,
                         "Application is misconfigured. Implementation " + impl +
                         " stored in database but not available.");
        err.implementation = impl;
        return nullptr;
    }
    return provider;
}

bool check_namespace_compatibility(const std::vector<Namespace>& namespaces,
                                   const SketchDatabase& query,
                                   bool strict,
                                   std::vector<std::string>& warnings,
                                   Error& err) {
    for (const auto& ns : namespaces) {
        std::vector<std::string> ns_warnings;
        std::string reason;
        if (!check_query_compatibility(ns.sketch_db, query, strict, ns_warnings, reason)) {
            err = make_error(ErrorKind::kIncompatibleSketches,
                             "Unable to query namespace " + ns.id +
                             " with input sketch: " + reason);
            err.namespace_id = ns.id;
            err.implementation = ns.sketch_db.implementation;
            return false;
        }
        for (const auto& w : ns_warnings) {
            warnings.push_back("Namespace " + ns.id + ": " + w);
        }
    }
    return true;
}

} // namespace asmhom
