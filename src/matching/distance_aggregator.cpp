#include "matching/distance_aggregator.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace asmhom {

bool compute_distances(CapabilityInstance& impl,
                       const SketchDatabase& query,
                       const std::vector<Namespace>& namespaces,
                       int return_count,
                       bool strict,
                       std::vector<DistanceRecord>& out,
                       Error& err) {
    std::vector<SketchDatabase> dbs;
    dbs.reserve(namespaces.size());
    for (const auto& ns : namespaces) {
        dbs.push_back(ns.sketch_db);
    }

    DistanceSet dists;
    Error impl_err;
    if (!impl.compute_distances(query, dbs, return_count, strict, dists, impl_err)) {
        std::string name = impl.implementation_info().name;
        err = make_error(ErrorKind::kCapabilityFailure,
                         "Unexpected error running implementation " + name +
                         ": " + impl_err.message);
        err.implementation = name;
        err.namespace_id = impl_err.namespace_id;
        err.tool_output = impl_err.tool_output;
        return false;
    }

    // Capability warnings are dropped; parameter drift warnings come from
    // the compatibility check.
    std::vector<DistanceRecord> d = std::move(dists.distances);
    std::sort(d.begin(), d.end(), distance_less);
    if (d.size() > static_cast<size_t>(return_count)) {
        d.resize(static_cast<size_t>(return_count));
    }
    out = std::move(d);
    return true;
}

bool join_metadata(const Store& store,
                   const std::vector<Namespace>& namespaces,
                   const std::vector<DistanceRecord>& distances,
                   std::vector<MatchResult>& out,
                   Error& err) {
    std::unordered_map<std::string, const Namespace*> id_to_ns;
    for (const auto& ns : namespaces) {
        id_to_ns[ns.id] = &ns;
    }

    // One metadata batch per namespace
    std::map<std::string, std::vector<std::string>> ids;
    for (const auto& d : distances) {
        if (id_to_ns.count(d.reference_db) == 0) {
            err = make_error(ErrorKind::kDataCorruption,
                             "Distance record references unknown sketch database " +
                             d.reference_db);
            err.namespace_id = d.reference_db;
            return false;
        }
        ids[d.reference_db].push_back(d.sequence_id);
    }

    std::unordered_map<std::string, std::unordered_map<std::string, SequenceMetadata>> meta;
    for (auto& [ns_id, seq_ids] : ids) {
        const Namespace& ns = *id_to_ns[ns_id];
        std::sort(seq_ids.begin(), seq_ids.end());
        seq_ids.erase(std::unique(seq_ids.begin(), seq_ids.end()), seq_ids.end());

        std::vector<SequenceMetadata> batch;
        Error store_err;
        if (!store.get_sequence_metadata(ns.id, ns.load_id, seq_ids, batch, store_err)) {
            if (store_err.kind == ErrorKind::kNoSuchSequence) {
                err = make_error(ErrorKind::kDataCorruption,
                                 "Database is corrupt. Unable to find sequences from "
                                 "sketch file for namespace " + ns.id + ": " +
                                 store_err.message);
                err.namespace_id = ns.id;
                return false;
            }
            // Distances are already computed, so any store failure is fatal.
            err = make_error(ErrorKind::kStorageFailure,
                             "Unable to fetch sequence metadata for namespace " + ns.id +
                             " (" + error_kind_name(store_err.kind) + "): " +
                             store_err.message);
            err.namespace_id = ns.id;
            err.implementation = store_err.implementation;
            err.tool_output = store_err.tool_output;
            return false;
        }
        auto& m = meta[ns_id];
        for (auto& s : batch) {
            std::string id = s.id;
            m.emplace(std::move(id), std::move(s));
        }
    }

    std::vector<MatchResult> results;
    results.reserve(distances.size());
    for (const auto& d : distances) {
        const auto& m = meta[d.reference_db];
        auto it = m.find(d.sequence_id);
        if (it == m.end()) {
            err = make_error(ErrorKind::kDataCorruption,
                             "Database is corrupt. Sequence " + d.sequence_id +
                             " from the sketch file has no metadata in namespace " +
                             d.reference_db);
            err.namespace_id = d.reference_db;
            return false;
        }
        MatchResult r;
        r.namespace_id = d.reference_db;
        r.distance = d;
        r.metadata = it->second;
        results.push_back(std::move(r));
    }
    out = std::move(results);
    return true;
}

} // namespace asmhom
