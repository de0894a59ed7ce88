#include "matching/match_engine.hpp"

#include <algorithm>
#include <set>

#include "matching/compatibility_checker.hpp"
#include "matching/distance_aggregator.hpp"
#include "matching/query_loader.hpp"
#include "matching/response_assembler.hpp"
#include "util/temp_dir.hpp"

namespace asmhom {

MatchEngine::MatchEngine(std::shared_ptr<const Store> store,
                         std::shared_ptr<const CapabilityRegistry> registry,
                         std::string temp_root,
                         Logger logger)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      temp_root_(std::move(temp_root)),
      logger_(logger) {}

bool MatchEngine::get_namespaces(std::vector<Namespace>& out, Error& err) const {
    return store_->list_namespaces(out, err);
}

bool MatchEngine::get_namespaces(const std::vector<std::string>& ids,
                                 std::vector<Namespace>& out, Error& err) const {
    std::set<std::string> unique(ids.begin(), ids.end());
    std::vector<Namespace> result;
    result.reserve(unique.size());
    for (const auto& id : unique) {
        if (!is_valid_namespace_id(id)) {
            err = make_error(ErrorKind::kInvalidArgument, "Illegal namespace ID: " + id);
            err.namespace_id = id;
            return false;
        }
        // add a bulk lookup to the store if this proves too slow
        Namespace ns;
        if (!store_->get_namespace(id, ns, err)) return false;
        result.push_back(std::move(ns));
    }
    out = std::move(result);
    return true;
}

bool MatchEngine::get_namespace(const std::string& id, Namespace& out, Error& err) const {
    if (!is_valid_namespace_id(id)) {
        err = make_error(ErrorKind::kInvalidArgument, "Illegal namespace ID: " + id);
        err.namespace_id = id;
        return false;
    }
    return store_->get_namespace(id, out, err);
}

bool MatchEngine::expected_file_extension(const std::string& implementation,
                                          std::optional<std::string>& out,
                                          Error& err) const {
    return registry_->expected_file_extension(implementation, out, err);
}

bool MatchEngine::measure_distance(const MatchRequest& req,
                                   SequenceMatches& out,
                                   Error& err) const {
    if (run_measure(req, out, err)) return true;
    log_failure(err);
    return false;
}

bool MatchEngine::run_measure(const MatchRequest& req,
                              SequenceMatches& out,
                              Error& err) const {
    if (req.namespace_ids.empty()) {
        err = make_error(ErrorKind::kInvalidArgument, "No namespace IDs provided");
        return false;
    }
    if (req.query_path.empty()) {
        err = make_error(ErrorKind::kInvalidArgument, "No query sketch provided");
        return false;
    }
    int return_count = sanitize_return_count(req.return_count);

    std::vector<Namespace> namespaces;
    if (!get_namespaces(req.namespace_ids, namespaces, err)) return false;

    const CapabilityProvider* provider =
        resolve_implementation(namespaces, *registry_, err);
    if (!provider) return false;

    ScopedTempDir temp_dir;
    std::string temp_err;
    if (!temp_dir.create(temp_root_, "asmhom_req_", temp_err)) {
        err = make_error(ErrorKind::kMisconfigured,
                         "Unable to create request temp directory: " + temp_err);
        return false;
    }

    std::unique_ptr<CapabilityInstance> impl;
    Error init_err;
    if (!provider->instantiate(temp_dir.path(), impl, init_err)) {
        err = make_error(ErrorKind::kMisconfigured,
                         "Application is misconfigured. Error attempting to build the " +
                         provider->implementation_name() + " implementation: " +
                         init_err.message);
        err.implementation = provider->implementation_name();
        err.tool_output = init_err.tool_output;
        return false;
    }

    SketchDatabase query;
    if (!load_query_sketch(*impl, req.query_path, logger_, query, err)) return false;

    std::vector<std::string> warnings;
    if (!check_namespace_compatibility(namespaces, query, req.strict, warnings, err)) {
        return false;
    }

    std::vector<DistanceRecord> distances;
    if (!compute_distances(*impl, query, namespaces, return_count, req.strict,
                           distances, err)) {
        return false;
    }

    std::vector<MatchResult> matches;
    if (!join_metadata(*store_, namespaces, distances, matches, err)) return false;

    logger_.debug("measure_distance: %zu namespace(s), count %d, strict %d: "
                  "%zu match(es), %zu warning(s)",
                  namespaces.size(), return_count, req.strict ? 1 : 0,
                  matches.size(), warnings.size());

    out = assemble_response(std::move(namespaces), impl->implementation_info(),
                            std::move(matches), std::move(warnings));
    return true;
}

void MatchEngine::log_failure(const Error& err) const {
    if (is_user_error(err.kind)) {
        logger_.debug("measure_distance rejected (%s): %s",
                      error_kind_name(err.kind), err.message.c_str());
        return;
    }
    logger_.error("measure_distance failed (%s): %s%s%s%s%s",
                  error_kind_name(err.kind), err.message.c_str(),
                  err.namespace_id.empty() ? "" : " namespace=",
                  err.namespace_id.c_str(),
                  err.implementation.empty() ? "" : " implementation=",
                  err.implementation.c_str());
    if (!err.tool_output.empty()) {
        logger_.error("tool output:\n%s", err.tool_output.c_str());
    }
}

} // namespace asmhom
