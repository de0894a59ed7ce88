#include "capability/mash_capability.hpp"

#include <algorithm>
#include <set>

#include <tbb/task_group.h>

#include "capability/mash_output.hpp"
#include "util/subprocess.hpp"

namespace asmhom {

MashProvider::MashProvider(std::string mash_path, Logger logger)
    : mash_path_(std::move(mash_path)), logger_(logger) {}

bool MashProvider::instantiate(const std::string& temp_dir,
                               std::unique_ptr<CapabilityInstance>& out,
                               Error& err) const {
    std::vector<std::string> argv = {mash_path_, "--version"};
    ProcessResult pr;
    std::string run_err;
    if (!run_process(argv, temp_dir, pr, run_err)) {
        err = make_error(ErrorKind::kCapabilityInit,
                         "Unable to run mash: " + run_err);
        err.implementation = kMashImplementationName;
        return false;
    }
    std::string version = parse_mash_version(pr.stdout_text);
    if (version.empty()) version = parse_mash_version(pr.stderr_text);
    if (pr.exit_code != 0 || version.empty()) {
        err = make_error(ErrorKind::kCapabilityInit,
                         "Unable to determine mash version (exit code " +
                         std::to_string(pr.exit_code) + ")");
        err.implementation = kMashImplementationName;
        err.tool_output = pr.stderr_text;
        return false;
    }
    out = std::make_unique<MashInstance>(mash_path_, version, temp_dir, logger_);
    return true;
}

MashInstance::MashInstance(std::string mash_path, std::string version,
                           std::string temp_dir, Logger logger)
    : mash_path_(std::move(mash_path)),
      version_(std::move(version)),
      temp_dir_(std::move(temp_dir)),
      logger_(logger) {}

ImplementationInfo MashInstance::implementation_info() const {
    return ImplementationInfo{kMashImplementationName, version_};
}

bool MashInstance::load_sketch_database(const std::string& name,
                                        const std::string& location,
                                        SketchDatabase& out,
                                        Error& err) {
    std::vector<std::string> argv = {mash_path_, "info", "-H", location};
    ProcessResult pr;
    std::string run_err;
    if (!run_process(argv, temp_dir_, pr, run_err)) {
        err = make_error(ErrorKind::kCapabilityFailure, run_err);
        err.implementation = kMashImplementationName;
        return false;
    }

    if (pr.exit_code != 0) {
        if (mash_stderr_indicates_not_a_sketch(pr.stderr_text)) {
            err = make_error(ErrorKind::kNotASketch,
                             "File " + location + " is not a mash sketch");
        } else {
            err = make_error(ErrorKind::kCapabilityFailure,
                             "mash info failed with exit code " +
                             std::to_string(pr.exit_code) + " for " + location);
        }
        err.implementation = kMashImplementationName;
        err.tool_output = pr.stderr_text;
        return false;
    }

    SketchDatabase db;
    std::string parse_err;
    if (!parse_mash_info_header(pr.stdout_text, db.params, db.sequence_count,
                                parse_err)) {
        err = make_error(ErrorKind::kNotASketch,
                         "File " + location + " is not a mash sketch: " + parse_err);
        err.implementation = kMashImplementationName;
        err.tool_output = pr.stdout_text + pr.stderr_text;
        return false;
    }
    db.name = name;
    db.implementation = kMashImplementationName;
    db.location = location;
    out = std::move(db);
    return true;
}

bool MashInstance::compute_distances(const SketchDatabase& query,
                                     const std::vector<SketchDatabase>& targets,
                                     int count,
                                     bool /*strict*/,
                                     DistanceSet& out,
                                     Error& err) {
    // mash itself reduces differing sketch sizes to the smaller one, so the
    // invocation is the same in both modes; parameters were checked upstream.
    struct TargetRun {
        ProcessResult result;
        std::string run_error;
        bool started = false;
    };
    std::vector<TargetRun> runs(targets.size());

    tbb::task_group tg;
    for (size_t i = 0; i < targets.size(); i++) {
        tg.run([&, i] {
            // mash dist <reference> <query>: reference IDs come first in the output
            std::vector<std::string> argv = {
                mash_path_, "dist", targets[i].location, query.location};
            runs[i].started = run_process(argv, temp_dir_, runs[i].result,
                                          runs[i].run_error);
        });
    }
    tg.wait();

    std::vector<DistanceRecord> all;
    std::set<std::string> warnings;
    for (size_t i = 0; i < targets.size(); i++) {
        const auto& run = runs[i];
        if (!run.started) {
            err = make_error(ErrorKind::kCapabilityFailure, run.run_error);
            err.implementation = kMashImplementationName;
            err.namespace_id = targets[i].name;
            return false;
        }
        if (run.result.exit_code != 0) {
            err = make_error(ErrorKind::kCapabilityFailure,
                             "mash dist failed with exit code " +
                             std::to_string(run.result.exit_code) +
                             " against " + targets[i].location);
            err.implementation = kMashImplementationName;
            err.namespace_id = targets[i].name;
            err.tool_output = run.result.stderr_text;
            return false;
        }

        std::string parse_err;
        if (!parse_mash_dist_output(run.result.stdout_text, targets[i].name, all,
                                    parse_err)) {
            err = make_error(ErrorKind::kCapabilityFailure, parse_err);
            err.implementation = kMashImplementationName;
            err.namespace_id = targets[i].name;
            return false;
        }

        std::vector<std::string> w = parse_mash_warnings(run.result.stderr_text);
        warnings.insert(w.begin(), w.end());
    }

    size_t keep = std::min(all.size(), static_cast<size_t>(std::max(count, 0)));
    std::partial_sort(all.begin(), all.begin() + keep, all.end(), distance_less);
    all.resize(keep);

    logger_.debug("mash dist: %zu target(s), %zu record(s) kept",
                  targets.size(), all.size());

    out.distances = std::move(all);
    out.warnings.assign(warnings.begin(), warnings.end());
    return true;
}

} // namespace asmhom
