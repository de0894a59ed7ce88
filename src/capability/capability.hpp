#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace asmhom {

struct DistanceSet {
    std::vector<DistanceRecord> distances;
    std::vector<std::string> warnings;
};

// A comparison capability bound to one request's temporary directory.
// Instances are request scoped and used from a single thread.
class CapabilityInstance {
public:
    virtual ~CapabilityInstance() = default;

    virtual ImplementationInfo implementation_info() const = 0;

    // Load the sketch database at `location` and tag it with `name`.
    // Fails with kNotASketch (tool output in err.tool_output) if the file is
    // not a sketch of this capability's format, kCapabilityFailure otherwise.
    virtual bool load_sketch_database(const std::string& name,
                                      const std::string& location,
                                      SketchDatabase& out,
                                      Error& err) = 0;

    // Compute distances from the single-sequence `query` to every sequence in
    // `targets`, returning at most `count` nearest records across all targets.
    // Fails with kCapabilityFailure.
    virtual bool compute_distances(const SketchDatabase& query,
                                   const std::vector<SketchDatabase>& targets,
                                   int count,
                                   bool strict,
                                   DistanceSet& out,
                                   Error& err) = 0;
};

// Factory for capability instances, one per implementation name.
class CapabilityProvider {
public:
    virtual ~CapabilityProvider() = default;

    virtual std::string implementation_name() const = 0;

    // Hint for naming uploaded files, e.g. ".msh". No effect on validation.
    virtual std::optional<std::string> expected_file_extension() const = 0;

    // Fails with kCapabilityInit on environment or setup problems.
    virtual bool instantiate(const std::string& temp_dir,
                             std::unique_ptr<CapabilityInstance>& out,
                             Error& err) const = 0;
};

} // namespace asmhom
