#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace asmhom {

// Check whether `target` can be queried by `query`.
// strict: all sketch parameters must match exactly.
// lenient: tolerable parameter drift is appended to `warnings` instead.
// Returns false and sets reason if the sketches cannot be compared.
bool check_query_compatibility(const SketchDatabase& target,
                               const SketchDatabase& query,
                               bool strict,
                               std::vector<std::string>& warnings,
                               std::string& reason);

// Human readable summary of a parameter set, e.g. "k=21 size=1000 seed=42".
std::string describe_parameters(const ParameterSet& params);

} // namespace asmhom
