#pragma once

#include <string>

#include "capability/capability.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace asmhom {

// Load the untrusted query sketch at `path` as a database named kQueryDbName.
// Fails with kInvalidSketch if the capability does not recognise the file
// or the database does not hold exactly one sequence; the tool's diagnostic
// output is logged, never copied into the error message. Any other
// capability failure is returned as kCapabilityFailure.
bool load_query_sketch(CapabilityInstance& impl,
                       const std::string& path,
                       const Logger& logger,
                       SketchDatabase& out,
                       Error& err);

} // namespace asmhom
