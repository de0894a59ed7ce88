#include "matching/query_loader.hpp"

#include "core/config.hpp"

namespace asmhom {

bool load_query_sketch(CapabilityInstance& impl,
                       const std::string& path,
                       const Logger& logger,
                       SketchDatabase& out,
                       Error& err) {
    SketchDatabase query;
    Error load_err;
    if (!impl.load_sketch_database(kQueryDbName, path, query, load_err)) {
        if (load_err.kind == ErrorKind::kNotASketch) {
            if (!load_err.tool_output.empty()) {
                logger.error("%s implementation stderr:\n%s",
                             load_err.implementation.c_str(),
                             load_err.tool_output.c_str());
            }
            err = make_error(ErrorKind::kInvalidSketch,
                             "The input sketch is not a valid sketch.");
            err.implementation = load_err.implementation;
            return false;
        }
        err = make_error(ErrorKind::kCapabilityFailure,
                         "Error loading query sketch database: " + load_err.message);
        err.implementation = load_err.implementation;
        err.tool_output = load_err.tool_output;
        return false;
    }

    if (query.sequence_count != 1) {
        err = make_error(ErrorKind::kInvalidSketch,
                         "Query sketch database must have exactly one sketch");
        err.implementation = query.implementation;
        return false;
    }
    out = std::move(query);
    return true;
}

} // namespace asmhom
