#pragma once

#include <memory>
#include <string>

#include "core/error.hpp"
#include "matching/match_engine.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

namespace asmhom {

struct EngineOptions {
    std::string store_dir;   // -store (required)
    std::string temp_root;   // -temp_dir (default: $TMPDIR or /tmp)
    std::string mash_path;   // -mash (default: mash)
};

// Read the options shared by all tools. Returns false and sets error_msg
// if a required option is missing.
bool parse_engine_options(const CliParser& cli, EngineOptions& opts,
                          std::string& error_msg);

// Open the store, register the built-in capabilities and build the engine.
// Failures are logged and returned in err.
std::unique_ptr<MatchEngine> build_engine(const EngineOptions& opts,
                                          const Logger& logger,
                                          Error& err);

} // namespace asmhom
