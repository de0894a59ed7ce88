#pragma once

#include "core/error.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// ASMHOM_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace asmhom {

// Exit codes shared by the command-line tools
inline constexpr int kExitOk = 0;
inline constexpr int kExitUserError = 1;
inline constexpr int kExitSystemError = 2;

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, ASMHOM_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose flags.
inline Logger make_logger(const CliParser& cli) {
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo);
}

// Resolve thread count from CLI (0 or negative → hardware_concurrency).
inline int resolve_threads(const CliParser& cli,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    return n;
}

// Print a failed operation for a command-line user and return the exit code.
// User errors show their message; system errors were logged in full where
// they occurred and are reported generically.
inline int report_error(const Error& err) {
    if (is_user_error(err.kind)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return kExitUserError;
    }
    std::fprintf(stderr, "Error: internal failure (%s); see log for details\n",
                 error_kind_name(err.kind));
    return kExitSystemError;
}

} // namespace asmhom
