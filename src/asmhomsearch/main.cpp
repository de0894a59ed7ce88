#include "core/config.hpp"
#include "core/version.hpp"
#include "io/result_writer.hpp"
#include "matching/engine_setup.hpp"
#include "matching/match_engine.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace asmhom;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -store <dir>             Document store root directory\n"
        "  -namespaces <id,...>     Namespace(s) to search (repeatable)\n"
        "  -query <path>            Query sketch file (exactly one sequence)\n"
        "\n"
        "Options:\n"
        "  -max <int>               Number of results, 1-%d (default: %d)\n"
        "  -not_strict              Tolerate sketch parameter drift\n"
        "  -outfmt <tab|json>       Output format (default: tab)\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -temp_dir <dir>          Root for temporary files (default: $TMPDIR or /tmp)\n"
        "  -mash <path>             mash executable (default: mash)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -h, --help               Show this help\n"
        "  --version                Show version\n",
        prog, kMaxReturnCount, kDefaultReturnCount);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "asmhomsearch")) return kExitOk;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return kExitOk;
    }

    Logger logger = make_logger(cli);

    EngineOptions opts;
    std::string error_msg;
    if (!parse_engine_options(cli, opts, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        print_usage(argv[0]);
        return kExitUserError;
    }

    MatchRequest req;
    req.namespace_ids = cli.get_list("-namespaces");
    req.query_path = cli.get_string("-query");
    req.return_count = cli.get_int("-max", kDefaultReturnCount);
    req.strict = !cli.has("-not_strict");
    if (req.namespace_ids.empty() || req.query_path.empty()) {
        std::fprintf(stderr, "Error: -namespaces and -query are required\n");
        print_usage(argv[0]);
        return kExitUserError;
    }

    OutputFormat fmt = OutputFormat::kTab;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), fmt, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        return kExitUserError;
    }

    Error err;
    auto engine = build_engine(opts, logger, err);
    if (!engine) return report_error(err);

    SequenceMatches matches;
    if (!engine->measure_distance(req, matches, err)) {
        return report_error(err);
    }

    std::string out_path = cli.get_string("-o");
    if (out_path.empty()) {
        write_matches(std::cout, matches, fmt);
        std::cout.flush();
    } else {
        std::ofstream out(out_path);
        if (!out.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", out_path.c_str());
            return kExitUserError;
        }
        write_matches(out, matches, fmt);
    }

    for (const auto& w : matches.warnings) {
        logger.warn("%s", w.c_str());
    }
    return kExitOk;
}
