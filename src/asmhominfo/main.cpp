#include "core/version.hpp"
#include "io/result_writer.hpp"
#include "matching/engine_setup.hpp"
#include "matching/match_engine.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace asmhom;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -store <dir>             Document store root directory\n"
        "\n"
        "Options:\n"
        "  -namespaces <id,...>     Show only these namespaces (default: all)\n"
        "  -outfmt <tab|json>       Output format (default: tab)\n"
        "  -mash <path>             mash executable (default: mash)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -h, --help               Show this help\n"
        "  --version                Show version\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "asmhominfo")) return kExitOk;

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

    OutputFormat fmt = OutputFormat::kTab;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), fmt, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        return kExitUserError;
    }

    Error err;
    auto engine = build_engine(opts, logger, err);
    if (!engine) return report_error(err);

    std::vector<Namespace> namespaces;
    std::vector<std::string> ids = cli.get_list("-namespaces");
    bool ok = ids.empty() ? engine->get_namespaces(namespaces, err)
                          : engine->get_namespaces(ids, namespaces, err);
    if (!ok) return report_error(err);

    write_namespaces(std::cout, namespaces, fmt);

    std::vector<std::string> impls = engine->registry().names();
    for (const auto& name : impls) {
        std::optional<std::string> ext;
        if (engine->expected_file_extension(name, ext, err)) {
            logger.info("Implementation %s: query file extension %s",
                        name.c_str(), ext ? ext->c_str() : "(any)");
        }
    }
    return kExitOk;
}
