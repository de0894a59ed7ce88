#include "asmhomhttpd/http_controller.hpp"
#include "core/version.hpp"
#include "matching/engine_setup.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"
#include "util/net_address.hpp"

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/Logger.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <unistd.h>

using namespace asmhom;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -store <dir>                Document store root directory\n"
        "\n"
        "Options:\n"
        "  -listen <host>:<port>       HTTP listen address (default: 0.0.0.0:8080)\n"
        "  -path_prefix <prefix>       API path prefix (e.g., /asmhom)\n"
        "  -threads <int>              Drogon I/O threads (default: all cores)\n"
        "  -max_upload <size>          Maximum query sketch size, K/M/G suffix (default: 100M)\n"
        "  -temp_dir <dir>             Root for temporary files (default: $TMPDIR or /tmp)\n"
        "  -mash <path>                mash executable (default: mash)\n"
        "  -pid <path>                 PID file path\n"
        "  -v, --verbose               Verbose logging\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "asmhomhttpd")) return kExitOk;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return kExitOk;
    }

    Logger logger = make_logger(cli);
    bool verbose = logger.verbose();

    EngineOptions opts;
    std::string error_msg;
    if (!parse_engine_options(cli, opts, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        print_usage(argv[0]);
        return kExitUserError;
    }

    uint64_t max_upload = 0;
    if (!parse_size_string(cli.get_string("-max_upload", "100M"), max_upload)) {
        std::fprintf(stderr, "Error: invalid -max_upload value\n");
        return kExitUserError;
    }

    // Parse listen address
    std::string listen_addr = cli.get_string("-listen", "0.0.0.0:8080");
    std::string host;
    uint16_t port;
    if (!parse_listen_address(listen_addr, host, port)) {
        std::fprintf(stderr,
            "Error: invalid listen address '%s' (expected host:port or [v6]:port)\n",
            listen_addr.c_str());
        return kExitUserError;
    }

    Error err;
    std::shared_ptr<const MatchEngine> engine = build_engine(opts, logger, err);
    if (!engine) return report_error(err);

    HttpController controller(engine, opts.temp_root, logger);
    std::string path_prefix = cli.get_string("-path_prefix");
    controller.register_routes(path_prefix);

    int threads = resolve_threads(cli);

    // Configure Drogon
    drogon::app()
        .addListener(host, port)
        .setThreadNum(static_cast<size_t>(threads))
        .setClientMaxBodySize(static_cast<size_t>(max_upload))
        .setLogLevel(verbose ? trantor::Logger::kDebug
                             : trantor::Logger::kWarn);

    // PID file
    std::string pid_file = cli.get_string("-pid");
    if (!pid_file.empty()) {
        FILE* f = std::fopen(pid_file.c_str(), "w");
        if (f) {
            std::fprintf(f, "%d\n", ::getpid());
            std::fclose(f);
        } else {
            logger.warn("Cannot write PID file %s", pid_file.c_str());
        }
    }

    logger.info("Starting HTTP server on %s:%u (threads: %d)",
                host.c_str(), port, threads);
    if (!path_prefix.empty()) {
        logger.info("API path prefix: %s", path_prefix.c_str());
    }

    // Run Drogon (blocks until shutdown via SIGTERM/SIGINT)
    drogon::app().run();

    // Cleanup PID file
    if (!pid_file.empty()) {
        std::remove(pid_file.c_str());
    }

    return kExitOk;
}
