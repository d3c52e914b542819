#include "loanreconserver/server.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"

#include <csignal>
#include <cstdio>
#include <iostream>

#include <unistd.h>

using namespace loanrecon;

static Server* g_server = nullptr;

static void signal_handler(int sig) {
    if (!g_server) return;
    if (sig == SIGHUP) {
        g_server->request_reload();
    } else {
        g_server->request_shutdown();
    }
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] -data <path>\n"
        "       %s <path> [options]\n"
        "\n"
        "Serves loan-reconciliation queries as MCP tools over stdin/stdout\n"
        "(one JSON-RPC message per line).\n"
        "\n"
        "Required:\n"
        "  -data <path>             Loan reconciliation CSV/TSV file\n"
        "\n"
        "Options:\n"
        "  -delimiter <c>           Field delimiter; 'tab' for TAB (default: ,)\n"
        "  -no_header               First row is data, not column names\n"
        "  -threads <int>           Worker threads for statistics (default: all cores)\n"
        "  -default_limit <int>     Page size when a query omits limit (default: 100)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -q, --quiet              Log errors only\n"
        "  --version                Print version\n"
        "\n"
        "Signals: SIGHUP reloads the data file; SIGINT/SIGTERM shut down.\n"
        "Logs go to stderr.\n",
        prog, prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli)) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(cli.program().c_str());
        return 0;
    }

    ServerConfig config;
    config.data_path = cli.get_string("-data");
    if (config.data_path.empty() && !cli.positional().empty()) {
        config.data_path = cli.positional().front();
    }
    if (config.data_path.empty()) {
        std::fprintf(stderr, "Error: -data is required\n");
        print_usage(cli.program().c_str());
        return 1;
    }
    config.num_threads = resolve_threads(cli);
    config.log_level = resolve_log_level(cli);

    std::string delim = cli.get_string("-delimiter", ",");
    if (delim == "tab" || delim == "\\t") {
        config.csv_options.delimiter = '\t';
    } else if (delim.size() == 1) {
        config.csv_options.delimiter = delim[0];
    } else {
        std::fprintf(stderr, "Error: -delimiter must be a single character or 'tab'\n");
        return 1;
    }
    config.csv_options.has_header = !cli.has("-no_header");

    config.default_limit = cli.get_int("-default_limit", DEFAULT_QUERY_LIMIT);
    if (config.default_limit < 0) {
        std::fprintf(stderr, "Error: -default_limit must be >= 0\n");
        return 1;
    }

    Server server(config);
    g_server = &server;

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    // stdout carries protocol lines only
    std::ios::sync_with_stdio(false);

    FdLineReader reader(STDIN_FILENO, server.shutdown_flag(), server.logger());
    int ret = server.run(reader, std::cout);
    g_server = nullptr;
    return ret;
}
