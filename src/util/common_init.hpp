#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <thread>

// Needs LOANRECON_VERSION: include core/version.hpp first.

namespace loanrecon {

// Handles --version. Returns true when the caller should exit.
inline bool check_version(const CliParser& cli) {
    if (!cli.has("--version")) return false;
    std::fprintf(stderr, "loanreconserver %s\n", LOANRECON_VERSION);
    return true;
}

// -v/--verbose selects debug output, -q/--quiet errors only.
inline Logger::Level resolve_log_level(const CliParser& cli) {
    if (cli.has("-v") || cli.has("--verbose")) return Logger::kDebug;
    if (cli.has("-q") || cli.has("--quiet")) return Logger::kError;
    return Logger::kInfo;
}

// TBB arena size: -threads, or one per hardware thread when unset or <= 0.
inline int resolve_threads(const CliParser& cli) {
    int n = cli.get_int("-threads", 0);
    if (n > 0) return n;
    n = static_cast<int>(std::thread::hardware_concurrency());
    return n > 0 ? n : 1;
}

} // namespace loanrecon
