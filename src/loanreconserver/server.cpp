#include "loanreconserver/server.hpp"
#include "loanreconserver/session.hpp"

#include <chrono>
#include <thread>

namespace loanrecon {

Server::Server(const ServerConfig& config)
    : config_(config),
      logger_(config.log_level, config.log_sink),
      store_(logger_),
      arena_(config.num_threads > 0 ? config.num_threads
                                     : static_cast<int>(tbb::task_arena::automatic)),
      executor_(store_, arena_, logger_, config.default_limit) {}

Server::~Server() = default;

void Server::request_shutdown() {
    shutdown_requested_.store(true, std::memory_order_release);
}

void Server::request_reload() {
    reload_requested_.store(true, std::memory_order_release);
}

bool Server::load_data() {
    auto start = std::chrono::steady_clock::now();
    logger_.info("Loading %s", config_.data_path.c_str());

    LoanCsvResult loaded;
    if (!read_loan_csv(config_.data_path, config_.csv_options, loaded, logger_)) {
        logger_.error("Failed to load %s", config_.data_path.c_str());
        return false;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    logger_.info("Loaded %zu records in %lld ms (%zu rows skipped)",
                 loaded.records.size(), static_cast<long long>(elapsed),
                 loaded.rows_skipped);

    store_.build(std::move(loaded.records));
    return true;
}

void Server::reload_loop() {
    while (!shutdown_requested_.load(std::memory_order_acquire)) {
        if (reload_requested_.exchange(false, std::memory_order_acq_rel)) {
            logger_.info("Reload requested");
            if (!load_data()) {
                logger_.error("Reload failed, keeping snapshot v%lu",
                              static_cast<unsigned long>(store_.version()));
            }
            reloads_handled_.fetch_add(1, std::memory_order_acq_rel);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.reload_poll_ms));
    }
}

int Server::run(LineReader& reader, std::ostream& out) {
    if (!load_data()) {
        return 1;
    }

    logger_.info("Server ready: %zu records, %d thread(s)",
                 store_.count(), arena_.max_concurrency());

    std::thread watcher([this] { reload_loop(); });

    Session session(executor_, logger_);
    try {
        session.run(reader, out);
    } catch (...) {
        request_shutdown();
        watcher.join();
        throw;
    }

    // Input ended or shutdown requested; stop the watcher
    request_shutdown();
    watcher.join();

    logger_.info("Server shut down");
    return 0;
}

} // namespace loanrecon
