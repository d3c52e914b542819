#pragma once

#include <atomic>
#include <cstdio>
#include <istream>
#include <ostream>
#include <string>

#include "core/config.hpp"
#include "io/line_reader.hpp"
#include "io/loan_csv_reader.hpp"
#include "query/query_executor.hpp"
#include "store/record_store.hpp"
#include "util/logger.hpp"

#include <tbb/task_arena.h>

namespace loanrecon {

struct ServerConfig {
    std::string data_path;
    LoanCsvOptions csv_options;
    int num_threads = 0;                      // 0 = auto-detect
    int default_limit = DEFAULT_QUERY_LIMIT;  // page size when limit is omitted
    int reload_poll_ms = 200;                 // reload watcher poll interval
    Logger::Level log_level = Logger::kInfo;
    std::FILE* log_sink = stderr;
};

class Server {
public:
    explicit Server(const ServerConfig& config);
    ~Server();

    // Read the data source and publish a new snapshot.
    // Returns false (keeping the current snapshot) if nothing usable loaded.
    bool load_data();

    // Load the initial snapshot, then serve the session on reader/out
    // until end of input or shutdown. Reload requests are handled by a
    // watcher thread while the session runs. Returns the process exit code.
    // An exception from the reader or output stream propagates after the
    // watcher has been stopped.
    int run(LineReader& reader, std::ostream& out);

    // Async-signal-safe: only set flags.
    void request_shutdown();
    void request_reload();

    const std::atomic<bool>& shutdown_flag() const { return shutdown_requested_; }
    const RecordStore& store() const { return store_; }
    const Logger& logger() const { return logger_; }

    // Reload requests the watcher has finished, successful or not.
    unsigned reloads_handled() const {
        return reloads_handled_.load(std::memory_order_acquire);
    }

private:
    ServerConfig config_;
    Logger logger_;
    RecordStore store_;
    tbb::task_arena arena_;
    QueryExecutor executor_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> reload_requested_{false};
    std::atomic<unsigned> reloads_handled_{0};

    void reload_loop();
};

} // namespace loanrecon
