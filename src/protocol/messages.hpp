#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/types.hpp"

namespace loanrecon {

// query_loans tool arguments
struct QueryRequest {
    std::string query;
    std::optional<int> limit;   // unset = server default; negative -> 0
    std::optional<int> skip;    // unset = 0; negative -> 0
};

// Aggregates over a full match set (before pagination).
// record_count == 0 means "no statistics" and serializes as {}.
struct QueryStatistics {
    size_t record_count = 0;
    Amount total_servicer = 0;
    Amount total_fnma = 0;
    Amount total_difference = 0;
    Amount max_difference = 0;
    Amount min_difference = 0;
    double average_difference = 0.0;
    size_t mismatch_count = 0;

    bool empty() const { return record_count == 0; }
};

struct QueryMetadata {
    std::string query_type;
    int64_t execution_time_ms = 0;
    QueryStatistics statistics;
};

// query_loans tool result
struct QueryResult {
    bool success = true;
    std::string message;
    std::vector<LoanRecord> data;   // page
    size_t total_count = 0;         // full match set size
    QueryMetadata metadata;
};

// get_statistics tool result
struct DatasetStatistics {
    size_t total_records = 0;
    std::optional<std::chrono::system_clock::time_point> last_load_time;
    bool data_loaded = false;
    size_t mismatch_count = 0;
    uint64_t snapshot_version = 0;
};

// JSON-RPC request envelope. id is echoed verbatim (string or number).
struct RpcRequest {
    Json::Value id;
    std::string method;
    Json::Value params;   // null when omitted
};

struct RpcError {
    int code = 0;
    std::string message;
};

// Exactly one of result / error is set.
struct RpcResponse {
    Json::Value id;
    std::optional<Json::Value> result;
    std::optional<RpcError> error;
};

} // namespace loanrecon
