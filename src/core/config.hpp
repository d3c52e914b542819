#pragma once

#include <cstddef>
#include <cstdint>

namespace loanrecon {

// Amount scale: 4 fractional decimal digits
inline constexpr int64_t AMOUNT_SCALE = 10000;
inline constexpr int AMOUNT_FRACTION_DIGITS = 4;

// Largest accepted |amount|: 1e12 currency units. Differences of two
// accepted amounts always fit; totals are checked when summed.
inline constexpr int64_t MAX_ABS_AMOUNT = 1000000000000LL * AMOUNT_SCALE;

// Query defaults
inline constexpr int DEFAULT_QUERY_LIMIT = 100;
inline constexpr int DEFAULT_RANK_COUNT = 10;      // top/bottom N
inline constexpr size_t SUMMARY_SAMPLE_SIZE = 10;

// Match sets at least this large compute statistics in parallel
inline constexpr size_t PARALLEL_STATS_THRESHOLD = 16384;

// Longest accepted input line; longer requests are dropped
inline constexpr size_t MAX_LINE_BYTES = 16u * 1024 * 1024;

// Source columns (positional)
inline constexpr size_t LOAN_CSV_NUM_COLUMNS = 6;

// Status value that marks a record as reconciled (case-insensitive)
inline constexpr const char* RECONCILED_STATUS = "reconciled";

// MCP protocol revision reported by initialize
inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";
inline constexpr const char* SERVER_NAME = "loanrecon";

// JSON-RPC error codes
inline constexpr int RPC_METHOD_NOT_FOUND = -32601;
inline constexpr int RPC_INTERNAL_ERROR = -32603;

} // namespace loanrecon
