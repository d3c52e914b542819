#pragma once

#include <cstddef>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"
#include "protocol/messages.hpp"
#include "store/record_store.hpp"
#include "util/logger.hpp"

#include <tbb/task_arena.h>

namespace loanrecon {

// Aggregates over the full match set. Large sets are reduced in parallel
// inside arena.
QueryStatistics compute_statistics(const std::vector<const LoanRecord*>& matches,
                                   tbb::task_arena& arena);

// Copy matches[skip, skip + limit) out of the snapshot.
// Negative skip/limit are treated as 0.
std::vector<LoanRecord> paginate(const std::vector<const LoanRecord*>& matches,
                                 int skip, int limit);

// Runs free-text queries against the store's current snapshot.
// Never mutates the store. Safe to call from several threads.
class QueryExecutor {
public:
    QueryExecutor(const RecordStore& store, tbb::task_arena& arena,
                  const Logger& logger, int default_limit = DEFAULT_QUERY_LIMIT);

    // Classify and run a query. Exceptions raised while classifying or
    // filtering are reported as success=false with the error message.
    QueryResult execute(const QueryRequest& req) const;

    // Dataset-level figures for the get_statistics tool.
    DatasetStatistics dataset_statistics() const;

private:
    const RecordStore& store_;
    tbb::task_arena& arena_;
    const Logger& logger_;
    int default_limit_;
};

} // namespace loanrecon
