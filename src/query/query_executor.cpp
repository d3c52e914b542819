#include "query/query_executor.hpp"

#include "core/amount.hpp"
#include "query/query_classifier.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <limits>

#include <tbb/blocked_range.h>
#include <tbb/combinable.h>
#include <tbb/parallel_for.h>

namespace loanrecon {

namespace {

// Per-thread partial aggregate. Totals use checked_add; an overflowing
// total throws and the query fails.
struct StatsAccumulator {
    size_t count = 0;
    Amount total_servicer = 0;
    Amount total_fnma = 0;
    Amount total_difference = 0;
    Amount max_difference = std::numeric_limits<Amount>::min();
    Amount min_difference = std::numeric_limits<Amount>::max();
    size_t mismatches = 0;

    void add(const LoanRecord& r) {
        count++;
        total_servicer = checked_add(total_servicer, r.servicer_amount);
        total_fnma = checked_add(total_fnma, r.fnma_amount);
        total_difference = checked_add(total_difference, r.difference_amount);
        max_difference = std::max(max_difference, r.difference_amount);
        min_difference = std::min(min_difference, r.difference_amount);
        if (r.has_mismatch()) mismatches++;
    }

    void merge(const StatsAccumulator& o) {
        count += o.count;
        total_servicer = checked_add(total_servicer, o.total_servicer);
        total_fnma = checked_add(total_fnma, o.total_fnma);
        total_difference = checked_add(total_difference, o.total_difference);
        max_difference = std::max(max_difference, o.max_difference);
        min_difference = std::min(min_difference, o.min_difference);
        mismatches += o.mismatches;
    }
};

struct QueryOutcome {
    std::vector<const LoanRecord*> matches;
    std::string message;   // empty = default "Found N records" message
};

using QueryHandler = void (*)(const Snapshot& snap, const QueryText& q,
                              QueryOutcome& out);

template <typename Pred>
void filter_records(const Snapshot& snap, QueryOutcome& out, Pred pred) {
    for (const auto& rec : snap.records) {
        if (pred(rec)) out.matches.push_back(&rec);
    }
}

void all_records(const Snapshot& snap, QueryOutcome& out) {
    out.matches.reserve(snap.records.size());
    for (const auto& rec : snap.records) out.matches.push_back(&rec);
}

bool is_reconciled(const LoanRecord& r) {
    return iequals(r.reconciled_status, RECONCILED_STATUS);
}

// |difference| ordering; ties keep dataset order
bool abs_diff_greater(const LoanRecord* a, const LoanRecord* b) {
    Amount da = amount_abs(a->difference_amount);
    Amount db = amount_abs(b->difference_amount);
    if (da != db) return da > db;
    return a < b;
}

bool abs_diff_less(const LoanRecord* a, const LoanRecord* b) {
    Amount da = amount_abs(a->difference_amount);
    Amount db = amount_abs(b->difference_amount);
    if (da != db) return da < db;
    return a < b;
}

void handle_mismatches(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    out.matches = snap.mismatches;
}

void handle_difference_greater(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    Amount threshold = extract_threshold(q.lower);
    filter_records(snap, out, [threshold](const LoanRecord& r) {
        return r.difference_amount > threshold;
    });
}

void handle_difference_less(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    Amount threshold = extract_threshold(q.lower);
    filter_records(snap, out, [threshold](const LoanRecord& r) {
        return r.difference_amount < threshold;
    });
}

void handle_reconciled(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, is_reconciled);
}

void handle_unreconciled(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, [](const LoanRecord& r) { return !is_reconciled(r); });
}

void handle_loan_by_id(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    std::string loan_id = extract_loan_id(q.original);
    if (loan_id.empty()) {
        out.message = "Please specify a loan ID to look up.";
        return;
    }
    const LoanRecord* rec = snap.find(loan_id);
    if (rec) {
        out.matches.push_back(rec);
    } else {
        out.message = "No loan found with ID " + loan_id;
    }
}

void handle_borrower(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    std::string fragment = extract_borrower_fragment(q.original);
    if (fragment.empty()) {
        out.message = "Please specify a borrower name to search for.";
        return;
    }
    filter_records(snap, out, [&fragment](const LoanRecord& r) {
        return icontains(r.borrower_name, fragment);
    });
}

void handle_top(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    size_t n = extract_count(q.lower, DEFAULT_RANK_COUNT);
    all_records(snap, out);
    n = std::min(n, out.matches.size());
    std::partial_sort(out.matches.begin(), out.matches.begin() + n,
                      out.matches.end(), abs_diff_greater);
    out.matches.resize(n);
}

void handle_bottom(const Snapshot& snap, const QueryText& q, QueryOutcome& out) {
    size_t n = extract_count(q.lower, DEFAULT_RANK_COUNT);
    out.matches = snap.mismatches;
    n = std::min(n, out.matches.size());
    std::partial_sort(out.matches.begin(), out.matches.begin() + n,
                      out.matches.end(), abs_diff_less);
    out.matches.resize(n);
}

void handle_positive(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, [](const LoanRecord& r) { return r.difference_amount > 0; });
}

void handle_negative(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, [](const LoanRecord& r) { return r.difference_amount < 0; });
}

void handle_servicer_greater(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, [](const LoanRecord& r) {
        return r.servicer_amount > r.fnma_amount;
    });
}

void handle_fnma_greater(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    filter_records(snap, out, [](const LoanRecord& r) {
        return r.fnma_amount > r.servicer_amount;
    });
}

void handle_count(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    all_records(snap, out);
    out.message = "Total count: " + format_count(snap.records.size()) + " records";
}

void handle_list_all(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    all_records(snap, out);
}

void handle_summary(const Snapshot& snap, const QueryText&, QueryOutcome& out) {
    size_t total = snap.records.size();
    size_t sample = std::min(total, SUMMARY_SAMPLE_SIZE);
    for (size_t i = 0; i < sample; i++) out.matches.push_back(&snap.records[i]);

    size_t mismatches = snap.mismatches.size();
    size_t reconciled = static_cast<size_t>(
        std::count_if(snap.records.begin(), snap.records.end(), is_reconciled));
    double pct = total > 0 ? mismatches * 100.0 / static_cast<double>(total) : 0.0;

    char pct_buf[32];
    std::snprintf(pct_buf, sizeof(pct_buf), "%.1f", pct);
    out.message = "Dataset Summary: " + format_count(total) + " total loans, " +
                  format_count(mismatches) + " mismatches (" + pct_buf + "%), " +
                  format_count(reconciled) + " reconciled";
}

void handle_unknown(const Snapshot&, const QueryText&, QueryOutcome& out) {
    out.message =
        "I didn't understand that query. Try:\n"
        "- 'Find mismatches'\n"
        "- 'Show loans where difference > 5000'\n"
        "- 'List unreconciled loans'\n"
        "- 'Find loan LN-12345'\n"
        "- 'Search borrower John Smith'\n"
        "- 'Top 20 loans'\n"
        "- 'Summary'";
}

QueryHandler handler_for(QueryType type) {
    switch (type) {
    case QueryType::kFindMismatches:          return handle_mismatches;
    case QueryType::kDifferenceGreaterThan:   return handle_difference_greater;
    case QueryType::kDifferenceLessThan:      return handle_difference_less;
    case QueryType::kReconciledLoans:         return handle_reconciled;
    case QueryType::kUnreconciledLoans:       return handle_unreconciled;
    case QueryType::kLoanById:                return handle_loan_by_id;
    case QueryType::kSearchByBorrower:        return handle_borrower;
    case QueryType::kTopDifferences:          return handle_top;
    case QueryType::kBottomDifferences:       return handle_bottom;
    case QueryType::kPositiveDifferences:     return handle_positive;
    case QueryType::kNegativeDifferences:     return handle_negative;
    case QueryType::kServicerGreaterThanFnma: return handle_servicer_greater;
    case QueryType::kFnmaGreaterThanServicer: return handle_fnma_greater;
    case QueryType::kCount:                   return handle_count;
    case QueryType::kListAll:                 return handle_list_all;
    case QueryType::kSummary:                 return handle_summary;
    case QueryType::kUnknown:                 return handle_unknown;
    }
    return handle_unknown;
}

} // namespace

QueryStatistics compute_statistics(const std::vector<const LoanRecord*>& matches,
                                   tbb::task_arena& arena) {
    QueryStatistics stats;
    if (matches.empty()) return stats;

    StatsAccumulator acc;
    if (matches.size() < PARALLEL_STATS_THRESHOLD) {
        for (const LoanRecord* r : matches) acc.add(*r);
    } else {
        tbb::combinable<StatsAccumulator> partials;
        arena.execute([&] {
            tbb::parallel_for(
                tbb::blocked_range<size_t>(0, matches.size(), 4096),
                [&](const tbb::blocked_range<size_t>& range) {
                    auto& local = partials.local();
                    for (size_t i = range.begin(); i != range.end(); ++i)
                        local.add(*matches[i]);
                });
        });
        partials.combine_each([&acc](const StatsAccumulator& p) { acc.merge(p); });
    }

    stats.record_count = acc.count;
    stats.total_servicer = acc.total_servicer;
    stats.total_fnma = acc.total_fnma;
    stats.total_difference = acc.total_difference;
    stats.max_difference = acc.max_difference;
    stats.min_difference = acc.min_difference;
    stats.average_difference =
        amount_to_double(acc.total_difference) / static_cast<double>(acc.count);
    stats.mismatch_count = acc.mismatches;
    return stats;
}

std::vector<LoanRecord> paginate(const std::vector<const LoanRecord*>& matches,
                                 int skip, int limit) {
    std::vector<LoanRecord> page;
    size_t first = static_cast<size_t>(std::max(skip, 0));
    size_t count = static_cast<size_t>(std::max(limit, 0));
    if (first >= matches.size()) return page;

    size_t last = first + std::min(count, matches.size() - first);
    page.reserve(last - first);
    for (size_t i = first; i < last; i++) page.push_back(*matches[i]);
    return page;
}

QueryExecutor::QueryExecutor(const RecordStore& store, tbb::task_arena& arena,
                             const Logger& logger, int default_limit)
    : store_(store), arena_(arena), logger_(logger), default_limit_(default_limit) {}

QueryResult QueryExecutor::execute(const QueryRequest& req) const {
    auto start = std::chrono::steady_clock::now();
    QueryResult result;

    try {
        SnapshotPtr snap = store_.snapshot();
        QueryText text(req.query);
        QueryType type = classify_query(text);
        result.metadata.query_type = query_type_name(type);

        QueryOutcome outcome;
        handler_for(type)(*snap, text, outcome);

        int skip = req.skip.value_or(0);
        int limit = req.limit.value_or(default_limit_);

        result.total_count = outcome.matches.size();
        result.data = paginate(outcome.matches, skip, limit);
        result.metadata.statistics = compute_statistics(outcome.matches, arena_);
        result.message = outcome.message.empty()
            ? "Found " + format_count(result.total_count) + " records matching query"
            : outcome.message;

        logger_.debug("Query '%s' -> %s: %zu match(es), page %zu, total difference %s",
                      req.query.c_str(), result.metadata.query_type.c_str(),
                      result.total_count, result.data.size(),
                      format_amount(result.metadata.statistics.total_difference).c_str());
    } catch (const std::exception& e) {
        logger_.error("Error executing query '%s': %s", req.query.c_str(), e.what());
        result.success = false;
        result.message = std::string("Query execution failed: ") + e.what();
        result.data.clear();
        result.total_count = 0;
        result.metadata.statistics = QueryStatistics{};
    }

    result.metadata.execution_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

DatasetStatistics QueryExecutor::dataset_statistics() const {
    SnapshotPtr snap = store_.snapshot();
    DatasetStatistics ds;
    ds.total_records = snap->records.size();
    if (snap->loaded()) ds.last_load_time = snap->build_time;
    ds.data_loaded = !snap->records.empty();
    ds.mismatch_count = snap->mismatches.size();
    ds.snapshot_version = snap->version;
    return ds;
}

} // namespace loanrecon
