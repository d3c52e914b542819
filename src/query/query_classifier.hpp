#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace loanrecon {

// Query categories, in classification priority order.
enum class QueryType {
    kFindMismatches,
    kDifferenceGreaterThan,
    kDifferenceLessThan,
    kReconciledLoans,
    kUnreconciledLoans,
    kLoanById,
    kSearchByBorrower,
    kTopDifferences,
    kBottomDifferences,
    kPositiveDifferences,
    kNegativeDifferences,
    kServicerGreaterThanFnma,
    kFnmaGreaterThanServicer,
    kCount,
    kListAll,
    kSummary,
    kUnknown,
};

// Wire name of a category ("FindMismatches", "LoanByID", ...).
const char* query_type_name(QueryType type);

// Query text prepared for keyword tests.
// words are maximal runs of [a-z0-9_-] in the lower-cased text.
struct QueryText {
    std::string original;
    std::string lower;
    std::vector<std::string> words;

    explicit QueryText(const std::string& text);

    bool contains(const char* needle) const;
    bool has_word(const char* word) const;
    bool has_word_prefix(const char* prefix) const;
};

// One entry of the classification cascade.
struct QueryRule {
    QueryType type;
    bool (*matches)(const QueryText& q);
};

// The cascade, highest priority first. The first matching rule decides the
// category; text matching no rule is kUnknown.
const std::vector<QueryRule>& query_rules();

QueryType classify_query(const QueryText& q);

// First run of digits (optionally with '.' and more digits) anywhere in
// text, as an Amount. Returns 0 when the text has no digits.
// Throws std::out_of_range if the number does not fit an Amount.
Amount extract_threshold(const std::string& text);

// Integer count from the first number in text, truncated; default_count
// when the text has no number or the number is 0.
size_t extract_count(const std::string& text, size_t default_count);

// First alphanumeric/hyphen token that contains a digit ("LN-001234").
// Empty if none.
std::string extract_loan_id(const std::string& text);

// Name fragment following a borrower keyword, with filler words
// ("named", "is", ...) and quotes stripped. Empty if none remains.
std::string extract_borrower_fragment(const std::string& text);

} // namespace loanrecon
