#include "test_util.hpp"
#include "core/config.hpp"
#include "query/query_classifier.hpp"

#include <stdexcept>
#include <string>

using namespace loanrecon;

static std::string classify(const std::string& text) {
    return query_type_name(classify_query(QueryText(text)));
}

static void test_query_text_words() {
    std::fprintf(stderr, "-- test_query_text_words\n");

    QueryText q("Show UN-Reconciled loans, LN-001234!");
    CHECK_STR_EQ(q.lower, "show un-reconciled loans, ln-001234!");
    CHECK_EQ(q.words.size(), 4u);
    CHECK(q.has_word("un-reconciled"));
    CHECK(q.has_word("ln-001234"));
    CHECK(!q.has_word("reconciled"));
    CHECK(q.has_word_prefix("un-rec"));
    CHECK(q.contains("loans, ln"));
}

static void test_rule_order() {
    std::fprintf(stderr, "-- test_rule_order\n");

    const auto& rules = query_rules();
    CHECK_EQ(rules.size(), 16u);
    for (size_t i = 0; i < rules.size(); i++) {
        CHECK(rules[i].type == static_cast<QueryType>(i));
    }
    CHECK(rules.front().type == QueryType::kFindMismatches);
    CHECK(rules.back().type == QueryType::kSummary);
}

static void test_each_category() {
    std::fprintf(stderr, "-- test_each_category\n");

    CHECK_STR_EQ(classify("Find mismatches"), "FindMismatches");
    CHECK_STR_EQ(classify("Show differences"), "FindMismatches");
    CHECK_STR_EQ(classify("reconciliation report"), "FindMismatches");
    CHECK_STR_EQ(classify("Show loans where DifferenceAmount > 5000"), "DifferenceGreaterThan");
    CHECK_STR_EQ(classify("difference greater than 100"), "DifferenceGreaterThan");
    CHECK_STR_EQ(classify("difference less than 100"), "DifferenceLessThan");
    CHECK_STR_EQ(classify("where difference < 0"), "DifferenceLessThan");
    CHECK_STR_EQ(classify("Show reconciled loans"), "ReconciledLoans");
    CHECK_STR_EQ(classify("List unreconciled loans"), "UnreconciledLoans");
    CHECK_STR_EQ(classify("loans not reconciled"), "UnreconciledLoans");
    CHECK_STR_EQ(classify("pending items"), "UnreconciledLoans");
    CHECK_STR_EQ(classify("Find loan LN-001234"), "LoanByID");
    CHECK_STR_EQ(classify("loan id 42"), "LoanByID");
    CHECK_STR_EQ(classify("ln123"), "LoanByID");
    CHECK_STR_EQ(classify("Search borrower John Smith"), "SearchByBorrower");
    CHECK_STR_EQ(classify("customer Acme"), "SearchByBorrower");
    CHECK_STR_EQ(classify("Top 20 loans"), "TopDifferences");
    CHECK_STR_EQ(classify("largest gaps"), "TopDifferences");
    CHECK_STR_EQ(classify("bottom 5 loans"), "BottomDifferences");
    CHECK_STR_EQ(classify("smallest gaps"), "BottomDifferences");
    CHECK_STR_EQ(classify("where difference is positive"), "PositiveDifferences");
    CHECK_STR_EQ(classify("where difference is negative"), "NegativeDifferences");
    CHECK_STR_EQ(classify("servicer amount greater than fnma"), "ServicerGreaterThanFNMA");
    CHECK_STR_EQ(classify("fnma amount is greater"), "FNMAGreaterThanServicer");
    CHECK_STR_EQ(classify("count loans"), "Count");
    CHECK_STR_EQ(classify("how many loans are there"), "Count");
    CHECK_STR_EQ(classify("List all loans"), "ListAll");
    CHECK_STR_EQ(classify("show everything"), "ListAll");
    CHECK_STR_EQ(classify("Summary"), "Summary");
    CHECK_STR_EQ(classify("give me an overview"), "Summary");
    CHECK_STR_EQ(classify("asdkjasd"), "Unknown");
    CHECK_STR_EQ(classify(""), "Unknown");
}

static void test_precedence() {
    std::fprintf(stderr, "-- test_precedence\n");

    // Earlier rules win when several match
    CHECK_STR_EQ(classify("mismatch reconciled"), "FindMismatches");
    CHECK_STR_EQ(classify("unreconciled count"), "UnreconciledLoans");
    CHECK_STR_EQ(classify("list pending loans"), "UnreconciledLoans");
    CHECK_STR_EQ(classify("top borrower names"), "SearchByBorrower");
    CHECK_STR_EQ(classify("list loan LN-7"), "LoanByID");
    CHECK_STR_EQ(classify("summary of all loans"), "ListAll");
}

static void test_bare_difference_goes_to_mismatches() {
    std::fprintf(stderr, "-- test_bare_difference_goes_to_mismatches\n");

    // Only a comparator or "where" keeps "difference" out of FindMismatches
    CHECK_STR_EQ(classify("Top 20 differences"), "FindMismatches");
    CHECK_STR_EQ(classify("bottom 5 differences"), "FindMismatches");
    CHECK_STR_EQ(classify("largest difference"), "FindMismatches");
    CHECK_STR_EQ(classify("positive differences"), "FindMismatches");
    CHECK_STR_EQ(classify("negative differences"), "FindMismatches");
    CHECK_STR_EQ(classify("differences where positive"), "PositiveDifferences");
    CHECK_STR_EQ(classify("difference > 10"), "DifferenceGreaterThan");
}

static void test_word_boundaries() {
    std::fprintf(stderr, "-- test_word_boundaries\n");

    // "count" inside "account" is not a count request
    CHECK_STR_EQ(classify("account"), "Unknown");
    // "un-reconciled" is one word, not "reconciled"
    CHECK_STR_EQ(classify("un-reconciled loans"), "UnreconciledLoans");
    // "stop" is not "top"
    CHECK_STR_EQ(classify("stop"), "Unknown");
    // "less" inside "regardless"/"unless" is not a comparator
    CHECK_STR_EQ(classify("differences regardless of status"), "FindMismatches");
    CHECK_STR_EQ(classify("difference unless pending"), "FindMismatches");
    CHECK_STR_EQ(classify("where difference is less than 5"), "DifferenceLessThan");
    // "more" inside "moreover" is not a comparator
    CHECK_STR_EQ(classify("servicer moreover"), "Unknown");
    CHECK_STR_EQ(classify("servicer is more"), "ServicerGreaterThanFNMA");
}

static void test_extract_threshold() {
    std::fprintf(stderr, "-- test_extract_threshold\n");

    CHECK_EQ(extract_threshold("difference > 5000"), 5000 * AMOUNT_SCALE);
    CHECK_EQ(extract_threshold("greater than 1234.5 dollars"), 12345000);
    CHECK_EQ(extract_threshold("difference less than 0.25"), 2500);
    CHECK_EQ(extract_threshold("no digits here"), 0);

    bool threw = false;
    try {
        extract_threshold("difference > 99999999999999999999999");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_extract_count() {
    std::fprintf(stderr, "-- test_extract_count\n");

    CHECK_EQ(extract_count("top 3 differences", 10), 3u);
    CHECK_EQ(extract_count("top differences", 10), 10u);
    CHECK_EQ(extract_count("top 0 differences", 10), 10u);
    CHECK_EQ(extract_count("top 2.9", 10), 2u);
}

static void test_extract_loan_id() {
    std::fprintf(stderr, "-- test_extract_loan_id\n");

    CHECK_STR_EQ(extract_loan_id("Find loan LN-001234"), "LN-001234");
    CHECK_STR_EQ(extract_loan_id("loan id 42?"), "42");
    CHECK_STR_EQ(extract_loan_id("loan -123-"), "123");
    CHECK_STR_EQ(extract_loan_id("find loan"), "");
}

static void test_extract_borrower_fragment() {
    std::fprintf(stderr, "-- test_extract_borrower_fragment\n");

    CHECK_STR_EQ(extract_borrower_fragment("Search borrower Smith"), "Smith");
    CHECK_STR_EQ(extract_borrower_fragment("borrower named 'Jane Doe'"), "Jane Doe");
    CHECK_STR_EQ(extract_borrower_fragment("customer's name is John?"), "John");
    CHECK_STR_EQ(extract_borrower_fragment("find borrower with name: Acme Holdings"),
                 "Acme Holdings");
    CHECK_STR_EQ(extract_borrower_fragment("borrowers: Park"), "Park");
    CHECK_STR_EQ(extract_borrower_fragment("borrower"), "");
    CHECK_STR_EQ(extract_borrower_fragment("borrower named"), "");
}

int main() {
    test_query_text_words();
    test_rule_order();
    test_each_category();
    test_precedence();
    test_bare_difference_goes_to_mismatches();
    test_word_boundaries();
    test_extract_threshold();
    test_extract_count();
    test_extract_loan_id();
    test_extract_borrower_fragment();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
