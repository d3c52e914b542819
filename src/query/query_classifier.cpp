#include "query/query_classifier.hpp"

#include "core/amount.hpp"
#include "core/config.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>
#include <stdexcept>

namespace loanrecon {

const char* query_type_name(QueryType type) {
    switch (type) {
    case QueryType::kFindMismatches:          return "FindMismatches";
    case QueryType::kDifferenceGreaterThan:   return "DifferenceGreaterThan";
    case QueryType::kDifferenceLessThan:      return "DifferenceLessThan";
    case QueryType::kReconciledLoans:         return "ReconciledLoans";
    case QueryType::kUnreconciledLoans:       return "UnreconciledLoans";
    case QueryType::kLoanById:                return "LoanByID";
    case QueryType::kSearchByBorrower:        return "SearchByBorrower";
    case QueryType::kTopDifferences:          return "TopDifferences";
    case QueryType::kBottomDifferences:       return "BottomDifferences";
    case QueryType::kPositiveDifferences:     return "PositiveDifferences";
    case QueryType::kNegativeDifferences:     return "NegativeDifferences";
    case QueryType::kServicerGreaterThanFnma: return "ServicerGreaterThanFNMA";
    case QueryType::kFnmaGreaterThanServicer: return "FNMAGreaterThanServicer";
    case QueryType::kCount:                   return "Count";
    case QueryType::kListAll:                 return "ListAll";
    case QueryType::kSummary:                 return "Summary";
    case QueryType::kUnknown:                 return "Unknown";
    }
    return "Unknown";
}

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

QueryText::QueryText(const std::string& text)
    : original(text), lower(to_lower(text)) {
    size_t i = 0;
    while (i < lower.size()) {
        while (i < lower.size() && !is_word_char(lower[i])) i++;
        size_t start = i;
        while (i < lower.size() && is_word_char(lower[i])) i++;
        if (i > start) words.push_back(lower.substr(start, i - start));
    }
}

bool QueryText::contains(const char* needle) const {
    return lower.find(needle) != std::string::npos;
}

bool QueryText::has_word(const char* word) const {
    return std::find(words.begin(), words.end(), word) != words.end();
}

bool QueryText::has_word_prefix(const char* prefix) const {
    std::string p(prefix);
    for (const auto& w : words) {
        if (w.compare(0, p.size(), p) == 0) return true;
    }
    return false;
}

// --- Predicates, one per category ---

static bool has_any(const QueryText& q, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (q.contains(n)) return true;
    }
    return false;
}

static bool has_any_word(const QueryText& q, std::initializer_list<const char*> words) {
    for (const char* w : words) {
        if (q.has_word(w)) return true;
    }
    return false;
}

static bool has_greater(const QueryText& q) {
    return q.contains(">") || q.has_word("greater");
}

static bool has_less(const QueryText& q) {
    return q.contains("<") || q.has_word("less");
}

// A comparator or "where" turns a bare "difference" into a filter request
static bool difference_is_qualified(const QueryText& q) {
    return has_greater(q) || has_less(q) || q.has_word("where");
}

static bool match_mismatches(const QueryText& q) {
    if (q.has_word_prefix("mismatch")) return true;
    if (q.has_word("reconcile") || q.has_word("reconciliation")) return true;
    return q.contains("difference") && !difference_is_qualified(q);
}

static bool match_difference_greater(const QueryText& q) {
    return q.contains("difference") && has_greater(q);
}

static bool match_difference_less(const QueryText& q) {
    return q.contains("difference") && has_less(q);
}

static bool match_reconciled(const QueryText& q) {
    return q.has_word("reconciled") && !q.has_word("not") &&
           !q.has_word_prefix("unreconcil") && !q.has_word_prefix("un-reconcil");
}

static bool match_unreconciled(const QueryText& q) {
    return has_any(q, {"unreconciled", "un-reconciled", "not reconciled", "pending"});
}

static bool match_loan_id(const QueryText& q) {
    static const std::regex id_pattern(R"(\bln-?\d+\b)", std::regex::icase);
    if (q.contains("loan") &&
        (q.has_word("id") || q.has_word("ids") || q.contains("number") ||
         q.contains("loanid") || q.contains("loan_id"))) {
        return true;
    }
    return std::regex_search(q.lower, id_pattern);
}

static bool match_borrower(const QueryText& q) {
    return has_any(q, {"borrower", "customer", "name"});
}

static bool match_top(const QueryText& q) {
    return has_any_word(q, {"top", "highest", "largest"});
}

static bool match_bottom(const QueryText& q) {
    return has_any_word(q, {"bottom", "lowest", "smallest"});
}

static bool match_positive(const QueryText& q) {
    return q.contains("positive") && q.contains("difference");
}

static bool match_negative(const QueryText& q) {
    return q.contains("negative") && q.contains("difference");
}

static bool match_servicer_greater(const QueryText& q) {
    return q.contains("servicer") && has_any_word(q, {"greater", "more"});
}

static bool match_fnma_greater(const QueryText& q) {
    return q.contains("fnma") && has_any_word(q, {"greater", "more"});
}

static bool match_count(const QueryText& q) {
    return q.has_word_prefix("count") || q.contains("how many") || q.has_word("total");
}

static bool match_list_all(const QueryText& q) {
    return has_any_word(q, {"all", "list", "show", "everything"});
}

static bool match_summary(const QueryText& q) {
    return has_any(q, {"summary", "overview", "report"});
}

const std::vector<QueryRule>& query_rules() {
    static const std::vector<QueryRule> rules = {
        {QueryType::kFindMismatches,          match_mismatches},
        {QueryType::kDifferenceGreaterThan,   match_difference_greater},
        {QueryType::kDifferenceLessThan,      match_difference_less},
        {QueryType::kReconciledLoans,         match_reconciled},
        {QueryType::kUnreconciledLoans,       match_unreconciled},
        {QueryType::kLoanById,                match_loan_id},
        {QueryType::kSearchByBorrower,        match_borrower},
        {QueryType::kTopDifferences,          match_top},
        {QueryType::kBottomDifferences,       match_bottom},
        {QueryType::kPositiveDifferences,     match_positive},
        {QueryType::kNegativeDifferences,     match_negative},
        {QueryType::kServicerGreaterThanFnma, match_servicer_greater},
        {QueryType::kFnmaGreaterThanServicer, match_fnma_greater},
        {QueryType::kCount,                   match_count},
        {QueryType::kListAll,                 match_list_all},
        {QueryType::kSummary,                 match_summary},
    };
    return rules;
}

QueryType classify_query(const QueryText& q) {
    for (const auto& rule : query_rules()) {
        if (rule.matches(q)) return rule.type;
    }
    return QueryType::kUnknown;
}

// --- Extraction ---

// Locate the first digit run with optional fraction: \d+\.?\d*
static bool find_first_number(const std::string& text, std::string& number) {
    size_t i = 0;
    while (i < text.size() && !std::isdigit(static_cast<unsigned char>(text[i]))) i++;
    if (i == text.size()) return false;

    size_t start = i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
    if (i < text.size() && text[i] == '.') {
        i++;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
    }
    number = text.substr(start, i - start);
    return true;
}

Amount extract_threshold(const std::string& text) {
    std::string number;
    if (!find_first_number(text, number)) return 0;
    Amount value = 0;
    if (!parse_amount(number, value)) {
        throw std::out_of_range("number out of range: " + number);
    }
    return value;
}

size_t extract_count(const std::string& text, size_t default_count) {
    std::string number;
    if (!find_first_number(text, number)) return default_count;
    Amount value = 0;
    if (!parse_amount(number, value)) {
        throw std::out_of_range("number out of range: " + number);
    }
    size_t n = static_cast<size_t>(value / AMOUNT_SCALE);
    return n == 0 ? default_count : n;
}

std::string extract_loan_id(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() &&
               !(std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '-'))
            i++;
        size_t start = i;
        bool has_digit = false;
        while (i < text.size() &&
               (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '-')) {
            if (std::isdigit(static_cast<unsigned char>(text[i]))) has_digit = true;
            i++;
        }
        if (has_digit) {
            std::string token = text.substr(start, i - start);
            while (!token.empty() && token.back() == '-') token.pop_back();
            while (!token.empty() && token.front() == '-') token.erase(0, 1);
            if (!token.empty()) return token;
        }
    }
    return {};
}

static bool is_filler_word(const std::string& w) {
    static const char* const kFillers[] = {
        "name", "names", "named", "is", "called", "like", "equals",
        "contains", "containing", "of", "for", "with", "matching",
    };
    for (const char* f : kFillers) {
        if (w == f) return true;
    }
    return false;
}

static bool is_fragment_separator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == ':' || c == '=' ||
           c == '\'' || c == '"' || c == '-' || c == ',';
}

std::string extract_borrower_fragment(const std::string& text) {
    std::string lower = to_lower(text);

    size_t pos = std::string::npos;
    size_t kw_len = 0;
    for (const char* kw : {"borrower", "customer", "name"}) {
        size_t p = lower.find(kw);
        if (p != std::string::npos && p < pos) {
            pos = p;
            kw_len = std::char_traits<char>::length(kw);
        }
    }
    if (pos == std::string::npos) return {};

    // Skip the rest of the keyword's word ("borrowers", "customer's")
    size_t i = pos + kw_len;
    while (i < text.size() &&
           (std::isalpha(static_cast<unsigned char>(text[i])) || text[i] == '\''))
        i++;

    // Drop leading separators and filler words
    while (true) {
        while (i < text.size() && is_fragment_separator(text[i])) i++;
        size_t end = i;
        while (end < text.size() && std::isalpha(static_cast<unsigned char>(lower[end])))
            end++;
        bool at_word_end = end == text.size() || !std::isalnum(static_cast<unsigned char>(lower[end]));
        if (end > i && at_word_end && is_filler_word(lower.substr(i, end - i))) {
            i = end;
            continue;
        }
        break;
    }

    std::string fragment = trim(text.substr(std::min(i, text.size())));
    while (!fragment.empty() &&
           (fragment.back() == '"' || fragment.back() == '\'' ||
            fragment.back() == '?' || fragment.back() == '.' ||
            fragment.back() == '!')) {
        fragment.pop_back();
    }
    return trim(fragment);
}

} // namespace loanrecon
