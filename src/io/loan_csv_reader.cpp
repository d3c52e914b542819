#include "io/loan_csv_reader.hpp"

#include "core/amount.hpp"
#include "core/config.hpp"
#include "util/string_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace loanrecon {

bool split_delimited_line(const std::string& line, char delimiter,
                          std::vector<std::string>& fields) {
    fields.clear();
    std::string cur;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cur.push_back('"');
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            fields.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }

    if (in_quotes) return false;
    fields.push_back(std::move(cur));
    return true;
}

static bool parse_amount_field(const std::string& field, const char* column,
                               Amount& out, std::string& error_msg) {
    if (!parse_amount(field, out)) {
        error_msg = std::string("invalid ") + column + " '" + field + "'";
        return false;
    }
    return true;
}

bool parse_loan_row(const std::vector<std::string>& fields,
                    LoanRecord& rec, std::string& error_msg) {
    if (fields.size() < LOAN_CSV_NUM_COLUMNS) {
        error_msg = "expected " + std::to_string(LOAN_CSV_NUM_COLUMNS) +
                    " fields, got " + std::to_string(fields.size());
        return false;
    }

    rec.loan_id = trim(fields[0]);
    if (rec.loan_id.empty()) {
        error_msg = "empty LoanID";
        return false;
    }
    rec.borrower_name = trim(fields[1]);

    if (!parse_amount_field(fields[2], "Servicer_LoanAmount",
                            rec.servicer_amount, error_msg))
        return false;
    if (!parse_amount_field(fields[3], "FNMA_LoanAmount",
                            rec.fnma_amount, error_msg))
        return false;

    // Both amounts are bounded by MAX_ABS_AMOUNT, so the difference fits
    if (trim(fields[4]).empty()) {
        rec.difference_amount = rec.servicer_amount - rec.fnma_amount;
    } else if (!parse_amount_field(fields[4], "DifferenceAmount",
                                   rec.difference_amount, error_msg)) {
        return false;
    }

    rec.reconciled_status = trim(fields[5]);
    return true;
}

bool read_loan_csv_stream(std::istream& in, const LoanCsvOptions& options,
                          LoanCsvResult& result, const Logger& logger) {
    result = LoanCsvResult{};

    std::string line;
    std::vector<std::string> fields;
    size_t line_no = 0;
    bool header_pending = options.has_header;

    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (trim(line).empty()) continue;

        // Strip a UTF-8 BOM from the first line
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);

        if (header_pending) {
            header_pending = false;
            continue;
        }

        result.rows_read++;

        std::string error_msg;
        LoanRecord rec;
        if (!split_delimited_line(line, options.delimiter, fields)) {
            error_msg = "unterminated quoted field";
        } else if (parse_loan_row(fields, rec, error_msg)) {
            result.records.push_back(std::move(rec));
            continue;
        }

        result.rows_skipped++;
        logger.warn("Skipping line %zu: %s", line_no, error_msg.c_str());
    }

    if (result.records.empty()) {
        logger.error("No usable loan records (%zu rows read, %zu skipped)",
                     result.rows_read, result.rows_skipped);
        return false;
    }
    return true;
}

bool read_loan_csv(const std::string& path, const LoanCsvOptions& options,
                   LoanCsvResult& result, const Logger& logger) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger.error("Cannot open %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    return read_loan_csv_stream(file, options, result, logger);
}

} // namespace loanrecon
