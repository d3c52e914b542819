#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "util/logger.hpp"

namespace loanrecon {

struct LoanCsvOptions {
    char delimiter = ',';
    bool has_header = true;   // first row holds column names
};

struct LoanCsvResult {
    std::vector<LoanRecord> records;
    size_t rows_read = 0;     // data rows seen (header and blank lines excluded)
    size_t rows_skipped = 0;  // malformed rows dropped
};

// Split one delimited line into fields.
// Double-quoted fields may contain the delimiter; "" inside quotes is a
// literal quote. Returns false on an unterminated quote.
bool split_delimited_line(const std::string& line, char delimiter,
                          std::vector<std::string>& fields);

// Parse one data row into a record.
// Columns: LoanID, BorrowerName, Servicer_LoanAmount, FNMA_LoanAmount,
// DifferenceAmount, ReconciledStatus. An empty DifferenceAmount is derived
// as servicer - fnma. On failure sets error_msg and returns false.
bool parse_loan_row(const std::vector<std::string>& fields,
                    LoanRecord& rec, std::string& error_msg);

// Read loan records from a stream. Malformed rows are skipped with a
// warning. Returns false if no record could be parsed.
bool read_loan_csv_stream(std::istream& in, const LoanCsvOptions& options,
                          LoanCsvResult& result, const Logger& logger);

// Read loan records from a file.
// Returns false if the file cannot be opened or holds no usable record.
bool read_loan_csv(const std::string& path, const LoanCsvOptions& options,
                   LoanCsvResult& result, const Logger& logger);

} // namespace loanrecon
