#pragma once

#include <cstdint>
#include <string>

namespace loanrecon {

// Fixed-point currency value in 1/10000 units (see core/amount.hpp).
using Amount = int64_t;

// One loan-reconciliation row. Immutable once loaded into a snapshot.
struct LoanRecord {
    std::string loan_id;
    std::string borrower_name;
    Amount servicer_amount = 0;     // first reported amount
    Amount fnma_amount = 0;         // second reported amount
    Amount difference_amount = 0;   // signed
    std::string reconciled_status;

    bool has_mismatch() const { return difference_amount != 0; }
};

} // namespace loanrecon
