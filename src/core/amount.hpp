#pragma once

#include <string>

#include "core/config.hpp"
#include "core/types.hpp"

namespace loanrecon {

// Parse a decimal currency string into an Amount.
// Accepts surrounding whitespace, an optional sign, an optional '$',
// ',' thousands separators and a fractional part. Fractions longer than
// 4 digits are rounded half away from zero.
// Examples: "1234.56", "-12", "$1,000.00", "+0.00005"
// Returns false on malformed input or when |value| exceeds MAX_ABS_AMOUNT;
// out is left unchanged.
bool parse_amount(const std::string& s, Amount& out);

// Format an Amount as a plain decimal string with at least 2 fraction
// digits and no trailing zeros beyond that ("1234.50", "-0.0125").
std::string format_amount(Amount a);

// a + b. Throws std::overflow_error if the sum does not fit an Amount.
Amount checked_add(Amount a, Amount b);

inline double amount_to_double(Amount a) {
    return static_cast<double>(a) / static_cast<double>(AMOUNT_SCALE);
}

inline Amount amount_abs(Amount a) {
    return a < 0 ? -a : a;
}

} // namespace loanrecon
