#include "core/amount.hpp"
#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace loanrecon {

bool parse_amount(const std::string& s, Amount& out) {
    size_t i = 0;
    size_t end = s.size();
    while (i < end && std::isspace(static_cast<unsigned char>(s[i]))) i++;
    while (end > i && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    if (i == end) return false;

    bool negative = false;
    bool seen_sign = false;
    bool seen_dollar = false;
    // Sign and currency symbol may appear in either order: "-$5", "$-5"
    while (i < end) {
        char c = s[i];
        if ((c == '-' || c == '+') && !seen_sign) {
            negative = (c == '-');
            seen_sign = true;
            i++;
        } else if (c == '$' && !seen_dollar) {
            seen_dollar = true;
            i++;
        } else {
            break;
        }
    }

    constexpr int64_t kMaxWhole = MAX_ABS_AMOUNT / AMOUNT_SCALE;
    int64_t whole = 0;
    int digits = 0;
    for (; i < end; i++) {
        char c = s[i];
        if (c == ',') {
            if (digits == 0) return false;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) break;
        int d = c - '0';
        whole = whole * 10 + d;
        if (whole > kMaxWhole) return false;
        digits++;
    }

    int64_t frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (i < end && s[i] == '.') {
        i++;
        for (; i < end && std::isdigit(static_cast<unsigned char>(s[i])); i++) {
            int d = s[i] - '0';
            if (frac_digits < AMOUNT_FRACTION_DIGITS) {
                frac = frac * 10 + d;
            } else if (frac_digits == AMOUNT_FRACTION_DIGITS) {
                round_up = (d >= 5);
            }
            frac_digits++;
            digits++;
        }
    }

    if (digits == 0 || i != end) return false;

    for (int k = std::min(frac_digits, AMOUNT_FRACTION_DIGITS);
         k < AMOUNT_FRACTION_DIGITS; k++) {
        frac *= 10;
    }

    int64_t value = whole * AMOUNT_SCALE + frac;
    if (round_up) value++;
    if (value > MAX_ABS_AMOUNT) return false;
    out = negative ? -value : value;
    return true;
}

std::string format_amount(Amount a) {
    bool negative = a < 0;
    // Work in unsigned to cover INT64_MIN
    uint64_t mag = negative ? (~static_cast<uint64_t>(a) + 1) : static_cast<uint64_t>(a);
    uint64_t whole = mag / AMOUNT_SCALE;
    uint64_t frac = mag % AMOUNT_SCALE;

    std::string frac_str = std::to_string(frac);
    frac_str.insert(0, AMOUNT_FRACTION_DIGITS - frac_str.size(), '0');
    while (frac_str.size() > 2 && frac_str.back() == '0') frac_str.pop_back();

    std::string result;
    if (negative) result.push_back('-');
    result += std::to_string(whole);
    result.push_back('.');
    result += frac_str;
    return result;
}

Amount checked_add(Amount a, Amount b) {
    Amount sum;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw std::overflow_error("amount total out of range");
    }
    return sum;
}

} // namespace loanrecon
