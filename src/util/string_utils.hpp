#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace loanrecon {

// ASCII lower-casing (protocol text is UTF-8; non-ASCII bytes pass through).
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// ASCII case-insensitive equality.
bool iequals(const std::string& a, const std::string& b);

// Case-insensitive substring test. An empty needle always matches.
bool icontains(const std::string& haystack, const std::string& needle);

// Strip leading/trailing whitespace.
std::string trim(const std::string& s);

// Format an integer with ',' thousands separators: 80000 -> "80,000".
std::string format_count(uint64_t n);

// ISO-8601 UTC with milliseconds: "2024-05-01T12:34:56.789Z".
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

} // namespace loanrecon
