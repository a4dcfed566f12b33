#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace caseflow {

// Trim leading and trailing whitespace.
std::string Trim(const std::string& text);

// Lowercase a string (ASCII-safe).
std::string ToLower(const std::string& text);

bool StartsWith(const std::string& text, const std::string& prefix);

// Splits on whitespace, dropping empty tokens.
std::vector<std::string> SplitWhitespace(const std::string& text);

// Random [a-z0-9] tag used to make directory names unique.
std::string GenerateRandomTag(size_t length);

// 2024-05-01T13:45:10 in local time.
std::string FormatIsoLocal(std::chrono::system_clock::time_point when);
// 20240501_134510 in local time.
std::string FormatCompactLocal(std::chrono::system_clock::time_point when);

}  // namespace caseflow

#endif
