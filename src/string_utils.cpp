#include "string_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <random>
#include <sstream>

namespace caseflow {
namespace {
std::string FormatLocal(std::chrono::system_clock::time_point when, const char* format) {
  const std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char buffer[64];
  const size_t n = std::strftime(buffer, sizeof(buffer), format, &tm_buf);
  return std::string(buffer, n);
}
}  // namespace

std::string Trim(const std::string& text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

std::string ToLower(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool StartsWith(const std::string& text, const std::string& prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream in(text);
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string GenerateRandomTag(size_t length) {
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kAlphabet[dist(gen)]);
  }
  return out;
}

std::string FormatIsoLocal(std::chrono::system_clock::time_point when) {
  return FormatLocal(when, "%Y-%m-%dT%H:%M:%S");
}

std::string FormatCompactLocal(std::chrono::system_clock::time_point when) {
  return FormatLocal(when, "%Y%m%d_%H%M%S");
}

}  // namespace caseflow
