#include "log_service.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

bool ContainsCaseInsensitive(const std::string& text, const std::string& needle) {
  if (needle.empty()) return true;
  auto to_lower = [](const std::string& in) {
    std::string out(in.size(), '\0');
    std::transform(in.begin(), in.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  };
  const std::string hay_lower = to_lower(text);
  const std::string needle_lower = to_lower(needle);
  return hay_lower.find(needle_lower) != std::string::npos;
}

bool IsError(const std::string& line) {
  return ContainsCaseInsensitive(line, "error");
}

bool IsWarning(const std::string& line) {
  return ContainsCaseInsensitive(line, "warning");
}

bool HasCategory(const std::string& line, const std::string& category) {
  if (category.empty()) return true;
  const std::string prefix = "[" + category + "]";
  return line.compare(0, prefix.size(), prefix) == 0;
}

std::string LocalTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm local = {};
  localtime_r(&t, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

}  // namespace

LogService::LogService(size_t max_lines) : max_lines_(std::max<size_t>(1, max_lines)) {}

void LogService::Append(const std::string& category, const std::string& message) {
  if (message.empty()) {
    return;
  }
  const std::string line = "[" + category + "] " + message;
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.push_back(line);
  if (logs_.size() > max_lines_) {
    const size_t start = logs_.size() - max_lines_;
    logs_.erase(logs_.begin(), logs_.begin() + static_cast<std::ptrdiff_t>(start));
  }
  if (echo_) {
    // stdout carries job output.
    std::cerr << "[" << LocalTimestamp() << "] " << line << std::endl;
  }
}

void LogService::Info(const std::string& category, const std::string& message) {
  Append(category, message);
}

void LogService::Warning(const std::string& category, const std::string& message) {
  Append(category, "warning: " + message);
}

void LogService::Error(const std::string& category, const std::string& message) {
  Append(category, "error: " + message);
}

void LogService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  logs_.clear();
}

void LogService::SetEcho(bool echo) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = echo;
}

bool LogService::Echo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return echo_;
}

std::vector<std::string> LogService::GetFiltered(const FilterOptions& opts) const {
  std::vector<std::string> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& line : logs_) {
    if (!HasCategory(line, opts.category)) continue;

    const bool error_line = IsError(line);
    const bool warning_line = IsWarning(line);

    if (error_line && !opts.show_errors) continue;
    if (warning_line && !opts.show_warnings) continue;
    if (!error_line && !warning_line && !opts.show_info) continue;

    if (!opts.search_text.empty() && !ContainsCaseInsensitive(line, opts.search_text)) {
      continue;
    }
    out.push_back(line);
  }
  return out;
}

std::vector<std::string> LogService::Tail(size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t start = logs_.size() > count ? logs_.size() - count : 0;
  return std::vector<std::string>(logs_.begin() + static_cast<std::ptrdiff_t>(start),
                                  logs_.end());
}

size_t LogService::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return logs_.size();
}
