// Thread-safe log buffer shared by the session, loader and job components.
#ifndef LOG_SERVICE_H
#define LOG_SERVICE_H

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

class LogService {
 public:
  struct FilterOptions {
    bool show_errors = true;
    bool show_warnings = true;
    bool show_info = true;
    std::string category;  // Empty matches every category.
    std::string search_text;
  };

  explicit LogService(size_t max_lines = kDefaultMaxLines);
  LogService(const LogService&) = delete;
  LogService& operator=(const LogService&) = delete;
  ~LogService() = default;

  void Append(const std::string& category, const std::string& message);
  void Info(const std::string& category, const std::string& message);
  void Warning(const std::string& category, const std::string& message);
  void Error(const std::string& category, const std::string& message);
  void Clear();

  // Mirror every appended line to stderr.
  void SetEcho(bool echo);
  bool Echo() const;

  std::vector<std::string> GetFiltered(const FilterOptions& opts) const;
  std::vector<std::string> Tail(size_t count) const;
  size_t Size() const;

  static constexpr size_t kDefaultMaxLines = 2000;

 private:
  std::vector<std::string> logs_;
  size_t max_lines_;
  bool echo_ = false;
  mutable std::mutex mutex_;
};

#endif  // LOG_SERVICE_H
