#ifndef TEMP_CASE_JANITOR_H
#define TEMP_CASE_JANITOR_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class EventDispatcher;
class LogService;

struct JanitorOptions {
  std::filesystem::path temp_root;
  std::chrono::seconds retention = std::chrono::hours(24 * 7);
  // Directories never removed (the current session).
  std::vector<std::filesystem::path> exclude;
};

struct JanitorReport {
  int scanned = 0;
  int removed = 0;
  int kept = 0;
  int failed = 0;
  std::vector<std::filesystem::path> removed_paths;
};

std::chrono::seconds RetentionFromDays(int days);

/**
 * TempCaseJanitor - removes abandoned temp case directories.
 *
 * Only direct children of the temp root named like a temp case
 * (temp_YYYYMMDD_HHMMSS_<tag>) and holding case_data.json are candidates. A candidate is removed when its last write time is older than
 * the retention window and it is not excluded. Failures are logged and
 * counted; a sweep never stops early.
 */
class TempCaseJanitor {
 public:
  using Completion = std::function<void(const JanitorReport&)>;

  explicit TempCaseJanitor(LogService* log);
  ~TempCaseJanitor();

  TempCaseJanitor(const TempCaseJanitor&) = delete;
  TempCaseJanitor& operator=(const TempCaseJanitor&) = delete;

  JanitorReport Sweep(const JanitorOptions& options) const;
  JanitorReport Sweep(const JanitorOptions& options,
                      std::filesystem::file_time_type now) const;

  // Runs one sweep on a background thread and posts the report to the
  // dispatcher. Returns false if a background sweep is still running.
  bool StartBackgroundSweep(const JanitorOptions& options, EventDispatcher& dispatcher,
                            Completion on_done);
  void Wait();

 private:
  LogService* log_;
  std::mutex mutex_;
  std::thread worker_;
  bool running_ = false;
};

#endif  // TEMP_CASE_JANITOR_H
