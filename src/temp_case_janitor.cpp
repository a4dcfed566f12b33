#include "temp_case_janitor.h"

#include <system_error>
#include <utility>

#include "case_session.h"
#include "event_dispatcher.h"
#include "log_service.h"

namespace {
std::filesystem::path Canonical(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path out = std::filesystem::weakly_canonical(path, ec);
  return ec ? path.lexically_normal() : out;
}
}  // namespace

std::chrono::seconds RetentionFromDays(int days) {
  return std::chrono::hours(24 * (days < 0 ? 0 : days));
}

TempCaseJanitor::TempCaseJanitor(LogService* log) : log_(log) {}

TempCaseJanitor::~TempCaseJanitor() {
  Wait();
}

JanitorReport TempCaseJanitor::Sweep(const JanitorOptions& options) const {
  return Sweep(options, std::filesystem::file_time_type::clock::now());
}

JanitorReport TempCaseJanitor::Sweep(const JanitorOptions& options,
                                     std::filesystem::file_time_type now) const {
  JanitorReport report;
  std::error_code ec;
  if (!std::filesystem::is_directory(options.temp_root, ec)) {
    return report;
  }

  std::vector<std::filesystem::path> excluded;
  excluded.reserve(options.exclude.size());
  for (const auto& path : options.exclude) {
    if (!path.empty()) {
      excluded.push_back(Canonical(path));
    }
  }

  std::filesystem::directory_iterator it(options.temp_root, ec);
  if (ec) {
    if (log_) {
      log_->Warning("janitor", "cannot scan " + options.temp_root.string() + ": " + ec.message());
    }
    return report;
  }
  for (; it != std::filesystem::end(it); it.increment(ec)) {
    if (ec) {
      break;
    }
    const std::filesystem::path path = it->path();
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec) || !IsTempCaseDirectoryName(path.filename().string())) {
      continue;
    }
    // Only directories that are cases; anything else under a shared root stays.
    if (!std::filesystem::is_regular_file(path / kCaseDataFileName, entry_ec)) {
      continue;
    }
    ++report.scanned;

    bool is_excluded = false;
    const std::filesystem::path canonical = Canonical(path);
    for (const auto& skip : excluded) {
      if (skip == canonical) {
        is_excluded = true;
        break;
      }
    }
    const auto written = std::filesystem::last_write_time(path, entry_ec);
    if (is_excluded || entry_ec || now - written <= options.retention) {
      ++report.kept;
      continue;
    }

    std::filesystem::remove_all(path, entry_ec);
    if (entry_ec) {
      ++report.failed;
      if (log_) {
        log_->Warning("janitor", "failed to remove " + path.string() + ": " + entry_ec.message());
      }
      continue;
    }
    ++report.removed;
    report.removed_paths.push_back(path);
    if (log_) {
      log_->Info("janitor", "removed expired temp case " + path.string());
    }
  }
  if (ec && log_) {
    log_->Warning("janitor", "scan of " + options.temp_root.string() + " stopped: " + ec.message());
  }
  return report;
}

bool TempCaseJanitor::StartBackgroundSweep(const JanitorOptions& options,
                                           EventDispatcher& dispatcher, Completion on_done) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return false;
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = true;
  worker_ = std::thread([this, options, &dispatcher, on_done = std::move(on_done)]() {
    JanitorReport report = Sweep(options);
    {
      std::lock_guard<std::mutex> done_lock(mutex_);
      running_ = false;
    }
    dispatcher.Post([report, on_done]() {
      if (on_done) {
        on_done(report);
      }
    });
  });
  return true;
}

void TempCaseJanitor::Wait() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker = std::move(worker_);
  }
  if (worker.joinable()) {
    worker.join();
  }
}
