#include "case_data.h"
#include "case_session.h"
#include "event_dispatcher.h"
#include "log_service.h"
#include "string_utils.h"
#include "temp_case_janitor.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}

void MakeDir(const fs::path& path, std::chrono::hours age, bool is_case = true) {
  fs::create_directories(path / "system");
  std::ofstream(path / "system" / "controlDict") << "application foam;\n";
  if (is_case) {
    std::ofstream(path / kCaseDataFileName) << "{}\n";
  }
  fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}
}  // namespace

int main() {
  if (!Check(IsTempCaseDirectoryName("temp_20240101_000000_a1b2c3d4") &&
                 !IsTempCaseDirectoryName("temp_user_downloads") &&
                 !IsTempCaseDirectoryName("temp_20240101_000000_") &&
                 !IsTempCaseDirectoryName("temp_2024010_0000000_abc") &&
                 !IsTempCaseDirectoryName("temp_20240101_000000_ABC"),
             "temp case name matching is wrong")) {
    return 1;
  }

  const fs::path root = fs::temp_directory_path() / ("caseflow_janitor_" + caseflow::GenerateRandomTag(8));
  const fs::path expired = root / "temp_20240101_000000_aaaaaaaa";
  const fs::path fresh = root / "temp_20240301_000000_bbbbbbbb";
  const fs::path current = root / "temp_20240101_000000_cccccccc";
  const fs::path foreign = root / "keep_me_old";
  const fs::path boundary = root / "temp_20240201_000000_dddddddd";
  MakeDir(expired, std::chrono::hours(24 * 10));
  MakeDir(fresh, std::chrono::hours(1));
  MakeDir(current, std::chrono::hours(24 * 30));
  MakeDir(foreign, std::chrono::hours(24 * 30));
  MakeDir(boundary, std::chrono::hours(24 * 6));
  // Old directories under a shared root that are not temp cases.
  const fs::path user_dir = root / "temp_user_downloads";
  const fs::path not_a_case = root / "temp_20240101_000000_eeeeeeee";
  MakeDir(user_dir, std::chrono::hours(24 * 30), false);
  std::ofstream(user_dir / "precious.txt") << "keep";
  fs::last_write_time(user_dir, fs::file_time_type::clock::now() - std::chrono::hours(24 * 30));
  MakeDir(not_a_case, std::chrono::hours(24 * 30), false);
  std::ofstream(root / "temp_not_a_dir") << "x";

  LogService log;
  TempCaseJanitor janitor(&log);
  JanitorOptions options;
  options.temp_root = root;
  options.retention = RetentionFromDays(7);
  options.exclude.push_back(current);

  for (int run = 0; run < 3; ++run) {
    JanitorReport report = janitor.Sweep(options);
    const int expected_removed = run == 0 ? 1 : 0;
    if (!Check(report.removed == expected_removed && report.failed == 0,
               "unexpected removal count on run " + std::to_string(run) + ": " +
                   std::to_string(report.removed))) {
      return 1;
    }
    if (!Check(!fs::exists(expired), "expired temp case survived")) {
      return 1;
    }
    if (!Check(fs::exists(fresh) && fs::exists(boundary), "young temp case was removed")) {
      return 1;
    }
    if (!Check(fs::exists(current), "current session directory was removed")) {
      return 1;
    }
    if (!Check(fs::exists(foreign) && fs::exists(root / "temp_not_a_dir"),
               "non temp entries were touched")) {
      return 1;
    }
    if (!Check(fs::exists(user_dir / "precious.txt") && fs::exists(not_a_case),
               "a directory that is not a temp case was removed")) {
      return 1;
    }
  }

  // A sweep against a later clock expires the boundary case too.
  JanitorReport later = janitor.Sweep(options, fs::file_time_type::clock::now() + std::chrono::hours(48));
  if (!Check(later.removed == 1 && !fs::exists(boundary) && fs::exists(fresh),
             "clock-shifted sweep removed the wrong directories")) {
    return 1;
  }

  // Zero retention removes everything that is not excluded.
  MakeDir(expired, std::chrono::hours(1));
  EventDispatcher dispatcher;
  bool done = false;
  JanitorReport background;
  options.retention = std::chrono::seconds(0);
  if (!Check(janitor.StartBackgroundSweep(options, dispatcher,
                                          [&](const JanitorReport& report) {
                                            done = true;
                                            background = report;
                                          }),
             "background sweep did not start")) {
    return 1;
  }
  if (!Check(dispatcher.PumpUntil([&] { return done; }, std::chrono::seconds(10)),
             "background sweep never reported")) {
    return 1;
  }
  janitor.Wait();
  if (!Check(background.removed == 2 && !fs::exists(expired) && !fs::exists(fresh) &&
                 fs::exists(current) && fs::exists(user_dir / "precious.txt") &&
                 fs::exists(not_a_case),
             "background sweep report is wrong")) {
    return 1;
  }

  // Missing temp root is not an error.
  options.temp_root = root / "nope";
  JanitorReport empty = janitor.Sweep(options);
  if (!Check(empty.scanned == 0 && empty.removed == 0, "missing temp root was scanned")) {
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
