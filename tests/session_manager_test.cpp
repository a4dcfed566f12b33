#include "session_manager.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "event_dispatcher.h"
#include "execution_controller.h"
#include "file_utils.h"
#include "job_registry.h"
#include "log_service.h"
#include "string_utils.h"

namespace fs = std::filesystem;

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}

CommandSpec Sleeper() {
  CommandSpec spec;
  spec.steps.push_back(ShellStep("echo started; sleep 30"));
  return spec;
}
}  // namespace

int main() {
  const fs::path scratch =
      fs::temp_directory_path() / ("caseflow_manager_test_" + caseflow::GenerateRandomTag(8));
  const fs::path base = scratch / "basecase";
  const fs::path temp_root = scratch / "temp";
  std::string error;
  if (!WriteStringToFile(base / "system" / "controlDict", "application foamRun;\n", &error)) {
    std::cerr << error << "\n";
    return 1;
  }

  LogService log;
  EventDispatcher dispatcher;
  JobRegistry registry;
  ExecutionController controller(registry, dispatcher, &log, std::chrono::milliseconds(200));
  SessionManager manager(controller, &log, std::chrono::seconds(5));

  if (!Check(manager.Current() == nullptr, "manager starts with a session")) {
    return 1;
  }
  CaseError case_error;
  if (!Check(manager.OpenOrCreate("", base, temp_root, &case_error), DescribeError(case_error))) {
    return 1;
  }
  CaseSession* temp = manager.Current();
  if (!Check(temp && temp->IsTemporary(), "expected a temporary session")) {
    return 1;
  }
  const fs::path temp_path = temp->Path();
  const std::string temp_id = temp->Id();

  JanitorOptions options = manager.JanitorOptionsFor(temp_root, std::chrono::hours(1));
  if (!Check(options.exclude.size() == 1 && options.exclude.front() == temp_path,
             "janitor options do not protect the current case")) {
    return 1;
  }

  // Jobs write into the case directory, so they dirty the current session.
  // Jobs of other cases leave it alone.
  {
    std::vector<JobEvent> events;
    const int token =
        controller.SubscribeAll([&events](const JobEvent& event) { events.push_back(event); });
    auto terminal_seen = [&](uint64_t id) {
      for (const auto& event : events) {
        if (event.job_id == id && event.kind == JobEventKind::StateChanged &&
            IsTerminal(event.state)) {
          return true;
        }
      }
      return false;
    };
    if (!Check(!temp->IsDirty(), "fresh temp session is dirty")) {
      return 1;
    }
    const fs::path other_dir = scratch / "other_case";
    fs::create_directories(other_dir);
    CommandSpec other;
    other.steps.push_back(ShellStep("echo other > log.other"));
    LaunchResult foreign = controller.Launch("other-case", other_dir, JobKind::Other, other);
    if (!Check(foreign.ok, DescribeError(foreign.error))) {
      return 1;
    }
    controller.WaitForJob(foreign.job.id, std::chrono::seconds(20));
    dispatcher.PumpUntil([&] { return terminal_seen(foreign.job.id); }, std::chrono::seconds(5));
    if (!Check(terminal_seen(foreign.job.id) && !temp->IsDirty(),
               "a job of another case dirtied the session")) {
      return 1;
    }

    CommandSpec mesh;
    mesh.steps.push_back(ShellStep("echo mesh > log.mesh"));
    LaunchResult own = controller.Launch(*temp, JobKind::MeshGeneration, mesh);
    if (!Check(own.ok, DescribeError(own.error))) {
      return 1;
    }
    controller.WaitForJob(own.job.id, std::chrono::seconds(20));
    dispatcher.PumpUntil([&] { return terminal_seen(own.job.id); }, std::chrono::seconds(5));
    if (!Check(terminal_seen(own.job.id) && temp->IsDirty() &&
                   fs::is_regular_file(temp_path / "log.mesh"),
               "a finished job did not dirty its session")) {
      return 1;
    }
    controller.Unsubscribe(token);
  }

  // Closing stops the session's jobs before the directory goes away.
  LaunchResult launch = controller.Launch(*temp, JobKind::SolverRun, Sleeper());
  if (!Check(launch.ok, DescribeError(launch.error))) {
    return 1;
  }
  manager.Close();
  std::optional<Job> job = registry.Find(launch.job.id);
  if (!Check(job && job->state == JobState::Cancelled && job->case_id == temp_id,
             "close left the job running")) {
    return 1;
  }
  if (!Check(manager.Current() == nullptr && !fs::exists(temp_path),
             "close did not discard the temporary case")) {
    return 1;
  }
  if (!Check(manager.JanitorOptionsFor(temp_root, std::chrono::hours(1)).exclude.empty(),
             "closed session still excluded")) {
    return 1;
  }

  // Release keeps the directory and hands the session back.
  if (!Check(manager.OpenOrCreate("", base, temp_root, &case_error), DescribeError(case_error))) {
    return 1;
  }
  launch = controller.Launch(*manager.Current(), JobKind::MeshGeneration, Sleeper());
  std::unique_ptr<CaseSession> released = manager.Release();
  if (!Check(released && manager.Current() == nullptr && fs::is_directory(released->Path()),
             "release discarded the session")) {
    return 1;
  }
  job = registry.Find(launch.job.id);
  if (!Check(job && IsTerminal(job->state), "release left the job running")) {
    return 1;
  }

  // Opening an existing case replaces the current one.
  const fs::path kept = released->Path();
  released.reset();
  if (!Check(manager.OpenOrCreate(kept, base, temp_root, &case_error) &&
                 !manager.Current()->IsTemporary() && manager.Current()->Path() == kept,
             "existing case did not open")) {
    return 1;
  }
  if (!Check(!manager.OpenOrCreate(scratch / "missing", base, temp_root, &case_error) &&
                 case_error.kind == ErrorKind::InvalidCase && manager.Current() != nullptr,
             "failed open replaced the current session")) {
    return 1;
  }
  manager.Close();
  if (!Check(fs::is_directory(kept), "close removed a saved case")) {
    return 1;
  }

  controller.Shutdown();
  std::error_code ec;
  fs::remove_all(scratch, ec);
  return 0;
}
