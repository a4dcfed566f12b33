#include "execution_controller.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "event_dispatcher.h"
#include "file_utils.h"
#include "job_registry.h"
#include "log_service.h"
#include "string_utils.h"

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}

CommandSpec Shell(const std::string& command, const std::string& log_name = "") {
  CommandSpec spec;
  spec.steps.push_back(ShellStep(command, "", log_name));
  return spec;
}

std::vector<std::string> ProgressTexts(const std::vector<JobEvent>& events, uint64_t job_id) {
  std::vector<std::string> texts;
  for (const auto& event : events) {
    if (event.job_id == job_id && event.kind == JobEventKind::Progress) {
      texts.push_back(event.progress.text);
    }
  }
  return texts;
}

std::vector<JobState> StateChanges(const std::vector<JobEvent>& events, uint64_t job_id) {
  std::vector<JobState> states;
  for (const auto& event : events) {
    if (event.job_id == job_id && event.kind == JobEventKind::StateChanged) {
      states.push_back(event.state);
    }
  }
  return states;
}
}  // namespace

int main() {
  const std::filesystem::path case_dir = std::filesystem::temp_directory_path() /
                                         ("caseflow_exec_" + caseflow::GenerateRandomTag(8));
  std::error_code ec;
  std::filesystem::create_directories(case_dir / "sub", ec);
  if (ec) {
    std::cerr << "cannot create " << case_dir << "\n";
    return 1;
  }

  LogService log;
  EventDispatcher dispatcher;
  JobRegistry registry;
  const std::chrono::milliseconds grace(300);
  ExecutionController controller(registry, dispatcher, &log, grace);

  std::vector<JobEvent> events;
  controller.SubscribeAll([&events](const JobEvent& event) { events.push_back(event); });
  auto finished = [&](uint64_t id) {
    std::optional<Job> job = controller.WaitForJob(id, std::chrono::seconds(20));
    dispatcher.PumpUntil(
        [&] {
          for (const auto& event : events) {
            if (event.job_id == id && event.kind == JobEventKind::StateChanged &&
                IsTerminal(event.state)) {
              return true;
            }
          }
          return false;
        },
        std::chrono::seconds(5));
    return job;
  };

  // Output lines arrive in order, stdout and stderr merged, and land in the log file.
  {
    LaunchResult launch = controller.Launch(
        "case-a", case_dir, JobKind::Other,
        Shell("printf 'Time = 0.1\\nsecond line\\n'; echo on-stderr 1>&2; printf 'no newline'",
              "log.test"));
    if (!Check(launch.ok && launch.job.state == JobState::Pending, "launch failed")) {
      return 1;
    }
    std::optional<Job> job = finished(launch.job.id);
    if (!Check(job && job->state == JobState::Succeeded && job->exit_code && *job->exit_code == 0,
               "simple job did not succeed")) {
      return 1;
    }
    const std::vector<std::string> expected = {"Time = 0.1", "second line", "on-stderr",
                                               "no newline"};
    if (!Check(ProgressTexts(events, launch.job.id) == expected, "progress lines are wrong")) {
      return 1;
    }
    if (!Check(job->progress.size() == 4 && job->progress.front().sim_time &&
                   job->progress.back().sequence == 4,
               "registry progress is wrong")) {
      return 1;
    }
    const std::vector<JobState> states = {JobState::Running, JobState::Succeeded};
    if (!Check(StateChanges(events, launch.job.id) == states, "state events are wrong")) {
      return 1;
    }
    std::string contents;
    std::string error;
    if (!Check(ReadFileToString(case_dir / "log.test", &contents, &error) &&
                   contents == "Time = 0.1\nsecond line\non-stderr\nno newline\n",
               "log file contents are wrong")) {
      return 1;
    }
  }

  // Non-zero exit.
  {
    LaunchResult launch = controller.Launch("case-a", case_dir, JobKind::Other, Shell("exit 3"));
    std::optional<Job> job = finished(launch.job.id);
    if (!Check(job && job->state == JobState::Failed && job->exit_code && *job->exit_code == 3 &&
                   job->error.kind == ErrorKind::ProcessFailure && job->error.exit_code == 3,
               "failing job has the wrong outcome")) {
      return 1;
    }
  }

  // Missing executable: Failed(Launch) without ever running.
  {
    CommandSpec spec;
    CommandStep step;
    step.argv = {"caseflow-test-no-such-binary"};
    spec.steps.push_back(step);
    LaunchResult launch = controller.Launch("case-a", case_dir, JobKind::Other, spec);
    std::optional<Job> job = finished(launch.job.id);
    if (!Check(job && job->state == JobState::Failed && job->error.kind == ErrorKind::Launch &&
                   !job->started_at && !job->exit_code,
               "missing binary has the wrong outcome")) {
      return 1;
    }
    const std::vector<JobState> states = {JobState::Failed};
    if (!Check(StateChanges(events, launch.job.id) == states, "missing binary reported Running")) {
      return 1;
    }
  }

  // Steps run in order and stop at the first failure; env and working dirs apply.
  {
    CommandSpec spec;
    spec.env["CASEFLOW_TEST_VALUE"] = "42";
    spec.steps.push_back(ShellStep("echo value=$CASEFLOW_TEST_VALUE"));
    spec.steps.push_back(ShellStep("basename \"$(pwd -P)\"", "sub"));
    spec.steps.push_back(ShellStep("exit 2"));
    spec.steps.push_back(ShellStep("echo unreachable"));
    LaunchResult launch = controller.Launch("case-b", case_dir, JobKind::MeshGeneration, spec);
    std::optional<Job> job = finished(launch.job.id);
    if (!Check(job && job->state == JobState::Failed && job->exit_code && *job->exit_code == 2 &&
                   job->current_step == 2 && job->step_count == 4,
               "multi-step job has the wrong outcome")) {
      return 1;
    }
    const std::vector<std::string> expected = {"value=42", "sub"};
    if (!Check(ProgressTexts(events, launch.job.id) == expected, "multi-step output is wrong")) {
      return 1;
    }
  }

  // One active job per (case, kind); cancel frees the slot.
  {
    LaunchResult first =
        controller.Launch("case-c", case_dir, JobKind::SolverRun, Shell("sleep 30"));
    LaunchResult second =
        controller.Launch("case-c", case_dir, JobKind::SolverRun, Shell("echo never"));
    if (!Check(first.ok && !second.ok && second.error.kind == ErrorKind::DuplicateJob,
               "duplicate launch was accepted")) {
      return 1;
    }
    controller.Cancel(first.job.id);
    controller.Cancel(first.job.id);
    std::optional<Job> job = finished(first.job.id);
    if (!Check(job && job->state == JobState::Cancelled, "cancelled job has the wrong state")) {
      return 1;
    }
    LaunchResult again =
        controller.Launch("case-c", case_dir, JobKind::SolverRun, Shell("echo again"));
    if (!Check(again.ok, "slot was not freed after cancel")) {
      return 1;
    }
    finished(again.job.id);
  }

  // A process that ignores SIGTERM is killed after the grace period.
  {
    LaunchResult launch = controller.Launch("case-d", case_dir, JobKind::SolverRun,
                                            Shell("trap '' TERM; echo ready; sleep 30"));
    if (!Check(launch.ok, "stubborn launch failed")) {
      return 1;
    }
    const bool ready = dispatcher.PumpUntil(
        [&] { return !ProgressTexts(events, launch.job.id).empty(); }, std::chrono::seconds(10));
    if (!Check(ready, "stubborn job never became ready")) {
      return 1;
    }
    const auto start = std::chrono::steady_clock::now();
    controller.Cancel(launch.job.id);
    std::optional<Job> job = finished(launch.job.id);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    if (!Check(job && job->state == JobState::Cancelled && job->exit_code &&
                   *job->exit_code == 128 + 9,
               "stubborn job was not killed")) {
      return 1;
    }
    if (!Check(elapsed < grace + std::chrono::seconds(3), "escalation took too long")) {
      return 1;
    }
  }

  // CancelAllForCase and per-job subscriptions.
  {
    std::vector<JobEvent> solver_only;
    LaunchResult mesh = controller.Launch("case-e", case_dir, JobKind::MeshGeneration,
                                          Shell("echo mesh; sleep 30"));
    LaunchResult solver = controller.Launch("case-e", case_dir, JobKind::SolverRun,
                                            Shell("echo solver; sleep 30"));
    const int token = controller.Subscribe(
        solver.job.id, [&solver_only](const JobEvent& event) { solver_only.push_back(event); });
    std::vector<uint64_t> ids = controller.CancelAllForCase("case-e");
    if (!Check(ids.size() == 2, "CancelAllForCase missed a job")) {
      return 1;
    }
    std::optional<Job> mesh_job = finished(mesh.job.id);
    std::optional<Job> solver_job = finished(solver.job.id);
    if (!Check(mesh_job && mesh_job->state == JobState::Cancelled && solver_job &&
                   solver_job->state == JobState::Cancelled,
               "CancelAllForCase left a job running")) {
      return 1;
    }
    controller.Unsubscribe(token);
    for (const auto& event : solver_only) {
      if (!Check(event.job_id == solver.job.id, "per-job subscription saw another job")) {
        return 1;
      }
    }
    if (!Check(!solver_only.empty() && IsTerminal(solver_only.back().state),
               "per-job subscription missed the terminal event")) {
      return 1;
    }
  }

  if (!Check(!controller.WaitForJob(9999, std::chrono::milliseconds(10)).has_value(),
             "unknown job id returned a snapshot")) {
    return 1;
  }
  if (!Check(registry.ActiveJobs().empty(), "jobs left active")) {
    return 1;
  }

  controller.Shutdown();
  LaunchResult late = controller.Launch("case-f", case_dir, JobKind::Other, Shell("true"));
  if (!Check(!late.ok && late.error.kind == ErrorKind::Launch, "launch after shutdown succeeded")) {
    return 1;
  }

  std::filesystem::remove_all(case_dir, ec);
  return 0;
}
