#include "job_registry.h"

#include <atomic>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {
bool Check(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << message << "\n";
  }
  return condition;
}
}  // namespace

int main() {
  // Concurrent reservations for one (case, kind): exactly one wins.
  {
    JobRegistry registry;
    std::atomic<int> winners{0};
    std::atomic<int> duplicates{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
      threads.emplace_back([&] {
        Job job;
        CaseError error;
        if (registry.TryReserve("case-a", JobKind::MeshGeneration, "blockMesh", 1, &job, &error)) {
          ++winners;
        } else if (error.kind == ErrorKind::DuplicateJob) {
          ++duplicates;
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    if (!Check(winners == 1 && duplicates == 15, "reservation was not exclusive")) {
      return 1;
    }
    if (!Check(registry.ActiveJobs().size() == 1, "losers left jobs behind")) {
      return 1;
    }
  }

  JobRegistry registry(3);
  Job mesh;
  Job solver;
  Job other_case;
  CaseError error;
  if (!Check(registry.TryReserve("case-a", JobKind::MeshGeneration, "mesh", 2, &mesh, &error) &&
                 registry.TryReserve("case-a", JobKind::SolverRun, "solve", 1, &solver, &error) &&
                 registry.TryReserve("case-b", JobKind::MeshGeneration, "mesh", 1, &other_case,
                                     &error),
             "different kinds or cases should not conflict")) {
    return 1;
  }
  if (!Check(mesh.id != solver.id && mesh.state == JobState::Pending && mesh.step_count == 2,
             "reserved job snapshot is wrong")) {
    return 1;
  }

  // Transition validation.
  if (!Check(!registry.Finish(mesh.id, JobState::Running, std::nullopt, CaseError(), nullptr),
             "Running accepted as a terminal state")) {
    return 1;
  }
  if (!Check(registry.MarkRunning(mesh.id, &error) && !registry.MarkRunning(mesh.id, &error),
             "Running -> Running was accepted")) {
    return 1;
  }

  ProgressEvent first;
  first.text = "Time = 0.1";
  ProgressEvent second;
  second.text = "Time = 0.2";
  if (!Check(registry.AppendProgress(mesh.id, &first) && registry.AppendProgress(mesh.id, &second) &&
                 first.sequence == 1 && second.sequence == 2,
             "progress sequence numbers are wrong")) {
    return 1;
  }

  Job finished;
  if (!Check(registry.Finish(mesh.id, JobState::Failed, 1,
                             MakeError(ErrorKind::ProcessFailure, "exit 1"), &finished),
             "Finish failed")) {
    return 1;
  }
  if (!Check(finished.state == JobState::Failed && finished.exit_code && *finished.exit_code == 1 &&
                 finished.progress.size() == 2 && finished.ended_at.has_value(),
             "finished snapshot is wrong")) {
    return 1;
  }
  // Terminal states are final.
  if (!Check(!registry.Finish(mesh.id, JobState::Succeeded, 0, CaseError(), nullptr) &&
                 !registry.MarkRunning(mesh.id, &error) &&
                 !registry.AppendProgress(mesh.id, &first),
             "terminal job was mutated")) {
    return 1;
  }
  if (!Check(registry.Find(mesh.id)->state == JobState::Failed, "history lookup failed")) {
    return 1;
  }

  // The slot is free again once the job is terminal.
  Job rerun;
  if (!Check(registry.TryReserve("case-a", JobKind::MeshGeneration, "mesh", 1, &rerun, &error),
             "slot stayed reserved after the job finished")) {
    return 1;
  }
  if (!Check(registry.ActiveJobIdsForCase("case-a").size() == 2, "case lookup is wrong")) {
    return 1;
  }

  // History is bounded, oldest evicted first.
  for (int i = 0; i < 5; ++i) {
    Job job;
    registry.TryReserve("case-c", JobKind::Other, "echo", 1, &job, &error);
    registry.Finish(job.id, JobState::Succeeded, 0, CaseError(), nullptr);
  }
  std::vector<Job> history = registry.History();
  if (!Check(history.size() == 3, "history exceeded its cap")) {
    return 1;
  }
  if (!Check(!registry.Find(mesh.id).has_value(), "oldest history entry was not evicted")) {
    return 1;
  }
  if (!Check(history.front().id < history.back().id, "history is not oldest first")) {
    return 1;
  }

  // Progress retention is bounded too, sequence numbers keep counting.
  JobRegistry small(10, 4);
  Job chatty;
  small.TryReserve("case-d", JobKind::SolverRun, "solver", 1, &chatty, &error);
  ProgressEvent event;
  for (int i = 0; i < 10; ++i) {
    event.text = "line " + std::to_string(i);
    small.AppendProgress(chatty.id, &event);
  }
  std::optional<Job> snapshot = small.Find(chatty.id);
  if (!Check(snapshot && snapshot->progress.size() == 4 && snapshot->dropped_events == 6 &&
                 snapshot->progress.front().sequence == 7 && event.sequence == 10,
             "progress retention is wrong")) {
    return 1;
  }

  // A long run keeps evicting one event at a time from the front.
  JobRegistry bounded(10, 100);
  Job long_solver;
  if (!Check(bounded.TryReserve("case-e", JobKind::SolverRun, "solver", 1, &long_solver, &error),
             DescribeError(error))) {
    return 1;
  }
  for (int i = 1; i <= 5000; ++i) {
    event.text = "Time = " + std::to_string(i);
    if (!Check(bounded.AppendProgress(long_solver.id, &event), "append failed")) {
      return 1;
    }
  }
  snapshot = bounded.Find(long_solver.id);
  if (!Check(snapshot && snapshot->progress.size() == 100 && snapshot->dropped_events == 4900 &&
                 snapshot->progress.front().sequence == 4901 &&
                 snapshot->progress.back().sequence == 5000 &&
                 snapshot->progress.back().text == "Time = 5000",
             "long run retention is wrong")) {
    return 1;
  }
  return 0;
}
