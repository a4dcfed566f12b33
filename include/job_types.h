#ifndef JOB_TYPES_H
#define JOB_TYPES_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "case_error.h"

enum class JobKind {
  MeshGeneration,
  SolverRun,
  Other,
};

enum class JobState {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};

const char* JobKindToken(JobKind kind);
bool ParseJobKind(const std::string& token, JobKind* kind);
const char* JobStateToken(JobState state);
bool IsTerminal(JobState state);

// One line of process output plus whatever the progress parser recognized.
struct ProgressEvent {
  uint64_t sequence = 0;
  std::chrono::system_clock::time_point timestamp;
  int step_index = 0;
  std::string text;

  std::optional<double> sim_time;        // "Time = 0.0125"
  std::string residual_field;            // "Solving for Ux, Initial residual = ..."
  std::optional<double> residual;
  std::optional<double> execution_time;  // "ExecutionTime = 12.3 s"
};

struct CommandStep {
  std::vector<std::string> argv;  // argv[0] resolved through PATH.
  std::string working_subdir;     // Case-relative; empty runs in the case root.
  std::string log_name;           // Case-relative log file; empty disables.
  std::string label;
};

struct CommandSpec {
  std::vector<CommandStep> steps;  // Run in order, stop at the first failure.
  std::map<std::string, std::string> env;  // Added to the inherited environment.
};

CommandStep ShellStep(const std::string& command_line, const std::string& working_subdir = "",
                      const std::string& log_name = "");

struct Job {
  uint64_t id = 0;
  JobKind kind = JobKind::Other;
  std::string case_id;
  std::string label;
  JobState state = JobState::Pending;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> ended_at;
  std::optional<int> exit_code;
  CaseError error;
  int current_step = 0;
  int step_count = 0;
  std::deque<ProgressEvent> progress;
  uint64_t dropped_events = 0;  // Oldest events evicted past the retention cap.
};

#endif  // JOB_TYPES_H
