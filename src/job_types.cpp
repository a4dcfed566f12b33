#include "job_types.h"

const char* JobKindToken(JobKind kind) {
  switch (kind) {
    case JobKind::MeshGeneration:
      return "mesh";
    case JobKind::SolverRun:
      return "solver";
    case JobKind::Other:
      return "other";
  }
  return "other";
}

bool ParseJobKind(const std::string& token, JobKind* kind) {
  JobKind parsed;
  if (token == "mesh") {
    parsed = JobKind::MeshGeneration;
  } else if (token == "solver") {
    parsed = JobKind::SolverRun;
  } else if (token == "other") {
    parsed = JobKind::Other;
  } else {
    return false;
  }
  if (kind) {
    *kind = parsed;
  }
  return true;
}

const char* JobStateToken(JobState state) {
  switch (state) {
    case JobState::Pending:
      return "pending";
    case JobState::Running:
      return "running";
    case JobState::Succeeded:
      return "succeeded";
    case JobState::Failed:
      return "failed";
    case JobState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

bool IsTerminal(JobState state) {
  return state == JobState::Succeeded || state == JobState::Failed ||
         state == JobState::Cancelled;
}

CommandStep ShellStep(const std::string& command_line, const std::string& working_subdir,
                      const std::string& log_name) {
  CommandStep step;
  step.argv = {"/bin/sh", "-c", command_line};
  step.working_subdir = working_subdir;
  step.log_name = log_name;
  step.label = command_line;
  return step;
}
