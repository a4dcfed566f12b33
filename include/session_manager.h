#ifndef SESSION_MANAGER_H
#define SESSION_MANAGER_H

#include <chrono>
#include <filesystem>
#include <memory>

#include "case_error.h"
#include "case_session.h"
#include "temp_case_janitor.h"

class ExecutionController;
struct JobEvent;
class LogService;

// Holds the one current CaseSession of the interactive process. Jobs that
// run in the current case mark it dirty when they start and when they end,
// since their processes write into the case directory.
class SessionManager {
 public:
  SessionManager(ExecutionController& jobs, LogService* log,
                 std::chrono::milliseconds job_stop_timeout);
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  CaseSession* Current() const { return current_.get(); }

  // Makes session current. The previous session's jobs are cancelled and
  // awaited first; a previous temp session is discarded.
  CaseSession& Adopt(std::unique_ptr<CaseSession> session);

  // Opens case_path, or creates a temp case from the template when empty.
  bool OpenOrCreate(const std::filesystem::path& case_path,
                    const std::filesystem::path& base_template,
                    const std::filesystem::path& temp_root, CaseError* error);

  // Stops the current session's jobs and drops it, discarding temp cases.
  void Close();
  // Stops the current session's jobs and hands the session back untouched.
  std::unique_ptr<CaseSession> Release();

  // Janitor settings that protect the current session's directory.
  JanitorOptions JanitorOptionsFor(const std::filesystem::path& temp_root,
                                   std::chrono::seconds retention) const;

 private:
  void StopJobsOf(const CaseSession& session);
  void OnJobEvent(const JobEvent& event);

  ExecutionController& jobs_;
  LogService* log_;
  std::chrono::milliseconds job_stop_timeout_;
  std::unique_ptr<CaseSession> current_;
  int job_token_ = 0;
};

#endif  // SESSION_MANAGER_H
