#include "session_manager.h"

#include <utility>

#include "execution_controller.h"
#include "log_service.h"

SessionManager::SessionManager(ExecutionController& jobs, LogService* log,
                               std::chrono::milliseconds job_stop_timeout)
    : jobs_(jobs), log_(log), job_stop_timeout_(job_stop_timeout) {
  job_token_ = jobs_.SubscribeAll([this](const JobEvent& event) { OnJobEvent(event); });
}

SessionManager::~SessionManager() {
  jobs_.Unsubscribe(job_token_);
  Close();
}

CaseSession& SessionManager::Adopt(std::unique_ptr<CaseSession> session) {
  Close();
  current_ = std::move(session);
  if (log_ && current_) {
    log_->Info("session", "current case is " + current_->Path().string() +
                              (current_->IsTemporary() ? " (temporary)" : ""));
  }
  return *current_;
}

bool SessionManager::OpenOrCreate(const std::filesystem::path& case_path,
                                  const std::filesystem::path& base_template,
                                  const std::filesystem::path& temp_root, CaseError* error) {
  CaseSession::OpenResult result = case_path.empty()
                                       ? CaseSession::CreateTemp(base_template, temp_root, log_)
                                       : CaseSession::OpenExisting(case_path, log_);
  if (!result.ok()) {
    if (log_) {
      log_->Error("session", DescribeError(result.error));
    }
    if (error) {
      *error = result.error;
    }
    return false;
  }
  Adopt(std::move(result.session));
  return true;
}

void SessionManager::Close() {
  if (!current_) {
    return;
  }
  StopJobsOf(*current_);
  if (current_->IsTemporary()) {
    current_->Discard();
  }
  current_.reset();
}

std::unique_ptr<CaseSession> SessionManager::Release() {
  if (current_) {
    StopJobsOf(*current_);
  }
  return std::move(current_);
}

JanitorOptions SessionManager::JanitorOptionsFor(const std::filesystem::path& temp_root,
                                                 std::chrono::seconds retention) const {
  JanitorOptions options;
  options.temp_root = temp_root;
  options.retention = retention;
  if (current_) {
    options.exclude.push_back(current_->Path());
  }
  return options;
}

void SessionManager::StopJobsOf(const CaseSession& session) {
  const std::vector<uint64_t> ids = jobs_.CancelAllForCase(session.Id());
  for (uint64_t id : ids) {
    if (!jobs_.WaitForJob(id, job_stop_timeout_) && log_) {
      log_->Warning("session", "job " + std::to_string(id) + " did not stop in time");
    }
  }
}

void SessionManager::OnJobEvent(const JobEvent& event) {
  if (!current_ || event.case_id != current_->Id() ||
      event.kind != JobEventKind::StateChanged) {
    return;
  }
  if (event.state == JobState::Running || IsTerminal(event.state)) {
    current_->MarkDirty();
  }
}
