#include "case_session.h"

#include <atomic>
#include <memory>
#include <system_error>
#include <utility>

#include "file_utils.h"
#include "log_service.h"
#include "string_utils.h"

namespace {
void SetError(CaseError* error, ErrorKind kind, const std::string& message) {
  if (error) {
    *error = MakeError(kind, message);
  }
}

std::string NextSessionId() {
  static std::atomic<int> counter{0};
  return "case-" + std::to_string(++counter) + "-" + caseflow::GenerateRandomTag(6);
}

bool EscapesCase(const std::filesystem::path& relative) {
  if (relative.empty() || relative.is_absolute()) {
    return true;
  }
  const std::filesystem::path normal = relative.lexically_normal();
  return normal.empty() || *normal.begin() == "..";
}
bool AllOf(const std::string& text, size_t begin, size_t count, bool (*pred)(char)) {
  if (text.size() < begin + count) {
    return false;
  }
  for (size_t i = begin; i < begin + count; ++i) {
    if (!pred(text[i])) {
      return false;
    }
  }
  return true;
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsTagChar(char c) {
  return IsDigit(c) || (c >= 'a' && c <= 'z');
}
}  // namespace

bool IsTempCaseDirectoryName(const std::string& name) {
  // temp_ YYYYMMDD _ HHMMSS _ tag
  const size_t prefix = std::char_traits<char>::length(kTempCasePrefix);
  const size_t date = prefix;
  const size_t time = date + 9;
  const size_t tag = time + 7;
  if (!caseflow::StartsWith(name, kTempCasePrefix) || name.size() <= tag) {
    return false;
  }
  return AllOf(name, date, 8, IsDigit) && name[date + 8] == '_' && AllOf(name, time, 6, IsDigit) &&
         name[time + 6] == '_' && AllOf(name, tag, name.size() - tag, IsTagChar);
}

CaseSession::CaseSession(PrivateTag, std::filesystem::path path, bool temporary,
                         CaseData data, LogService* log)
    : id_(NextSessionId()),
      path_(std::move(path)),
      temporary_(temporary),
      created_at_(std::chrono::system_clock::now()),
      data_(std::move(data)),
      log_(log) {}

CaseSession::OpenResult CaseSession::CreateTemp(const std::filesystem::path& base_template,
                                                const std::filesystem::path& temp_root,
                                                LogService* log) {
  OpenResult result;
  std::error_code ec;
  if (base_template.empty() || !std::filesystem::is_directory(base_template, ec)) {
    result.error = MakeError(ErrorKind::IO, "case template not found: " + base_template.string());
    return result;
  }
  std::filesystem::create_directories(temp_root, ec);
  if (ec) {
    result.error = MakeError(ErrorKind::IO, "temp root is not writable: " + temp_root.string() +
                                                " (" + ec.message() + ")");
    return result;
  }

  const std::string stamp = caseflow::FormatCompactLocal(std::chrono::system_clock::now());
  std::filesystem::path dir;
  bool created = false;
  for (int attempt = 0; attempt < 8 && !created; ++attempt) {
    dir = temp_root / (std::string(kTempCasePrefix) + stamp + "_" + caseflow::GenerateRandomTag(8));
    created = std::filesystem::create_directory(dir, ec);
    if (ec) {
      result.error = MakeError(ErrorKind::IO, "failed to create " + dir.string() + ": " +
                                                  ec.message());
      return result;
    }
  }
  if (!created) {
    result.error = MakeError(ErrorKind::IO, "could not pick a unique temp case name under " +
                                                temp_root.string());
    return result;
  }

  auto abandon = [&](const CaseError& error) {
    std::error_code remove_ec;
    std::filesystem::remove_all(dir, remove_ec);
    if (remove_ec && log) {
      log->Warning("session", "failed to remove partial temp case " + dir.string() + ": " +
                                  remove_ec.message());
    }
    result.error = error;
    return std::move(result);
  };

  std::string copy_error;
  if (!CopyDirectoryTree(base_template, dir, &copy_error)) {
    return abandon(MakeError(ErrorKind::IO, copy_error));
  }

  CaseData data;
  CaseError data_error;
  if (std::filesystem::exists(dir / kCaseDataFileName, ec)) {
    if (!data.LoadFromDirectory(dir, &data_error)) {
      return abandon(data_error);
    }
  } else if (!data.SaveToDirectory(dir, &data_error)) {
    return abandon(data_error);
  }

  result.session = std::make_unique<CaseSession>(PrivateTag{}, dir, true, std::move(data), log);
  if (log) {
    log->Info("session", "created temp case " + dir.string());
  }
  return result;
}

CaseSession::OpenResult CaseSession::OpenExisting(const std::filesystem::path& path,
                                                  LogService* log) {
  OpenResult result;
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    result.error = MakeError(ErrorKind::InvalidCase, "not a case directory: " + path.string());
    return result;
  }
  CaseData data;
  if (!data.LoadFromDirectory(path, &result.error)) {
    return result;
  }
  std::filesystem::path absolute = std::filesystem::absolute(path, ec);
  result.session = std::make_unique<CaseSession>(
      PrivateTag{}, ec ? path : absolute.lexically_normal(), false, std::move(data), log);
  if (log) {
    log->Info("session", "opened case " + result.session->Path().string());
  }
  return result;
}

bool CaseSession::SaveAs(const std::filesystem::path& new_path, CaseError* error) {
  if (discarded_) {
    SetError(error, ErrorKind::IO, "session was discarded");
    return false;
  }
  if (IsSameOrInside(new_path, path_)) {
    SetError(error, ErrorKind::IO, "destination is inside the case: " + new_path.string());
    return false;
  }
  if (!IsMissingOrEmptyDirectory(new_path)) {
    SetError(error, ErrorKind::IO, "destination exists and is not empty: " + new_path.string());
    return false;
  }

  std::string message;
  CaseError data_error;
  if (!CopyDirectoryTree(path_, new_path, &message)) {
    LogWarning("save-as left a partial copy at " + new_path.string() + ": " + message);
    SetError(error, ErrorKind::IO, message);
    return false;
  }
  if (!data_.SaveToDirectory(new_path, &data_error)) {
    LogWarning("save-as left a partial copy at " + new_path.string() + ": " +
               data_error.message);
    if (error) {
      *error = data_error;
    }
    return false;
  }

  if (!temporary_) {
    LogInfo("copied case to " + new_path.string());
    return true;
  }

  std::error_code ec;
  std::filesystem::path absolute = std::filesystem::absolute(new_path, ec);
  const std::filesystem::path old_path = path_;
  path_ = ec ? new_path : absolute.lexically_normal();
  temporary_ = false;
  LogInfo("saved temp case " + old_path.string() + " as " + path_.string());
  Emit(SessionEventKind::PathChanged);
  SetDirty(false);
  Emit(SessionEventKind::Saved);
  return true;
}

bool CaseSession::Save(CaseError* error) {
  if (discarded_) {
    SetError(error, ErrorKind::IO, "session was discarded");
    return false;
  }
  if (temporary_) {
    SetError(error, ErrorKind::IO, "temporary case must be saved with SaveAs");
    return false;
  }
  if (!data_.SaveToDirectory(path_, error)) {
    return false;
  }
  SetDirty(false);
  Emit(SessionEventKind::Saved);
  return true;
}

bool CaseSession::Discard() {
  if (!temporary_ || discarded_) {
    return false;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    LogWarning("failed to remove temp case " + path_.string() + ": " + ec.message());
  } else {
    LogInfo("discarded temp case " + path_.string());
  }
  discarded_ = true;
  Emit(SessionEventKind::Discarded);
  return true;
}

void CaseSession::MarkDirty() {
  SetDirty(true);
}

void CaseSession::ClearDirty() {
  SetDirty(false);
}

bool CaseSession::WriteFile(const std::filesystem::path& relative, const std::string& bytes,
                            CaseError* error) {
  if (discarded_) {
    SetError(error, ErrorKind::IO, "session was discarded");
    return false;
  }
  if (EscapesCase(relative)) {
    SetError(error, ErrorKind::IO, "path must stay inside the case: " + relative.string());
    return false;
  }
  std::string message;
  if (!WriteStringToFile(path_ / relative, bytes, &message)) {
    SetError(error, ErrorKind::IO, message);
    return false;
  }
  SetDirty(true);
  return true;
}

void CaseSession::SetDescription(const std::string& description) {
  data_.SetDescription(description);
  SetDirty(true);
}

bool CaseSession::AddGeometry(const std::filesystem::path& file, std::string* name,
                              CaseError* error) {
  if (!data_.AddGeometry(file, name, error)) {
    return false;
  }
  SetDirty(true);
  return true;
}

bool CaseSession::RemoveGeometry(const std::string& name) {
  if (name == kProtectedGeometryName) {
    LogWarning("cannot remove protected geometry '" + name + "'");
    return false;
  }
  if (!data_.RemoveGeometry(name)) {
    return false;
  }
  SetDirty(true);
  return true;
}

bool CaseSession::SetGeometryVisibility(const std::string& name, bool visible) {
  if (!data_.SetVisibility(name, visible)) {
    return false;
  }
  SetDirty(true);
  return true;
}

bool CaseSession::SetGeometryPosition(const std::string& name, const Vec3& position) {
  if (!data_.SetPosition(name, position)) {
    return false;
  }
  SetDirty(true);
  return true;
}

bool CaseSession::SetGeometryRotation(const std::string& name, const Vec3& rotation) {
  if (!data_.SetRotation(name, rotation)) {
    return false;
  }
  SetDirty(true);
  return true;
}

bool CaseSession::SetGeometryProbePosition(const std::string& name, const Vec3& position) {
  if (!data_.SetProbePosition(name, position)) {
    return false;
  }
  SetDirty(true);
  return true;
}

int CaseSession::AddObserver(Observer observer) {
  const int token = next_observer_token_++;
  observers_[token] = std::move(observer);
  return token;
}

void CaseSession::RemoveObserver(int token) {
  observers_.erase(token);
}

void CaseSession::SetDirty(bool dirty) {
  if (dirty_ == dirty) {
    return;
  }
  dirty_ = dirty;
  Emit(SessionEventKind::DirtyChanged);
}

void CaseSession::Emit(SessionEventKind kind) {
  SessionEvent event;
  event.kind = kind;
  event.path = path_;
  event.dirty = dirty_;
  // Observers may unregister themselves while being notified.
  std::vector<Observer> snapshot;
  snapshot.reserve(observers_.size());
  for (const auto& entry : observers_) {
    snapshot.push_back(entry.second);
  }
  for (const auto& observer : snapshot) {
    if (observer) {
      observer(event);
    }
  }
}

void CaseSession::LogInfo(const std::string& message) const {
  if (log_) {
    log_->Info("session", message);
  }
}

void CaseSession::LogWarning(const std::string& message) const {
  if (log_) {
    log_->Warning("session", message);
  }
}
