#ifndef CASE_SESSION_H
#define CASE_SESSION_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "case_data.h"
#include "case_error.h"

class LogService;

// Temp case directories are named temp_YYYYMMDD_HHMMSS_<tag>.
constexpr const char* kTempCasePrefix = "temp_";

// True for names produced by CaseSession::CreateTemp.
bool IsTempCaseDirectoryName(const std::string& name);

enum class SessionEventKind {
  DirtyChanged,
  PathChanged,
  Saved,
  Discarded,
};

struct SessionEvent {
  SessionEventKind kind = SessionEventKind::DirtyChanged;
  std::filesystem::path path;
  bool dirty = false;
};

/**
 * CaseSession - state of one case directory edited by the interactive UI.
 *
 * Created through CreateTemp (scratch copy of the base template under the
 * temp root) or OpenExisting (validated user directory). Every mutation made
 * through the session marks it dirty, as do jobs run against the current
 * session (see SessionManager); Save/SaveAs clear the flag.
 *
 * Not thread-safe: all calls happen on the interactive thread. Failed
 * operations return false with a CaseError and leave the session unchanged.
 */
class CaseSession {
  // Construction goes through CreateTemp and OpenExisting only.
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  using Observer = std::function<void(const SessionEvent&)>;

  struct OpenResult {
    std::unique_ptr<CaseSession> session;
    CaseError error;
    bool ok() const { return session != nullptr; }
  };

  static OpenResult CreateTemp(const std::filesystem::path& base_template,
                               const std::filesystem::path& temp_root,
                               LogService* log);
  static OpenResult OpenExisting(const std::filesystem::path& path, LogService* log);

  CaseSession(PrivateTag, std::filesystem::path path, bool temporary, CaseData data,
              LogService* log);
  CaseSession(const CaseSession&) = delete;
  CaseSession& operator=(const CaseSession&) = delete;

  // Stable for the session lifetime, survives SaveAs.
  const std::string& Id() const { return id_; }
  const std::filesystem::path& Path() const { return path_; }
  bool IsTemporary() const { return temporary_; }
  bool IsDirty() const { return dirty_; }
  bool IsDiscarded() const { return discarded_; }
  std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
  const CaseData& Data() const { return data_; }

  // Copies the case to new_path, which must not exist or be empty. A temp
  // session is repointed there and becomes a saved case. A saved session is
  // copied without repointing.
  bool SaveAs(const std::filesystem::path& new_path, CaseError* error);
  // Saved sessions only: rewrites case_data.json in place.
  bool Save(CaseError* error);
  // Temp sessions only: removes the directory. Removal failures are logged
  // and left to the janitor.
  bool Discard();

  void MarkDirty();
  void ClearDirty();

  // Writes bytes to a case-relative path and marks the session dirty.
  bool WriteFile(const std::filesystem::path& relative, const std::string& bytes,
                 CaseError* error);

  void SetDescription(const std::string& description);
  bool AddGeometry(const std::filesystem::path& file, std::string* name, CaseError* error);
  bool RemoveGeometry(const std::string& name);
  bool SetGeometryVisibility(const std::string& name, bool visible);
  bool SetGeometryPosition(const std::string& name, const Vec3& position);
  bool SetGeometryRotation(const std::string& name, const Vec3& rotation);
  bool SetGeometryProbePosition(const std::string& name, const Vec3& position);
  std::vector<std::string> ListGeometries() const { return data_.ListGeometries(); }

  int AddObserver(Observer observer);
  void RemoveObserver(int token);

 private:
  void SetDirty(bool dirty);
  void Emit(SessionEventKind kind);
  void LogInfo(const std::string& message) const;
  void LogWarning(const std::string& message) const;

  std::string id_;
  std::filesystem::path path_;
  bool temporary_ = false;
  bool dirty_ = false;
  bool discarded_ = false;
  std::chrono::system_clock::time_point created_at_;
  CaseData data_;
  LogService* log_ = nullptr;

  std::map<int, Observer> observers_;
  int next_observer_token_ = 1;
};

#endif  // CASE_SESSION_H
