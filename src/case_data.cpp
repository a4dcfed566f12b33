#include "case_data.h"

#include <chrono>

#include <nlohmann/json.hpp>

#include "file_utils.h"
#include "string_utils.h"

namespace {
using json = nlohmann::json;

std::string NowIso() {
  return caseflow::FormatIsoLocal(std::chrono::system_clock::now());
}

void SetError(CaseError* error, ErrorKind kind, const std::string& message) {
  if (error) {
    *error = MakeError(kind, message);
  }
}

bool ReadVec3(const json& j, const char* key, Vec3* out) {
  if (!j.contains(key)) {
    return true;
  }
  const json& value = j.at(key);
  if (!value.is_array() || value.size() != 3) {
    return false;
  }
  for (size_t i = 0; i < 3; ++i) {
    if (!value[i].is_number()) {
      return false;
    }
    (*out)[i] = value[i].get<double>();
  }
  return true;
}

json GeometryToJson(const GeometryData& geometry) {
  json j;
  j["name"] = geometry.name;
  j["path"] = geometry.path;
  j["is_visible"] = geometry.is_visible;
  j["position"] = geometry.position;
  j["rotation"] = geometry.rotation;
  j["probe_position"] = geometry.probe_position;
  return j;
}

bool GeometryFromJson(const json& j, GeometryData* out, std::string* error) {
  if (!j.is_object()) {
    *error = "geometry entry must be an object";
    return false;
  }
  GeometryData geometry;
  geometry.name = j.value("name", std::string());
  geometry.path = j.value("path", std::string());
  geometry.is_visible = j.value("is_visible", true);
  if (!ReadVec3(j, "position", &geometry.position) ||
      !ReadVec3(j, "rotation", &geometry.rotation) ||
      !ReadVec3(j, "probe_position", &geometry.probe_position)) {
    *error = "geometry '" + geometry.name + "' has a malformed vector";
    return false;
  }
  if (!geometry.name.empty() && geometry.path.empty()) {
    *error = "geometry '" + geometry.name + "' has no path";
    return false;
  }
  *out = geometry;
  return true;
}
}  // namespace

CaseData::CaseData() : created_time_(NowIso()), modified_time_(created_time_) {}

void CaseData::SetDescription(const std::string& description) {
  description_ = description;
  Touch();
}

bool CaseData::AddGeometry(const std::filesystem::path& file, std::string* name,
                           CaseError* error) {
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    SetError(error, ErrorKind::IO, "geometry file not found: " + file.string());
    return false;
  }
  const std::string stem = file.stem().string();
  if (objects_.count(stem) > 0) {
    SetError(error, ErrorKind::InvalidCase, "geometry '" + stem + "' already exists in case");
    return false;
  }
  GeometryData geometry;
  geometry.name = stem;
  std::filesystem::path absolute = std::filesystem::absolute(file, ec);
  geometry.path = ec ? file.string() : absolute.lexically_normal().string();
  objects_[stem] = geometry;
  Touch();
  if (name) {
    *name = stem;
  }
  return true;
}

bool CaseData::RemoveGeometry(const std::string& name) {
  if (name == kProtectedGeometryName) {
    return false;
  }
  if (objects_.erase(name) == 0) {
    return false;
  }
  Touch();
  return true;
}

bool CaseData::SetVisibility(const std::string& name, bool visible) {
  auto it = objects_.find(name);
  if (it == objects_.end()) {
    return false;
  }
  it->second.is_visible = visible;
  Touch();
  return true;
}

bool CaseData::SetPosition(const std::string& name, const Vec3& position) {
  auto it = objects_.find(name);
  if (it == objects_.end()) {
    return false;
  }
  it->second.position = position;
  Touch();
  return true;
}

bool CaseData::SetRotation(const std::string& name, const Vec3& rotation) {
  auto it = objects_.find(name);
  if (it == objects_.end()) {
    return false;
  }
  it->second.rotation = rotation;
  Touch();
  return true;
}

bool CaseData::SetProbePosition(const std::string& name, const Vec3& position) {
  auto it = objects_.find(name);
  if (it == objects_.end()) {
    return false;
  }
  it->second.probe_position = position;
  Touch();
  return true;
}

const GeometryData* CaseData::FindGeometry(const std::string& name) const {
  auto it = objects_.find(name);
  return it == objects_.end() ? nullptr : &it->second;
}

std::vector<std::string> CaseData::ListGeometries() const {
  std::vector<std::string> names;
  names.reserve(objects_.size());
  for (const auto& entry : objects_) {
    names.push_back(entry.first);
  }
  return names;
}

void CaseData::ClearGeometries(bool keep_protected) {
  for (auto it = objects_.begin(); it != objects_.end();) {
    if (keep_protected && it->first == kProtectedGeometryName) {
      ++it;
    } else {
      it = objects_.erase(it);
    }
  }
  Touch();
}

std::string CaseData::ToJson(int indent) const {
  json root;
  root["created_time"] = created_time_;
  root["modified_time"] = modified_time_;
  root["description"] = description_;
  json objects = json::object();
  for (const auto& entry : objects_) {
    objects[entry.first] = GeometryToJson(entry.second);
  }
  root["objects"] = objects;
  return root.dump(indent);
}

bool CaseData::FromJson(const std::string& text, CaseError* error) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    SetError(error, ErrorKind::InvalidCase, std::string("invalid case data: ") + e.what());
    return false;
  }
  if (!root.is_object()) {
    SetError(error, ErrorKind::InvalidCase, "case data must be a JSON object");
    return false;
  }

  std::map<std::string, GeometryData> objects;
  if (root.contains("objects")) {
    const json& entries = root.at("objects");
    if (!entries.is_object()) {
      SetError(error, ErrorKind::InvalidCase, "case data 'objects' must be an object");
      return false;
    }
    for (auto it = entries.begin(); it != entries.end(); ++it) {
      GeometryData geometry;
      std::string message;
      if (!GeometryFromJson(it.value(), &geometry, &message)) {
        SetError(error, ErrorKind::InvalidCase, message);
        return false;
      }
      if (geometry.name.empty()) {
        geometry.name = it.key();
      }
      objects[it.key()] = geometry;
    }
  }

  try {
    created_time_ = root.value("created_time", created_time_);
    modified_time_ = root.value("modified_time", modified_time_);
    description_ = root.value("description", std::string());
  } catch (const json::type_error& e) {
    SetError(error, ErrorKind::InvalidCase, std::string("invalid case data: ") + e.what());
    return false;
  }
  objects_ = std::move(objects);
  return true;
}

bool CaseData::LoadFromDirectory(const std::filesystem::path& case_dir, CaseError* error) {
  const std::filesystem::path file = case_dir / kCaseDataFileName;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    SetError(error, ErrorKind::InvalidCase, "missing " + file.string());
    return false;
  }
  std::string text;
  std::string message;
  if (!ReadFileToString(file, &text, &message)) {
    SetError(error, ErrorKind::IO, message);
    return false;
  }
  return FromJson(text, error);
}

bool CaseData::SaveToDirectory(const std::filesystem::path& case_dir, CaseError* error) const {
  std::string message;
  if (!WriteStringToFile(case_dir / kCaseDataFileName, ToJson() + "\n", &message)) {
    SetError(error, ErrorKind::IO, message);
    return false;
  }
  return true;
}

void CaseData::Touch() {
  modified_time_ = NowIso();
}
