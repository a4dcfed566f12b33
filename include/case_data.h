#ifndef CASE_DATA_H
#define CASE_DATA_H

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "case_error.h"

// File at the case root whose presence marks a case directory.
constexpr const char* kCaseDataFileName = "case_data.json";
// Geometry that is never removed from a case.
constexpr const char* kProtectedGeometryName = "fluid";

using Vec3 = std::array<double, 3>;

struct GeometryData {
  std::string name;  // File stem.
  std::string path;  // Absolute path of the STL file.
  bool is_visible = true;
  Vec3 position{0.0, 0.0, 0.0};        // Offset in meters.
  Vec3 rotation{0.0, 0.0, 0.0};        // Degrees about x, y, z.
  Vec3 probe_position{0.0, 0.0, 0.0};  // locationInMesh point.
};

class CaseData {
 public:
  CaseData();

  const std::string& CreatedTime() const { return created_time_; }
  const std::string& ModifiedTime() const { return modified_time_; }
  const std::string& Description() const { return description_; }
  void SetDescription(const std::string& description);

  // Name is the file stem. Fails with IO when the file is missing and
  // InvalidCase when the name is taken.
  bool AddGeometry(const std::filesystem::path& file, std::string* name, CaseError* error);
  // False for unknown names and for the protected geometry.
  bool RemoveGeometry(const std::string& name);
  bool SetVisibility(const std::string& name, bool visible);
  bool SetPosition(const std::string& name, const Vec3& position);
  bool SetRotation(const std::string& name, const Vec3& rotation);
  bool SetProbePosition(const std::string& name, const Vec3& position);
  const GeometryData* FindGeometry(const std::string& name) const;
  std::vector<std::string> ListGeometries() const;
  void ClearGeometries(bool keep_protected = true);

  std::string ToJson(int indent = 4) const;
  bool FromJson(const std::string& text, CaseError* error);

  bool LoadFromDirectory(const std::filesystem::path& case_dir, CaseError* error);
  bool SaveToDirectory(const std::filesystem::path& case_dir, CaseError* error) const;

 private:
  void Touch();

  std::string created_time_;
  std::string modified_time_;
  std::string description_;
  std::map<std::string, GeometryData> objects_;
};

#endif  // CASE_DATA_H
