#ifndef STL_READER_H
#define STL_READER_H

#include <string>
#include <vector>

struct StlMesh {
  std::string solid_name;
  std::vector<float> vertices;  // xyz per vertex, three vertices per triangle.
  std::vector<float> normals;   // xyz per triangle.
  float min[3] = {0.0f, 0.0f, 0.0f};
  float max[3] = {0.0f, 0.0f, 0.0f};
  bool binary = false;

  size_t TriangleCount() const { return normals.size() / 3; }
};

struct StlReadResult {
  bool ok = false;
  std::string error;
  StlMesh mesh;
};

// Accepts binary STL (80-byte header, uint32 count, 50 bytes per facet) and
// ASCII STL. Truncated or malformed input fails.
StlReadResult DecodeStl(const std::string& bytes);
StlReadResult ReadStl(const std::string& path);

#endif  // STL_READER_H
