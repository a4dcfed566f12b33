#include "stl_reader.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <sstream>

#include "file_utils.h"
#include "string_utils.h"

namespace {
constexpr size_t kHeaderSize = 80;
constexpr size_t kFacetSize = 50;

uint32_t ReadU32(const std::string& bytes, size_t offset) {
  const auto* p = reinterpret_cast<const unsigned char*>(bytes.data() + offset);
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

float ReadF32(const std::string& bytes, size_t offset) {
  const uint32_t bits = ReadU32(bytes, offset);
  float value = 0.0f;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

void UpdateBounds(StlMesh* mesh) {
  if (mesh->vertices.empty()) {
    return;
  }
  for (int axis = 0; axis < 3; ++axis) {
    mesh->min[axis] = mesh->vertices[static_cast<size_t>(axis)];
    mesh->max[axis] = mesh->vertices[static_cast<size_t>(axis)];
  }
  for (size_t i = 0; i < mesh->vertices.size(); i += 3) {
    for (size_t axis = 0; axis < 3; ++axis) {
      mesh->min[axis] = std::min(mesh->min[axis], mesh->vertices[i + axis]);
      mesh->max[axis] = std::max(mesh->max[axis], mesh->vertices[i + axis]);
    }
  }
}

bool LooksAscii(const std::string& bytes) {
  const std::string head = caseflow::ToLower(caseflow::Trim(bytes.substr(0, 256)));
  return caseflow::StartsWith(head, "solid");
}

StlReadResult DecodeBinary(const std::string& bytes) {
  StlReadResult result;
  if (bytes.size() < kHeaderSize + 4) {
    result.error = "truncated binary STL header";
    return result;
  }
  const uint32_t count = ReadU32(bytes, kHeaderSize);
  const uint64_t expected = kHeaderSize + 4 + static_cast<uint64_t>(count) * kFacetSize;
  if (bytes.size() < expected) {
    result.error = "truncated binary STL: expected " + std::to_string(expected) + " bytes, got " +
                   std::to_string(bytes.size());
    return result;
  }
  StlMesh& mesh = result.mesh;
  mesh.binary = true;
  mesh.solid_name = caseflow::Trim(std::string(bytes.data(), kHeaderSize).c_str());
  mesh.normals.reserve(static_cast<size_t>(count) * 3);
  mesh.vertices.reserve(static_cast<size_t>(count) * 9);
  size_t offset = kHeaderSize + 4;
  for (uint32_t i = 0; i < count; ++i) {
    for (size_t k = 0; k < 3; ++k) {
      mesh.normals.push_back(ReadF32(bytes, offset + k * 4));
    }
    for (size_t k = 0; k < 9; ++k) {
      mesh.vertices.push_back(ReadF32(bytes, offset + 12 + k * 4));
    }
    offset += kFacetSize;
  }
  UpdateBounds(&mesh);
  result.ok = true;
  return result;
}

bool ReadTriple(std::istringstream& in, float* out) {
  return static_cast<bool>(in >> out[0] >> out[1] >> out[2]);
}

StlReadResult DecodeAscii(const std::string& bytes) {
  StlReadResult result;
  StlMesh& mesh = result.mesh;
  std::istringstream stream(bytes);
  std::string line;
  int line_no = 0;
  bool in_solid = false;
  bool in_facet = false;
  bool ended = false;
  int facet_vertices = 0;

  auto fail = [&](const std::string& message) {
    result.error = "line " + std::to_string(line_no) + ": " + message;
    return result;
  };

  while (std::getline(stream, line)) {
    ++line_no;
    const std::string trimmed = caseflow::Trim(line);
    if (trimmed.empty()) {
      continue;
    }
    std::istringstream in(trimmed);
    std::string keyword;
    in >> keyword;
    keyword = caseflow::ToLower(keyword);

    if (keyword == "solid") {
      if (in_solid) {
        return fail("nested solid");
      }
      in_solid = true;
      std::getline(in, mesh.solid_name);
      mesh.solid_name = caseflow::Trim(mesh.solid_name);
    } else if (keyword == "facet") {
      std::string normal_word;
      float normal[3];
      if (!in_solid || in_facet || !(in >> normal_word) || caseflow::ToLower(normal_word) != "normal" ||
          !ReadTriple(in, normal)) {
        return fail("malformed facet");
      }
      mesh.normals.insert(mesh.normals.end(), normal, normal + 3);
      in_facet = true;
      facet_vertices = 0;
    } else if (keyword == "outer" || keyword == "endloop") {
      if (!in_facet) {
        return fail("'" + keyword + "' outside facet");
      }
    } else if (keyword == "vertex") {
      float vertex[3];
      if (!in_facet || facet_vertices >= 3 || !ReadTriple(in, vertex)) {
        return fail("malformed vertex");
      }
      mesh.vertices.insert(mesh.vertices.end(), vertex, vertex + 3);
      ++facet_vertices;
    } else if (keyword == "endfacet") {
      if (!in_facet || facet_vertices != 3) {
        return fail("facet without three vertices");
      }
      in_facet = false;
    } else if (keyword == "endsolid") {
      if (!in_solid || in_facet) {
        return fail("unexpected endsolid");
      }
      ended = true;
      break;
    } else {
      return fail("unknown keyword '" + keyword + "'");
    }
  }
  if (!ended) {
    result.error = "truncated ASCII STL: missing endsolid";
    return result;
  }
  UpdateBounds(&mesh);
  result.ok = true;
  return result;
}
}  // namespace

StlReadResult DecodeStl(const std::string& bytes) {
  if (bytes.size() >= kHeaderSize + 4) {
    const uint64_t expected =
        kHeaderSize + 4 + static_cast<uint64_t>(ReadU32(bytes, kHeaderSize)) * kFacetSize;
    // Binary files may also start with "solid"; an exact size match wins.
    if (bytes.size() == expected) {
      return DecodeBinary(bytes);
    }
  }
  if (LooksAscii(bytes)) {
    return DecodeAscii(bytes);
  }
  return DecodeBinary(bytes);
}

StlReadResult ReadStl(const std::string& path) {
  StlReadResult result;
  std::string bytes;
  if (!ReadFileToString(path, &bytes, &result.error)) {
    return result;
  }
  return DecodeStl(bytes);
}
