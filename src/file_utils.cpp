#include "file_utils.h"

#include <fstream>
#include <sstream>
#include <system_error>

bool ReadFileToString(const std::filesystem::path& path, std::string* out, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "failed to open file: " + path.string();
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    if (error) {
      *error = "failed to read file: " + path.string();
    }
    return false;
  }
  if (out) {
    *out = buffer.str();
  }
  return true;
}

bool WriteStringToFile(const std::filesystem::path& path, const std::string& data,
                       std::string* error) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      if (error) {
        *error = "failed to create directory " + path.parent_path().string() + ": " +
                 ec.message();
      }
      return false;
    }
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  out << data;
  out.flush();
  if (!out.good()) {
    if (error) {
      *error = "failed to write file: " + path.string();
    }
    return false;
  }
  return true;
}

bool IsSameOrInside(const std::filesystem::path& path, const std::filesystem::path& root) {
  std::error_code ec;
  std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    resolved = std::filesystem::absolute(path, ec).lexically_normal();
  }
  std::filesystem::path resolved_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    resolved_root = std::filesystem::absolute(root, ec).lexically_normal();
  }
  auto p = resolved.begin();
  for (auto r = resolved_root.begin(); r != resolved_root.end(); ++r) {
    if (r->empty()) {
      continue;  // Trailing separator.
    }
    if (p == resolved.end() || *p != *r) {
      return false;
    }
    ++p;
  }
  return true;
}

bool CopyDirectoryTree(const std::filesystem::path& source,
                       const std::filesystem::path& destination,
                       std::string* error) {
  std::error_code ec;
  if (!std::filesystem::is_directory(source, ec)) {
    if (error) {
      *error = "not a directory: " + source.string();
    }
    return false;
  }
  if (IsSameOrInside(destination, source)) {
    if (error) {
      *error = "cannot copy " + source.string() + " into itself: " + destination.string();
    }
    return false;
  }
  std::filesystem::create_directories(destination, ec);
  if (ec) {
    if (error) {
      *error = "failed to create " + destination.string() + ": " + ec.message();
    }
    return false;
  }
  std::filesystem::recursive_directory_iterator it(source, ec);
  if (ec) {
    if (error) {
      *error = "failed to list " + source.string() + ": " + ec.message();
    }
    return false;
  }
  for (; it != std::filesystem::end(it); it.increment(ec)) {
    if (ec) {
      break;
    }
    const std::filesystem::path rel = std::filesystem::relative(it->path(), source, ec);
    if (ec) {
      break;
    }
    const std::filesystem::path target = destination / rel;
    if (it->is_symlink(ec)) {
      std::filesystem::copy_symlink(it->path(), target, ec);
    } else if (it->is_directory(ec)) {
      std::filesystem::create_directories(target, ec);
    } else {
      std::filesystem::copy_file(it->path(), target,
                                 std::filesystem::copy_options::overwrite_existing, ec);
    }
    if (ec) {
      if (error) {
        *error = "failed to copy " + it->path().string() + " -> " + target.string() + ": " +
                 ec.message();
      }
      return false;
    }
  }
  if (ec) {
    if (error) {
      *error = "failed to copy " + source.string() + ": " + ec.message();
    }
    return false;
  }
  return true;
}

bool IsMissingOrEmptyDirectory(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }
  return std::filesystem::is_directory(path, ec) && std::filesystem::is_empty(path, ec);
}
