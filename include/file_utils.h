#ifndef FILE_UTILS_H
#define FILE_UTILS_H

#include <filesystem>
#include <string>

bool ReadFileToString(const std::filesystem::path& path, std::string* out, std::string* error);

// Creates parent directories as needed. Writes in binary mode.
bool WriteStringToFile(const std::filesystem::path& path, const std::string& data,
                       std::string* error);

// True when path is root or lies under it, after resolving both.
bool IsSameOrInside(const std::filesystem::path& path, const std::filesystem::path& root);

// Recursive copy of every entry under source into destination. Stops at the
// first failure and leaves whatever was already copied. A destination inside
// source is refused.
bool CopyDirectoryTree(const std::filesystem::path& source,
                       const std::filesystem::path& destination,
                       std::string* error);

// True when path does not exist or is an empty directory.
bool IsMissingOrEmptyDirectory(const std::filesystem::path& path);

#endif  // FILE_UTILS_H
