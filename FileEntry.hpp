#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "types.hpp"

struct FileMetadata {
  TimePoint modified;
  // Birth time where the platform reports one, otherwise the inode change
  // time. The fallback is a known inaccuracy; check birth_time_is_native.
  TimePoint created;
  bool birth_time_is_native = false;
  std::uintmax_t size = 0;
};

// One regular file found by the scanner. Metadata is read from disk on first
// use and cached for the rest of the run.
class FileEntry {
 public:
  explicit FileEntry(fs::path path);

  const fs::path& path() const { return m_path; }
  std::string name() const { return safe_path_to_string(m_path.filename()); }
  std::string extension() const { return extension_of(m_path); }

  // Throws fs::filesystem_error if the file cannot be stat'ed.
  const FileMetadata& metadata() const;

 private:
  fs::path m_path;
  mutable std::optional<FileMetadata> m_metadata;
};

// Reads metadata straight from disk without caching.
FileMetadata read_file_metadata(const fs::path& path);
