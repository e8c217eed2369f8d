#pragma once

#include <stdexcept>
#include <vector>

#include "FileEntry.hpp"
#include "LogSink.hpp"

class ScanError : public std::runtime_error {
 public:
  enum class Kind { NOT_A_DIRECTORY, PERMISSION_DENIED, IO_ERROR };

  ScanError(Kind kind, const std::string& message)
      : std::runtime_error(message), m_kind(kind) {}

  Kind kind() const { return m_kind; }

 private:
  Kind m_kind;
};

// Lists the regular files directly inside `dir`, sorted by name.
// Subdirectories, symlinks to directories and special files are left out.
// Throws ScanError if `dir` is missing, not a directory, or unreadable.
std::vector<FileEntry> scan_directory(const fs::path& dir, LogSink& sink);
