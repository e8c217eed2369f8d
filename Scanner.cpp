#include "Scanner.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace {

ScanError make_scan_error(const fs::path& dir, const std::error_code& ec) {
  if (ec == std::errc::permission_denied ||
      ec == std::errc::operation_not_permitted) {
    return ScanError(ScanError::Kind::PERMISSION_DENIED,
                     std::format("Permission denied to access directory '{}'",
                                 safe_path_to_string(dir)));
  }
  if (ec == std::errc::no_such_file_or_directory ||
      ec == std::errc::not_a_directory) {
    return ScanError(
        ScanError::Kind::NOT_A_DIRECTORY,
        std::format("Target directory '{}' does not exist or is not a "
                    "directory",
                    safe_path_to_string(dir)));
  }
  return ScanError(ScanError::Kind::IO_ERROR,
                   std::format("Cannot list directory '{}': {}",
                               safe_path_to_string(dir), ec.message()));
}

}  // namespace

std::vector<FileEntry> scan_directory(const fs::path& dir, LogSink& sink) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw make_scan_error(
        dir, ec ? ec : std::make_error_code(std::errc::not_a_directory));
  }

  sink.info(std::format("Scanning directory '{}'...", safe_path_to_string(dir)));

  std::vector<FileEntry> files;
  fs::directory_iterator it(dir, ec);
  if (ec) throw make_scan_error(dir, ec);

  for (; it != fs::directory_iterator{}; it.increment(ec)) {
    if (ec) throw make_scan_error(dir, ec);

    // is_regular_file follows symlinks, so a link to a file counts and a
    // link to a directory does not.
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    files.emplace_back(it->path());
  }
  if (ec) throw make_scan_error(dir, ec);

  std::sort(files.begin(), files.end(),
            [](const FileEntry& a, const FileEntry& b) {
              return a.path().filename() < b.path().filename();
            });

  sink.info(std::format("Found {} files.", files.size()));
  return files;
}
