#include "FileSystem.hpp"

std::uintmax_t RealFileSystem::file_size(const fs::path& path,
                                         std::error_code& ec) {
  const auto size = fs::file_size(path, ec);
  return ec ? 0 : size;
}

void RealFileSystem::create_directories(const fs::path& dir,
                                        std::error_code& ec) {
  fs::create_directories(dir, ec);
}

void RealFileSystem::move_file(const fs::path& from, const fs::path& to,
                               std::error_code& ec) {
  fs::rename(from, to, ec);
  if (ec != std::errc::cross_device_link) return;

  // Destination is on another filesystem: copy, then drop the original.
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::none, ec);
  if (ec) return;
  fs::remove(from, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(to, cleanup_ec);
  }
}

void RealFileSystem::remove_file(const fs::path& path, std::error_code& ec) {
  if (!fs::remove(path, ec) && !ec) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
}
