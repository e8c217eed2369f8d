#pragma once

#include <cstdint>
#include <system_error>

#include "types.hpp"

// The mutating filesystem calls made by the action executor. Every call
// reports failure through `ec` instead of throwing so that one bad file never
// stops the batch.
class FileSystem {
 public:
  FileSystem() = default;
  FileSystem(const FileSystem&) = delete;
  FileSystem& operator=(const FileSystem&) = delete;
  virtual ~FileSystem() = default;

  virtual std::uintmax_t file_size(const fs::path& path,
                                   std::error_code& ec) = 0;
  virtual void create_directories(const fs::path& dir,
                                  std::error_code& ec) = 0;
  // Moves `from` to `to`; `to` must not exist.
  virtual void move_file(const fs::path& from, const fs::path& to,
                         std::error_code& ec) = 0;
  virtual void remove_file(const fs::path& path, std::error_code& ec) = 0;
};

class RealFileSystem : public FileSystem {
 public:
  std::uintmax_t file_size(const fs::path& path, std::error_code& ec) override;
  void create_directories(const fs::path& dir, std::error_code& ec) override;
  void move_file(const fs::path& from, const fs::path& to,
                 std::error_code& ec) override;
  void remove_file(const fs::path& path, std::error_code& ec) override;
};
