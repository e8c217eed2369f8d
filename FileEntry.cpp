#include "FileEntry.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace {

TimePoint to_time_point(std::int64_t sec, std::int64_t nsec) {
  using namespace std::chrono;
  return TimePoint{seconds{sec}} +
         duration_cast<microseconds>(nanoseconds{nsec});
}

[[noreturn]] void throw_stat_error(const fs::path& path, int err) {
  throw fs::filesystem_error("cannot read file metadata", path,
                             std::error_code(err, std::generic_category()));
}

}  // namespace

FileEntry::FileEntry(fs::path path) : m_path(std::move(path)) {}

const FileMetadata& FileEntry::metadata() const {
  if (!m_metadata) {
    m_metadata = read_file_metadata(m_path);
  }
  return *m_metadata;
}

FileMetadata read_file_metadata(const fs::path& path) {
  FileMetadata meta;
#if defined(__linux__) && defined(STATX_BTIME)
  struct statx stx{};
  if (::statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT,
              STATX_BASIC_STATS | STATX_BTIME, &stx) != 0) {
    throw_stat_error(path, errno);
  }
  meta.size = stx.stx_size;
  meta.modified = to_time_point(stx.stx_mtime.tv_sec, stx.stx_mtime.tv_nsec);
  if (stx.stx_mask & STATX_BTIME) {
    meta.created = to_time_point(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
    meta.birth_time_is_native = true;
  } else {
    meta.created = to_time_point(stx.stx_ctime.tv_sec, stx.stx_ctime.tv_nsec);
  }
#else
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    throw_stat_error(path, errno);
  }
  meta.size = static_cast<std::uintmax_t>(st.st_size);
#if defined(__APPLE__) || defined(__FreeBSD__)
  meta.modified = to_time_point(st.st_mtimespec.tv_sec, st.st_mtimespec.tv_nsec);
  meta.created =
      to_time_point(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
  meta.birth_time_is_native = true;
#else
  meta.modified = to_time_point(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
  meta.created = to_time_point(st.st_ctim.tv_sec, st.st_ctim.tv_nsec);
#endif
#endif
  return meta;
}
