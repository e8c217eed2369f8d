#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent and returns a UTF-8 encoded string.
  // On C++20/23, this returns a std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and answers typed at a prompt.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string_view trim_ascii(std::string_view sv) {
  constexpr std::string_view whitespace = " \t\r\n\f\v";
  const auto first = sv.find_first_not_of(whitespace);
  if (first == std::string_view::npos) return {};
  const auto last = sv.find_last_not_of(whitespace);
  return sv.substr(first, last - first + 1);
}

// "JPG", ".jpg" and " .Jpg " all become "jpg".
inline std::string normalize_extension(std::string_view ext) {
  ext = trim_ascii(ext);
  if (ext.starts_with('.')) ext.remove_prefix(1);
  return string_to_lower_ascii(ext);
}

// Extension of a file as rules see it: lower-case, no dot, empty if none.
inline std::string extension_of(const fs::path& p) {
  return normalize_extension(safe_path_to_string(p.extension()));
}

// Binary units with two decimals ("1.50KB"); zero renders as "0B".
inline std::string format_size(std::uintmax_t bytes) {
  if (bytes == 0) return "0B";
  static constexpr std::array<std::string_view, 5> units = {"B", "KB", "MB",
                                                            "GB", "TB"};
  auto value = static_cast<double>(bytes);
  std::size_t unit = 0;
  // 1023.995 and up would print as "1024.00" in the smaller unit.
  while (value >= 1023.995 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  return std::format("{:.2f}{}", value, units[unit]);
}

// Generates a unique path by appending a number (e.g., "file (1).txt")
// if the target path already exists. This prevents overwriting files.
// If an existence check fails (symlink loop, unsearchable directory), `ec`
// is set and an empty path is returned.
inline fs::path generate_unique_path(const fs::path& target_path,
                                     std::error_code& ec) {
  ec.clear();
  if (!fs::exists(target_path, ec)) {
    return ec ? fs::path{} : target_path;
  }

  const fs::path parent_dir = target_path.parent_path();
  const std::string stem_str = safe_path_to_string(target_path.stem());
  const fs::path ext = target_path.extension();

  int counter = 1;
  fs::path new_path;
  do {
    const std::string new_filename_str =
        std::format("{} ({}){}", stem_str, counter++, safe_path_to_string(ext));
    new_path =
        parent_dir /
        fs::path(reinterpret_cast<const char8_t*>(new_filename_str.c_str()));
  } while (fs::exists(new_path, ec));

  return ec ? fs::path{} : new_path;
}
