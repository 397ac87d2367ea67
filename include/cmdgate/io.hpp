#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace cmdgate {
namespace io {
  void ensure_dir(const std::filesystem::path& p);

  // Shifts base -> base.1 -> base.2 ... when base is at least max_bytes.
  void rotate_logs(const std::filesystem::path& base_path,
                   std::uintmax_t max_bytes,
                   int backups);

  // At most max_bytes starting at byte `offset`, "" if unreadable.
  std::string read_from(const std::filesystem::path& path, std::uintmax_t offset,
                        std::size_t max_bytes);

  // Current size, 0 for a missing file.
  std::uintmax_t size_or_zero(const std::filesystem::path& path);

  struct LogPair {
    std::filesystem::path out;
    std::filesystem::path err;
  };
  LogPair log_paths(const std::filesystem::path& logs_dir, const std::string& name);
}
} // namespace cmdgate
