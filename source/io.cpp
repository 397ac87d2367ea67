#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <cmdgate/io.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cmdgate {
namespace io {

void ensure_dir(const fs::path &p) {
  std::error_code ec;
  if (!fs::exists(p, ec))
    fs::create_directories(p);
}

void rotate_logs(const fs::path &base_path, std::uintmax_t max_bytes,
                 int backups) {
  std::error_code ec;
  if (backups < 1 || !fs::exists(base_path, ec))
    return;
  auto sz = fs::file_size(base_path, ec);
  if (ec || sz < max_bytes)
    return;

  auto numbered = [&](int i) {
    fs::path p = base_path;
    p += "." + std::to_string(i);
    return p;
  };

  // the oldest backup falls off the end
  fs::remove(numbered(backups), ec);
  for (int i = backups - 1; i >= 1; --i) {
    std::error_code e2;
    if (fs::exists(numbered(i), e2))
      fs::rename(numbered(i), numbered(i + 1), e2);
  }
  fs::rename(base_path, numbered(1), ec);

  int fd = ::open(base_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd >= 0)
    ::close(fd);
}

std::string read_from(const fs::path &path, std::uintmax_t offset,
                      std::size_t max_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return {};
  in.seekg(static_cast<std::streamoff>(offset));
  if (!in)
    return {};
  std::string data(max_bytes, '\0');
  in.read(data.data(), static_cast<std::streamsize>(max_bytes));
  data.resize(static_cast<std::size_t>(in.gcount()));
  return data;
}

std::uintmax_t size_or_zero(const fs::path &path) {
  std::error_code ec;
  auto sz = fs::file_size(path, ec);
  return ec ? 0 : sz;
}

LogPair log_paths(const fs::path &logs_dir, const std::string &name) {
  return LogPair{logs_dir / (name + ".out"), logs_dir / (name + ".err")};
}

} // namespace io
} // namespace cmdgate
