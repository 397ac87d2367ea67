#include <catch2/catch_all.hpp>
#include <cmdgate/io.hpp>

#include <filesystem>
#include <fstream>

using namespace cmdgate;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("cmdgate_logrot_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void fill(const fs::path &p, char c, int n) {
  std::ofstream o(p, std::ios::app);
  for (int i = 0; i < n; i++)
    o << c;
}

TEST_CASE("log rotation rolls files") {
  auto d = mkd("rot");
  auto base = d / "web.out";

  fill(base, 'x', 2000);
  io::rotate_logs(base, 1024, 2);
  REQUIRE(fs::exists(base));
  REQUIRE(fs::file_size(base) == 0);
  REQUIRE(fs::file_size(d / "web.out.1") == 2000);

  fill(base, 'y', 2000);
  io::rotate_logs(base, 1024, 2);
  fill(base, 'z', 2000);
  io::rotate_logs(base, 1024, 2);

  REQUIRE(io::read_from(d / "web.out.1", 0, 1) == "z");
  REQUIRE(io::read_from(d / "web.out.2", 0, 1) == "y");
  REQUIRE_FALSE(fs::exists(d / "web.out.3"));
}

TEST_CASE("small logs are left alone") {
  auto d = mkd("small");
  auto base = d / "api.err";
  fill(base, 'a', 10);
  io::rotate_logs(base, 1024, 3);
  REQUIRE(fs::file_size(base) == 10);
  REQUIRE_FALSE(fs::exists(d / "api.err.1"));
  io::rotate_logs(d / "missing.log", 1, 3);
  REQUIRE_FALSE(fs::exists(d / "missing.log"));
}

TEST_CASE("read_from starts at an offset") {
  auto d = mkd("read");
  auto f = d / "f.log";
  fill(f, 'a', 3);
  auto off = io::size_or_zero(f);
  fill(f, 'b', 5);
  REQUIRE(io::read_from(f, off, 100) == "bbbbb");
  REQUIRE(io::read_from(f, 0, 2) == "aa");
  REQUIRE(io::read_from(d / "none", 0, 10).empty());
  REQUIRE(io::size_or_zero(d / "none") == 0);
  REQUIRE(io::log_paths(d, "web").out == d / "web.out");
}
