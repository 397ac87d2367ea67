#include <catch2/catch_all.hpp>
#include <cmdgate/process_manager.hpp>
#include <cmdgate/timeout.hpp>

#include <signal.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace cmdgate;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("cmdgate_pm_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static ManagerOptions fast_options(const fs::path &dir) {
  ManagerOptions o;
  o.startup_delay = 50ms;
  o.stop_timeout = 500ms;
  o.logs_dir = dir / "logs";
  return o;
}

static bool alive(int pid) { return pid > 0 && ::kill(pid, 0) == 0; }

// true once pid is gone or only a zombie waiting for its new parent
static bool dead(int pid) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!in || !std::getline(in, line)) return true;
  auto p = line.rfind(')');
  return p != std::string::npos && p + 2 < line.size() && line[p + 2] == 'Z';
}

static bool dead_within(int pid, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!dead(pid)) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(20ms);
  }
  return true;
}

TEST_CASE("start and stop a long running child") {
  auto dir = mkd("sleep");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto r = pm.start("sleeper", {"sleep", "30"});
  REQUIRE(r.ok());
  REQUIRE(r.running);
  REQUIRE(r.info.pid > 0);
  REQUIRE(r.info.state == ProcState::Running);
  REQUIRE(r.info.cwd == ws.root());
  REQUIRE(pm.is_running("sleeper"));

  auto listed = pm.list();
  REQUIRE(listed.size() == 1);
  REQUIRE(listed[0].name == "sleeper");
  REQUIRE(listed[0].command == "sleep 30");

  auto s = pm.stop("sleeper");
  REQUIRE(s.ok());
  REQUIRE(s.pid == r.info.pid);
  REQUIRE_FALSE(s.forced);
  REQUIRE(s.exit_code == 128 + SIGTERM);
  REQUIRE(pm.list().empty());
  REQUIRE_FALSE(alive(r.info.pid));
}

TEST_CASE("a second start with the same name is refused") {
  auto dir = mkd("dup");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto first = pm.start("web", {"sleep", "30"});
  REQUIRE(first.ok());

  auto second = pm.start("web", {"sleep", "30"});
  REQUIRE(second.failure);
  REQUIRE(second.failure->kind == ErrorKind::DuplicateName);

  auto d = pm.details("web");
  REQUIRE(d.ok());
  REQUIRE(d.info->pid == first.info.pid);
  REQUIRE(alive(first.info.pid));
  REQUIRE(pm.stop("web").ok());
}

TEST_CASE("stop, details and kill_all on an empty registry") {
  auto dir = mkd("empty");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto s = pm.stop("ghost");
  REQUIRE(s.failure->kind == ErrorKind::NotFound);
  REQUIRE(s.failure->message.find("ghost") != std::string::npos);
  REQUIRE(pm.details("ghost").failure->kind == ErrorKind::NotFound);
  REQUIRE(pm.kill_all().empty());
  REQUIRE(pm.kill_all().empty());
}

TEST_CASE("a child that ignores SIGTERM is killed after the stop timeout") {
  auto dir = mkd("stubborn");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto r = pm.start("stubborn", {"sh", "-c", "trap '' TERM; while true; do sleep 1; done"});
  REQUIRE(r.ok());
  auto s = pm.stop("stubborn");
  REQUIRE(s.ok());
  REQUIRE(s.forced);
  REQUIRE(s.exit_code == 128 + SIGKILL);
  REQUIRE_FALSE(alive(r.info.pid));
}

TEST_CASE("fast failing commands surface during the startup grace") {
  auto dir = mkd("fastfail");
  Workspace ws(dir);
  PosixLauncher launcher;
  auto opts = fast_options(dir);
  opts.startup_delay = 1000ms;
  ProcessManager pm(launcher, ws, opts);

  SECTION("non-zero exit") {
    auto r = pm.start("bad", {"sh", "-c", "echo boom >&2; exit 3"});
    REQUIRE(r.failure->kind == ErrorKind::NonZeroExit);
    REQUIRE(r.exit_code == 3);
    REQUIRE(r.initial_output.find("boom") != std::string::npos);
    REQUIRE_FALSE(r.running);
    REQUIRE(pm.list().empty());
  }
  SECTION("clean exit is reported but not kept") {
    auto r = pm.start("once", {"sh", "-c", "echo hi"});
    REQUIRE(r.ok());
    REQUIRE_FALSE(r.running);
    REQUIRE(r.exit_code == 0);
    REQUIRE(pm.list().empty());
  }
  SECTION("missing executable") {
    auto r = pm.start("typo", {"definitely-not-a-real-binary-xyz"});
    REQUIRE(r.failure->kind == ErrorKind::SpawnFailure);
    REQUIRE(pm.list().empty());
  }
  SECTION("missing working directory") {
    auto r = pm.start("nowhere", {"sleep", "1"}, "does/not/exist");
    REQUIRE(r.failure->kind == ErrorKind::SpawnFailure);
    REQUIRE_FALSE(pm.is_running("nowhere"));
  }
  SECTION("names that would escape the log directory") {
    REQUIRE(pm.start("../x", {"sleep", "1"}).failure->kind == ErrorKind::InvalidArgument);
    REQUIRE(pm.start("", {"sleep", "1"}).failure->kind == ErrorKind::InvalidArgument);
  }
}

TEST_CASE("the child sees PORT and its working directory") {
  auto dir = mkd("env");
  fs::create_directories(dir / "app");
  Workspace ws(dir);
  PosixLauncher launcher;
  auto opts = fast_options(dir);
  opts.startup_delay = 1000ms;
  ProcessManager pm(launcher, ws, opts);

  auto r = pm.start("env", {"sh", "-c", "pwd; echo port=$PORT"}, "app", 4321);
  REQUIRE(r.ok());
  REQUIRE(r.exit_code == 0);
  REQUIRE(r.initial_output.find("port=4321") != std::string::npos);
  REQUIRE(r.initial_output.find("/app") != std::string::npos);

  auto logs = fs::path(pm.options().logs_dir);
  REQUIRE(fs::exists(logs / "env.out"));
}

TEST_CASE("list drops children that exited on their own") {
  auto dir = mkd("reap");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto r = pm.start("short", {"sleep", "0.3"});
  REQUIRE(r.running);
  std::this_thread::sleep_for(600ms);
  REQUIRE(pm.list().empty());
  REQUIRE(pm.stop("short").failure->kind == ErrorKind::NotFound);
}

TEST_CASE("a name whose child exited can be started again") {
  auto dir = mkd("restart");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto first = pm.start("web", {"sleep", "0.3"});
  REQUIRE(first.running);
  std::this_thread::sleep_for(600ms);

  auto again = pm.start("web", {"sleep", "30"});
  REQUIRE(again.ok());
  REQUIRE(again.running);
  REQUIRE(again.info.pid != first.info.pid);
  REQUIRE(pm.is_running("web"));

  auto stopped = pm.stop("web");
  REQUIRE_FALSE(stopped.failure);
  REQUIRE(stopped.pid == again.info.pid);
}

TEST_CASE("lookups and kill_all skip children that already exited") {
  auto dir = mkd("dead");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  REQUIRE(pm.start("short", {"sleep", "0.3"}).running);
  auto keep = pm.start("keep", {"sleep", "30"});
  REQUIRE(keep.running);
  std::this_thread::sleep_for(600ms);

  auto health = pm.health_check();
  REQUIRE(health.total == 1);
  REQUIRE(health.running == 1);
  REQUIRE(health.exited == 1);
  REQUIRE(std::string(health.status()) == "Healthy");

  REQUIRE_FALSE(pm.is_running("short"));
  REQUIRE(pm.details("short").failure->kind == ErrorKind::NotFound);
  REQUIRE(pm.kill_all() == std::vector<std::string>{"keep"});
  REQUIRE_FALSE(alive(keep.info.pid));
}

TEST_CASE("a reaped child is not signalled again") {
  auto dir = mkd("reaped");
  PosixLauncher launcher;
  SpawnOptions so;
  so.argv = {"sh", "-c", "exit 3"};
  so.cwd = dir;
  auto child = launcher.spawn(so);
  REQUIRE(child.valid());

  const auto deadline = std::chrono::steady_clock::now() + 2000ms;
  while (!child.poll() && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(20ms);
  REQUIRE(child.exit_code() == 3);

  REQUIRE_FALSE(child.signal(SIGTERM));
  REQUIRE(child.kill() == 3);
  REQUIRE(child.exit_code() == 3);
}

TEST_CASE("members left behind by an exited leader are killed on reap") {
  auto dir = mkd("orphans");
  auto pidfile = dir / "bg.pid";
  PosixLauncher launcher;
  SpawnOptions so;
  so.argv = {"sh", "-c", "sleep 30 & echo $! > \"" + pidfile.string() + "\"; exit 0"};
  so.cwd = dir;
  auto child = launcher.spawn(so);

  const auto deadline = std::chrono::steady_clock::now() + 2000ms;
  while (!child.poll() && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(20ms);
  REQUIRE(child.exit_code() == 0);

  int bg = 0;
  std::ifstream(pidfile) >> bg;
  REQUIRE(bg > 0);
  REQUIRE(dead_within(bg, 2000ms));
}

TEST_CASE("kill_all terminates every tracked child") {
  auto dir = mkd("killall");
  Workspace ws(dir);
  PosixLauncher launcher;
  ProcessManager pm(launcher, ws, fast_options(dir));

  auto a = pm.start("a", {"sleep", "30"});
  auto b = pm.start("b", {"sleep", "30"});
  REQUIRE(a.running);
  REQUIRE(b.running);

  auto health = pm.health_check();
  REQUIRE(health.total == 2);
  REQUIRE(health.running == 2);
  REQUIRE(std::string(health.status()) == "Healthy");

  auto killed = pm.kill_all();
  std::sort(killed.begin(), killed.end());
  REQUIRE(killed == std::vector<std::string>{"a", "b"});
  REQUIRE(pm.list().empty());
  REQUIRE_FALSE(alive(a.info.pid));
  REQUIRE_FALSE(alive(b.info.pid));
}

TEST_CASE("run_with_timeout") {
  SECTION("returns the value of quick work") {
    REQUIRE(run_with_timeout([] { return 42; }, 1000ms) == 42);
  }
  SECTION("throws once the timer wins") {
    try {
      (void)run_with_timeout([] { std::this_thread::sleep_for(300ms); return 1; }, 20ms);
      FAIL("expected TimeoutError");
    } catch (const TimeoutError &e) {
      REQUIRE(e.after() == 20ms);
      REQUIRE(std::string(e.what()).find("20ms") != std::string::npos);
    }
  }
  SECTION("propagates exceptions from the work") {
    REQUIRE_THROWS_AS(run_with_timeout([]() -> int { throw std::logic_error("x"); }, 1000ms),
                      std::logic_error);
  }
}
