#pragma once
#include "errors.hpp"
#include "registry.hpp"
#include "workspace.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

struct ManagerOptions {
  std::chrono::milliseconds startup_delay{2000};
  std::chrono::milliseconds stop_timeout{1000};
  std::filesystem::path logs_dir;
  std::uintmax_t log_max_bytes = 5 * 1024 * 1024;
  int log_backups = 3;
  std::size_t initial_output_bytes = 4096;
};

struct StartResult {
  ProcessInfo info;
  bool running = false;
  std::optional<int> exit_code; // set when the child died during startup
  std::string initial_output;
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

struct StopResult {
  std::string name;
  int pid = -1;
  std::optional<int> exit_code;
  bool forced = false;
  std::chrono::milliseconds uptime{0};
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

struct HealthReport {
  std::size_t total = 0;
  std::size_t running = 0;
  std::size_t exited = 0; // dropped by this check after exiting on their own
  std::vector<std::string> problems;
  bool healthy = true;

  const char *status() const { return healthy ? "Healthy" : "Degraded"; }
};

struct LookupResult {
  std::optional<ProcessInfo> info;
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

// Starts, stops and sweeps named long-running children.
class ProcessManager {
public:
  ProcessManager(Launcher &launcher, const Workspace &ws, ManagerOptions opts);
  ~ProcessManager();

  ProcessManager(const ProcessManager &) = delete;
  ProcessManager &operator=(const ProcessManager &) = delete;

  StartResult start(const std::string &name, const std::vector<std::string> &argv,
                    const std::string &cwd = {}, std::optional<int> port = {});
  StopResult stop(const std::string &name);

  std::vector<ProcessInfo> list();
  LookupResult details(const std::string &name);
  bool is_running(const std::string &name);

  // Force-kills everything; returns the names that were tracked.
  std::vector<std::string> kill_all();

  HealthReport health_check();

  const ManagerOptions &options() const { return opts_; }

private:
  // Drops Running records whose child has exited; returns how many.
  std::size_t reap_exited();

  Launcher &launcher_;
  const Workspace &ws_;
  ManagerOptions opts_;
  ProcessRegistry registry_;
};

} // namespace cmdgate
