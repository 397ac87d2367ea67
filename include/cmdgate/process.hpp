#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdgate {

class SpawnError : public std::runtime_error {
public:
  SpawnError(const std::string &what, int err)
      : std::runtime_error(what), errno_(err) {}
  int error_number() const { return errno_; }

private:
  int errno_;
};

// Exclusive owner of one child pid (leader of its own process group).
// Destroying a handle that was never reaped kills and reaps the child.
class ChildProcess {
public:
  ChildProcess() = default;
  explicit ChildProcess(int pid) : pid_(pid) {}
  ~ChildProcess();

  ChildProcess(ChildProcess &&o) noexcept;
  ChildProcess &operator=(ChildProcess &&o) noexcept;
  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  bool valid() const { return pid_ > 0; }
  int pid() const { return pid_; }
  bool exited() const { return exit_code_.has_value(); }
  std::optional<int> exit_code() const { return exit_code_; }

  // Non-blocking reap. Exit code, or 128+signal for a signalled child.
  // Once the leader has exited, what is left of its group is killed
  // before the leader is reaped.
  std::optional<int> poll();

  // Signals the whole process group; false once the child is reaped.
  bool signal(int sig);

  // SIGKILL to the group, then a blocking reap. A reaped child is not
  // signalled again; its recorded code is returned.
  int kill();

private:
  void release();

  int pid_ = -1;
  std::optional<int> exit_code_;
};

struct SpawnOptions {
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  std::unordered_map<std::string, std::string> env; // added to the parent's
  std::filesystem::path stdout_path; // empty -> /dev/null
  std::filesystem::path stderr_path;
};

struct RunOptions {
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  std::unordered_map<std::string, std::string> env;
  std::chrono::milliseconds timeout{30000}; // <= 0 disables
  std::size_t max_output_bytes = 1024 * 1024;  // per stream
};

struct ExecutionResult {
  std::string command;
  int exit_code = -1;
  std::string stdout_data;
  std::string stderr_data;
  long long duration_ms = 0;
  bool timed_out = false;
  bool output_truncated = false;
};

// The spawn primitive. Tests substitute it to count or script spawns.
class Launcher {
public:
  virtual ~Launcher() = default;

  // Starts a detached-from-terminal child; throws SpawnError.
  virtual ChildProcess spawn(const SpawnOptions &opts) = 0;

  // Runs to completion capturing stdout/stderr; throws SpawnError.
  virtual ExecutionResult run(const RunOptions &opts) = 0;
};

class PosixLauncher : public Launcher {
public:
  ChildProcess spawn(const SpawnOptions &opts) override;
  ExecutionResult run(const RunOptions &opts) override;
};

// Decodes a waitpid() status: exit code, or 128+signal.
int decode_wait_status(int status);

} // namespace cmdgate
