#include <cmdgate/process.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

extern char **environ;

namespace fs = std::filesystem;

namespace cmdgate {

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// ------------------------ ChildProcess ------------------------

ChildProcess::~ChildProcess() { release(); }

ChildProcess::ChildProcess(ChildProcess&& o) noexcept
  : pid_(o.pid_), exit_code_(o.exit_code_) {
  o.pid_ = -1; o.exit_code_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& o) noexcept {
  if (this != &o) {
    release();
    pid_ = o.pid_; exit_code_ = o.exit_code_;
    o.pid_ = -1; o.exit_code_.reset();
  }
  return *this;
}

void ChildProcess::release() {
  if (valid() && !exited()) {
    spdlog::debug("[proc] unreleased handle pid={}, killing", pid_);
    (void)kill();
  }
  pid_ = -1;
}

std::optional<int> ChildProcess::poll() {
  if (!valid() || exit_code_) return exit_code_;
  siginfo_t si{};
  int r = ::waitid(P_PID, static_cast<id_t>(pid_), &si, WEXITED | WNOHANG | WNOWAIT);
  if (r < 0) {
    // reaped elsewhere; nothing left to own
    if (errno == ECHILD) exit_code_ = -1;
    return exit_code_;
  }
  if (si.si_pid != pid_) return exit_code_;

  // The unreaped leader still pins the group id, so members it left
  // behind can be killed without hitting an unrelated group.
  (void)::kill(-pid_, SIGKILL);
  int status = 0;
  pid_t w;
  do { w = ::waitpid(pid_, &status, 0); } while (w < 0 && errno == EINTR);
  exit_code_ = (w == pid_) ? decode_wait_status(status) : -1;
  return exit_code_;
}

bool ChildProcess::signal(int sig) {
  if (!valid() || exited()) return false;
  if (::kill(-pid_, sig) == 0) return true;
  return ::kill(pid_, sig) == 0;
}

int ChildProcess::kill() {
  if (!valid()) return -1;
  if (exited()) return *exit_code_;
  (void)::kill(-pid_, SIGKILL);
  (void)::kill(pid_, SIGKILL);
  int status = 0;
  pid_t r;
  do { r = ::waitpid(pid_, &status, 0); } while (r < 0 && errno == EINTR);
  exit_code_ = (r == pid_) ? decode_wait_status(status) : -1;
  return *exit_code_;
}

// ------------------------ spawn helpers ------------------------

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

// Everything the child needs is prepared before fork(): the child only
// calls async-signal-safe functions.
struct ExecImage {
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;

  ExecImage(const std::vector<std::string>& args,
            const std::unordered_map<std::string,std::string>& extra_env) {
    for (char** e = environ; e && *e; ++e) {
      std::string kv = *e;
      auto eq = kv.find('=');
      if (eq != std::string::npos && extra_env.count(kv.substr(0, eq))) continue;
      env_storage.push_back(std::move(kv));
    }
    for (auto& [k,v] : extra_env) env_storage.push_back(k + "=" + v);

    argv.reserve(args.size()+1);
    for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);
    envp.reserve(env_storage.size()+1);
    for (auto& s : env_storage) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);
  }
};

[[noreturn]] static void child_exec(const ExecImage& img, const fs::path& cwd,
                                    int in_fd, int out_fd, int err_fd, int report_fd) {
  ::setpgid(0, 0);
  if (in_fd >= 0) ::dup2(in_fd, STDIN_FILENO);
  ::dup2(out_fd, STDOUT_FILENO);
  ::dup2(err_fd, STDERR_FILENO);

  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    _exit(127);
  }
  ::execvpe(img.argv[0], img.argv.data(), img.envp.data());

  int err = errno;
  (void)!::write(report_fd, &err, sizeof(err));
  _exit(127);
}

// Reads the errno the child reports if exec fails; 0 once exec succeeded.
static int await_exec(int report_rd) {
  int child_errno = 0;
  ssize_t n;
  do { n = ::read(report_rd, &child_errno, sizeof(child_errno)); } while (n < 0 && errno == EINTR);
  return n > 0 ? child_errno : 0;
}

static std::string describe(const std::vector<std::string>& argv) {
  return fmt::format("{}", fmt::join(argv, " "));
}

// ------------------------ PosixLauncher ------------------------

ChildProcess PosixLauncher::spawn(const SpawnOptions& o) {
  if (o.argv.empty()) throw SpawnError("empty argv", EINVAL);
  ExecImage img(o.argv, o.env);

  int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  int outfd = -1, errfd = -1;
  auto open_target = [&](const fs::path& p) {
    if (p.empty()) return ::dup(devnull);
    return ::open(p.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  };
  outfd = open_target(o.stdout_path);
  errfd = open_target(o.stderr_path);
  if (devnull < 0 || outfd < 0 || errfd < 0) {
    int err = errno;
    close_fd(devnull); close_fd(outfd); close_fd(errfd);
    throw SpawnError(fmt::format("cannot open output for {}: {}", describe(o.argv), strerror(err)), err);
  }

  int pfd[2];
  if (make_cloexec_pipe(pfd) != 0) {
    int err = errno;
    close_fd(devnull); close_fd(outfd); close_fd(errfd);
    throw SpawnError(fmt::format("pipe failed: {}", strerror(err)), err);
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    close_fd(devnull); close_fd(outfd); close_fd(errfd);
    ::close(pfd[0]); ::close(pfd[1]);
    throw SpawnError(fmt::format("fork failed: {}", strerror(err)), err);
  }
  if (pid == 0) {
    ::close(pfd[0]);
    child_exec(img, o.cwd, devnull, outfd, errfd, pfd[1]);
  }

  ::setpgid(pid, pid);
  close_fd(devnull); close_fd(outfd); close_fd(errfd);
  ::close(pfd[1]);
  int child_errno = await_exec(pfd[0]);
  ::close(pfd[0]);

  ChildProcess child(pid);
  if (child_errno != 0) {
    (void)child.kill();
    throw SpawnError(fmt::format("exec '{}' failed: {}", o.argv.front(), strerror(child_errno)),
                     child_errno);
  }
  spdlog::debug("[proc] spawned pid={} argv=[{}]", pid, describe(o.argv));
  return child;
}

static void drain(int fd, std::string& dst, std::size_t cap, bool& truncated, bool& eof) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      std::size_t can = cap > dst.size() ? cap - dst.size() : 0;
      std::size_t take = std::min<std::size_t>(can, static_cast<std::size_t>(n));
      if (take < static_cast<std::size_t>(n)) truncated = true;
      dst.append(buf, take);
      continue;
    }
    if (n == 0) { eof = true; return; }
    if (errno == EINTR) continue;
    return; // EAGAIN
  }
}

ExecutionResult PosixLauncher::run(const RunOptions& o) {
  if (o.argv.empty()) throw SpawnError("empty argv", EINVAL);
  ExecutionResult res;
  res.command = describe(o.argv);
  ExecImage img(o.argv, o.env);

  int outp[2] = {-1,-1}, errp[2] = {-1,-1}, rep[2] = {-1,-1};
  int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull < 0 || make_cloexec_pipe(outp) != 0 || make_cloexec_pipe(errp) != 0 ||
      make_cloexec_pipe(rep) != 0) {
    int err = errno;
    close_fd(devnull);
    for (int* p : {outp, errp, rep}) { close_fd(p[0]); close_fd(p[1]); }
    throw SpawnError(fmt::format("pipe failed: {}", strerror(err)), err);
  }

  auto start = std::chrono::steady_clock::now();
  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    close_fd(devnull);
    for (int* p : {outp, errp, rep}) { close_fd(p[0]); close_fd(p[1]); }
    throw SpawnError(fmt::format("fork failed: {}", strerror(err)), err);
  }
  if (pid == 0) {
    ::close(outp[0]); ::close(errp[0]); ::close(rep[0]);
    child_exec(img, o.cwd, devnull, outp[1], errp[1], rep[1]);
  }

  ::setpgid(pid, pid);
  close_fd(devnull); close_fd(outp[1]); close_fd(errp[1]); close_fd(rep[1]);
  int child_errno = await_exec(rep[0]);
  close_fd(rep[0]);

  ChildProcess child(pid);
  if (child_errno != 0) {
    close_fd(outp[0]); close_fd(errp[0]);
    (void)child.kill();
    throw SpawnError(fmt::format("exec '{}' failed: {}", o.argv.front(), strerror(child_errno)),
                     child_errno);
  }

  for (int fd : {outp[0], errp[0]}) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }

  bool out_eof = false, err_eof = false;
  while (true) {
    if (!out_eof) drain(outp[0], res.stdout_data, o.max_output_bytes, res.output_truncated, out_eof);
    if (!err_eof) drain(errp[0], res.stderr_data, o.max_output_bytes, res.output_truncated, err_eof);

    if (auto rc = child.poll()) {
      res.exit_code = *rc;
      break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (o.timeout.count() > 0 && elapsed >= o.timeout) {
      spdlog::warn("[proc] '{}' timed out after {}ms; killing pid={}", res.command,
                   o.timeout.count(), pid);
      res.timed_out = true;
      res.exit_code = child.kill();
      break;
    }

    pollfd pfds[2];
    nfds_t n = 0;
    if (!out_eof) pfds[n++] = pollfd{outp[0], POLLIN, 0};
    if (!err_eof) pfds[n++] = pollfd{errp[0], POLLIN, 0};
    int slice = 50;
    if (o.timeout.count() > 0)
      slice = static_cast<int>(std::max<long long>(1, std::min<long long>(slice, (o.timeout - elapsed).count())));
    if (n > 0) (void)::poll(pfds, n, slice);
    else std::this_thread::sleep_for(std::chrono::milliseconds(slice));
  }

  // whatever is still buffered, without blocking on grandchildren holding the pipe
  if (!out_eof) drain(outp[0], res.stdout_data, o.max_output_bytes, res.output_truncated, out_eof);
  if (!err_eof) drain(errp[0], res.stderr_data, o.max_output_bytes, res.output_truncated, err_eof);
  close_fd(outp[0]); close_fd(errp[0]);

  res.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  spdlog::debug("[proc] '{}' exit={} in {}ms", res.command, res.exit_code, res.duration_ms);
  return res;
}

} // namespace cmdgate
