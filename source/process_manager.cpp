#include <cmdgate/process_manager.hpp>
#include <cmdgate/io.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <signal.h>

#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace cmdgate {

static bool valid_name(const std::string& name){
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

ProcessManager::ProcessManager(Launcher& launcher, const Workspace& ws, ManagerOptions opts)
  : launcher_(launcher), ws_(ws), opts_(std::move(opts)) {
  if (opts_.logs_dir.empty())
    opts_.logs_dir = fs::temp_directory_path() / "cmdgate" / "logs";
}

ProcessManager::~ProcessManager() {
  auto killed = kill_all();
  if (!killed.empty())
    spdlog::info("[proc] shutdown killed {} process(es)", killed.size());
}

StartResult ProcessManager::start(const std::string& name,
                                  const std::vector<std::string>& argv,
                                  const std::string& cwd,
                                  std::optional<int> port){
  StartResult res;
  if (!valid_name(name)) {
    res.failure = make_failure(ErrorKind::InvalidArgument,
                               fmt::format("Invalid process name '{}'", name));
    return res;
  }
  if (argv.empty()) {
    res.failure = make_failure(ErrorKind::InvalidArgument, "Command required");
    return res;
  }

  // a server that died on its own no longer holds its name
  reap_exited();

  const auto work_dir = ws_.resolve(cwd);
  const auto display = fmt::format("{}", fmt::join(argv, " "));

  ProcessRecord rec;
  rec.name = name;
  rec.command = display;
  rec.cwd = work_dir;
  rec.started_at = std::chrono::system_clock::now();
  rec.port = port;
  if (!registry_.insert(std::move(rec))) {
    res.failure = make_failure(ErrorKind::DuplicateName,
                               fmt::format("Process '{}' is already running", name));
    return res;
  }

  std::error_code ec;
  if (!fs::is_directory(work_dir, ec)) {
    (void)registry_.take(name);
    res.failure = make_failure(ErrorKind::SpawnFailure,
        fmt::format("Working directory does not exist: {}", work_dir.string()));
    return res;
  }

  const auto logs = io::log_paths(opts_.logs_dir, name);
  std::uintmax_t out_off = 0, err_off = 0;
  SpawnOptions so;
  so.argv = argv;
  so.cwd = work_dir;
  if (port) so.env["PORT"] = std::to_string(*port);
  try {
    io::ensure_dir(opts_.logs_dir);
    io::rotate_logs(logs.out, opts_.log_max_bytes, opts_.log_backups);
    io::rotate_logs(logs.err, opts_.log_max_bytes, opts_.log_backups);
    out_off = io::size_or_zero(logs.out);
    err_off = io::size_or_zero(logs.err);
    so.stdout_path = logs.out;
    so.stderr_path = logs.err;
  } catch (const std::exception& e) {
    spdlog::warn("[proc={}] log files unavailable ({}); output discarded", name, e.what());
  }

  ChildProcess child;
  try {
    child = launcher_.spawn(so);
  } catch (const SpawnError& e) {
    (void)registry_.take(name);
    spdlog::error("[proc={}] spawn failed (errno={}): {}", name, e.error_number(), e.what());
    res.failure = make_failure(ErrorKind::SpawnFailure,
                               fmt::format("Failed to start server '{}': {}", name, e.what()));
    return res;
  }

  const int pid = child.pid();
  if (!registry_.attach(name, child)) {
    (void)child.kill();
    res.failure = make_failure(ErrorKind::SpawnFailure,
        fmt::format("Process '{}' was removed while starting", name));
    return res;
  }
  spdlog::info("[proc={}] started pid={} cwd={} cmd={}", name, pid, work_dir.string(), display);

  // startup grace: a child that dies right away is reported, not kept
  std::optional<int> early_exit;
  const auto deadline = std::chrono::steady_clock::now() + opts_.startup_delay;
  while (true) {
    early_exit = registry_.poll(name);
    if (early_exit || std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(20ms);
  }

  auto collect_output = [&]{
    std::string out;
    if (!so.stdout_path.empty()) {
      out = io::read_from(logs.out, out_off, opts_.initial_output_bytes);
      auto err = io::read_from(logs.err, err_off, opts_.initial_output_bytes);
      if (!err.empty()) out += err;
    }
    return out;
  };

  if (early_exit) {
    if (auto gone = registry_.take(name)) {
      res.info.name = gone->name;
      res.info.command = gone->command;
      res.info.cwd = gone->cwd;
      res.info.started_at = gone->started_at;
      res.info.port = gone->port;
      res.info.pid = pid;
    }
    res.exit_code = early_exit;
    res.initial_output = collect_output();
    spdlog::warn("[proc={}] exited during startup code={}", name, *early_exit);
    if (*early_exit != 0) {
      res.failure = make_failure(ErrorKind::NonZeroExit,
          fmt::format("Server '{}' exited with code {} during startup", name, *early_exit));
    }
    return res;
  }

  if (!registry_.transition(name, ProcState::Starting, ProcState::Running)) {
    res.failure = make_failure(ErrorKind::NotFound,
        fmt::format("Process '{}' was stopped during startup", name));
    return res;
  }
  if (auto info = registry_.info(name)) res.info = *info;
  res.running = true;
  res.initial_output = collect_output();
  return res;
}

StopResult ProcessManager::stop(const std::string& name){
  StopResult res;
  res.name = name;
  if (!registry_.transition(name, ProcState::Running, ProcState::Stopping)) {
    if (auto info = registry_.info(name)) {
      res.failure = make_failure(ErrorKind::InvalidArgument,
          fmt::format("Process '{}' is {}", name, to_string(info->state)));
    } else {
      res.failure = make_failure(ErrorKind::NotFound,
                                 fmt::format("No process found with name: {}", name));
    }
    return res;
  }

  auto info = registry_.info(name);
  if (info) res.pid = info->pid;
  spdlog::info("[proc={}] stopping pid={} (SIGTERM, timeout={}ms)", name, res.pid,
               opts_.stop_timeout.count());
  (void)registry_.signal(name, SIGTERM);

  std::optional<int> rc;
  const auto deadline = std::chrono::steady_clock::now() + opts_.stop_timeout;
  while (!(rc = registry_.poll(name)) && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(20ms);

  auto rec = registry_.take(name);
  if (!rec) {
    // swept by kill_all while we waited
    res.forced = true;
    return res;
  }
  if (!rc && rec->handle.valid()) {
    spdlog::warn("[proc={}] force kill pid={}", name, res.pid);
    rc = rec->handle.kill();
    res.forced = true;
  }
  res.exit_code = rc;
  res.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now() - rec->started_at);
  spdlog::info("[proc={}] stopped exit={} after {}ms{}", name, rc.value_or(-1),
               res.uptime.count(), res.forced ? " (forced)" : "");
  return res;
}

std::size_t ProcessManager::reap_exited(){
  auto gone = registry_.take_exited();
  for (const auto& rec : gone)
    spdlog::info("[proc={}] exited on its own code={}", rec.name,
                 rec.handle.exit_code().value_or(-1));
  return gone.size();
}

std::vector<ProcessInfo> ProcessManager::list(){
  reap_exited();
  return registry_.snapshot();
}

LookupResult ProcessManager::details(const std::string& name){
  LookupResult r;
  reap_exited();
  r.info = registry_.info(name);
  if (!r.info)
    r.failure = make_failure(ErrorKind::NotFound,
                             fmt::format("No process found with name: {}", name));
  return r;
}

bool ProcessManager::is_running(const std::string& name){
  reap_exited();
  auto info = registry_.info(name);
  return info && info->running;
}

std::vector<std::string> ProcessManager::kill_all(){
  std::vector<std::string> names;
  reap_exited();
  for (auto& rec : registry_.take_all()) {
    if (rec.handle.valid()) {
      int rc = rec.handle.kill();
      spdlog::info("[proc={}] killed pid={} exit={}", rec.name, rec.handle.pid(), rc);
    }
    names.push_back(rec.name);
  }
  return names;
}

HealthReport ProcessManager::health_check(){
  HealthReport h;
  h.exited = reap_exited();
  for (const auto& i : registry_.snapshot()) {
    ++h.total;
    if (i.running) ++h.running;
    else if (i.exit_code) ++h.exited;
    if (i.state == ProcState::Running && i.pid <= 0)
      h.problems.push_back(fmt::format("{}: running without a process handle", i.name));
  }
  h.healthy = h.problems.empty();
  return h;
}

} // namespace cmdgate
