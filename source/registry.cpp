#include <cmdgate/registry.hpp>

namespace cmdgate {

const char *to_string(ProcState s) {
  switch (s) {
  case ProcState::Starting: return "starting";
  case ProcState::Running:  return "running";
  case ProcState::Stopping: return "stopping";
  }
  return "unknown";
}

bool ProcessRegistry::insert(ProcessRecord rec) {
  std::lock_guard<std::mutex> lk(mu_);
  auto name = rec.name;
  return procs_.emplace(std::move(name), std::move(rec)).second;
}

bool ProcessRegistry::attach(const std::string &name, ChildProcess &child) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  if (it == procs_.end() || it->second.handle.valid())
    return false;
  it->second.handle = std::move(child);
  return true;
}

bool ProcessRegistry::transition(const std::string &name, ProcState from, ProcState to) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  if (it == procs_.end() || it->second.state != from)
    return false;
  it->second.state = to;
  return true;
}

bool ProcessRegistry::signal(const std::string &name, int sig) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  return it != procs_.end() && it->second.handle.signal(sig);
}

std::optional<int> ProcessRegistry::poll(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  if (it == procs_.end())
    return std::nullopt;
  return it->second.handle.poll();
}

std::optional<ProcessRecord> ProcessRegistry::take(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  if (it == procs_.end())
    return std::nullopt;
  ProcessRecord r = std::move(it->second);
  procs_.erase(it);
  return r;
}

std::vector<ProcessRecord> ProcessRegistry::take_all() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ProcessRecord> out;
  out.reserve(procs_.size());
  for (auto &[name, rec] : procs_)
    out.push_back(std::move(rec));
  procs_.clear();
  return out;
}

std::vector<ProcessRecord> ProcessRegistry::take_exited() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ProcessRecord> out;
  for (auto it = procs_.begin(); it != procs_.end();) {
    auto &r = it->second;
    if (r.state == ProcState::Running && r.handle.valid() && r.handle.poll()) {
      out.push_back(std::move(r));
      it = procs_.erase(it);
    } else {
      ++it;
    }
  }
  return out;
}

ProcessInfo ProcessRegistry::describe(ProcessRecord &r) {
  ProcessInfo i;
  i.name = r.name;
  i.command = r.command;
  i.cwd = r.cwd;
  i.started_at = r.started_at;
  i.port = r.port;
  i.pid = r.handle.pid();
  i.state = r.state;
  i.exit_code = r.handle.valid() ? r.handle.poll() : std::nullopt;
  i.running = r.handle.valid() && !i.exit_code;
  return i;
}

std::optional<ProcessInfo> ProcessRegistry::info(const std::string &name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = procs_.find(name);
  if (it == procs_.end())
    return std::nullopt;
  return describe(it->second);
}

std::vector<ProcessInfo> ProcessRegistry::snapshot() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ProcessInfo> out;
  out.reserve(procs_.size());
  for (auto &[name, rec] : procs_)
    out.push_back(describe(rec));
  return out;
}

} // namespace cmdgate
