#pragma once
#include "process.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

enum class ProcState { Starting, Running, Stopping };

const char *to_string(ProcState s);

struct ProcessRecord {
  std::string name;
  std::string command;
  std::filesystem::path cwd;
  std::chrono::system_clock::time_point started_at;
  std::optional<int> port;
  ProcState state = ProcState::Starting;
  ChildProcess handle;
};

// Handle-free view of a record.
struct ProcessInfo {
  std::string name;
  std::string command;
  std::filesystem::path cwd;
  std::chrono::system_clock::time_point started_at;
  std::optional<int> port;
  int pid = -1;
  ProcState state = ProcState::Starting;
  bool running = false;
  std::optional<int> exit_code;
};

// Name -> record map. Every call is short and never blocks on a child.
class ProcessRegistry {
public:
  // false when the name already has a record (in any state)
  bool insert(ProcessRecord rec);

  // Gives a Starting record its child; false (and the child is returned
  // untouched in `child`) when the record vanished meanwhile.
  bool attach(const std::string &name, ChildProcess &child);

  bool transition(const std::string &name, ProcState from, ProcState to);
  bool signal(const std::string &name, int sig);
  std::optional<int> poll(const std::string &name);

  std::optional<ProcessRecord> take(const std::string &name);
  std::vector<ProcessRecord> take_all();

  // Removes Running records whose child already exited.
  std::vector<ProcessRecord> take_exited();

  std::optional<ProcessInfo> info(const std::string &name);
  std::vector<ProcessInfo> snapshot();

private:
  static ProcessInfo describe(ProcessRecord &r);

  mutable std::mutex mu_;
  std::map<std::string, ProcessRecord> procs_;
};

} // namespace cmdgate
