#pragma once
#include "checkpoint.hpp"
#include "command_gate.hpp"
#include "config.hpp"
#include "policy.hpp"
#include "process.hpp"
#include "process_manager.hpp"
#include "sequencer.hpp"
#include "session.hpp"
#include "vcs.hpp"
#include "workspace.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

// Collaborators a host (or a test) may substitute; null members get the
// production implementation.
struct ServiceDeps {
  std::shared_ptr<Launcher> launcher;
  std::shared_ptr<PolicyStore> policy_store;
  std::shared_ptr<VersionControl> vcs;
};

struct ServerRequest {
  std::string command;
  std::string name;
  std::optional<int> port;
  std::string cwd;
};

struct CommandRequest {
  std::string cwd;
  std::optional<std::chrono::milliseconds> timeout;
  bool stop_on_error = true;
  bool commit_result = false;
  std::string commit_message;
};

// Every operation the tool-dispatch layer can call. Results carry a
// Failure instead of throwing.
class Service {
public:
  explicit Service(Config cfg, ServiceDeps deps = {});
  ~Service();

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  // processes
  StartResult start_server(const ServerRequest &req);
  StopResult stop_server(const std::string &name);
  std::vector<ProcessInfo> list_processes();
  LookupResult process_details(const std::string &name);
  HealthReport health_check();
  std::vector<std::string> kill_all();

  // commands
  SequenceResult run_command(const std::string &command, const CommandRequest &req = {});
  SequenceResult run_command_sequence(const std::vector<std::string> &commands,
                                      const CommandRequest &req = {});
  SequenceResult run_custom_tool(const std::string &name, const ToolArgs &args,
                                 const CommandRequest &req = {});

  // policy
  ProjectPolicy get_allowed_commands();
  PolicyChange add_allowed_command(const std::string &command);
  PolicyChange remove_allowed_command(const std::string &command);
  PolicyChange define_custom_tool(const std::string &name, const std::string &command_template,
                                  const std::string &description);

  // git + sessions
  CheckpointResult checkpoint(const std::string &message,
                              const std::vector<std::string> &files = {},
                              bool skip_if_no_changes = false);
  Session start_session(const std::string &description,
                        std::optional<std::string> branch = std::nullopt);
  std::optional<Session> end_session();
  std::optional<Session> get_current_session();

  const Config &config() const { return cfg_; }

private:
  SequenceOptions sequence_options(const CommandRequest &req) const;

  Config cfg_;
  std::shared_ptr<Workspace> workspace_;
  std::shared_ptr<Launcher> launcher_;
  std::shared_ptr<PolicyStore> store_;
  std::shared_ptr<VersionControl> vcs_;
  std::shared_ptr<CommandGate> gate_;
  std::shared_ptr<SessionTracker> sessions_;
  std::shared_ptr<ChangeCheckpointer> checkpointer_;
  std::shared_ptr<CommandSequencer> sequencer_;
  std::shared_ptr<ProcessManager> manager_;
};

} // namespace cmdgate
