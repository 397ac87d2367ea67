#include <cmdgate/service.hpp>
#include <cmdgate/timeout.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace cmdgate {

static ManagerOptions manager_options(const Config &cfg) {
  ManagerOptions mo;
  mo.startup_delay = cfg.startup_delay;
  mo.stop_timeout = cfg.stop_timeout;
  mo.logs_dir = cfg.logs_dir;
  mo.log_max_bytes = cfg.log_max_mb * 1024 * 1024;
  mo.log_backups = cfg.log_backups;
  return mo;
}

Service::Service(Config cfg, ServiceDeps deps) : cfg_(std::move(cfg)) {
  if (cfg_.workspace.empty())
    throw std::invalid_argument("workspace directory is required");

  workspace_ = std::make_shared<Workspace>(cfg_.workspace);
  launcher_ = deps.launcher ? std::move(deps.launcher) : std::make_shared<PosixLauncher>();
  store_ = deps.policy_store
               ? std::move(deps.policy_store)
               : std::make_shared<FilePolicyStore>(cfg_.effective_policy_file());
  vcs_ = deps.vcs ? std::move(deps.vcs)
                  : std::make_shared<GitVersionControl>(*launcher_, workspace_->root());

  gate_ = std::make_shared<CommandGate>(*store_);
  sessions_ = std::make_shared<SessionTracker>();
  checkpointer_ = std::make_shared<ChangeCheckpointer>(*vcs_, *sessions_);
  sequencer_ = std::make_shared<CommandSequencer>(*gate_, *launcher_, *workspace_,
                                                  checkpointer_.get());
  manager_ = std::make_shared<ProcessManager>(*launcher_, *workspace_, manager_options(cfg_));

  spdlog::debug("[service] workspace={} policy={}", workspace_->root().string(),
                cfg_.effective_policy_file().string());
}

Service::~Service() {
  // the manager may outlive us inside a timed-out start; empty it now
  auto killed = manager_->kill_all();
  if (!killed.empty())
    spdlog::info("[service] shutdown killed {} process(es)", killed.size());
}

StartResult Service::start_server(const ServerRequest &req) {
  StartResult res;
  if (req.name.empty() || req.command.empty()) {
    res.failure = make_failure(ErrorKind::InvalidArgument,
                               "Both a server name and a command are required");
    return res;
  }
  if (req.port && (*req.port <= 0 || *req.port > 65535)) {
    res.failure = make_failure(ErrorKind::InvalidArgument,
                               fmt::format("Invalid port {}", *req.port));
    return res;
  }

  auto decision = gate_->resolve(req.command);
  if (!decision.ok()) {
    res.failure = decision.failure;
    return res;
  }

  // the worker shares ownership of everything the manager refers to
  auto work = [manager = manager_, launcher = launcher_, ws = workspace_, req,
               argv = decision.approved->argv] {
    return manager->start(req.name, argv, req.cwd, req.port);
  };
  if (cfg_.process_timeout.count() <= 0)
    return work();

  try {
    return run_with_timeout(std::move(work), cfg_.process_timeout);
  } catch (const TimeoutError &e) {
    spdlog::warn("[proc={}] start did not finish: {}", req.name, e.what());
    res.failure = make_failure(ErrorKind::Timeout,
        fmt::format("Starting server '{}' timed out after {}ms", req.name,
                    e.after().count()));
    return res;
  }
}

StopResult Service::stop_server(const std::string &name) { return manager_->stop(name); }

std::vector<ProcessInfo> Service::list_processes() { return manager_->list(); }

LookupResult Service::process_details(const std::string &name) {
  return manager_->details(name);
}

HealthReport Service::health_check() { return manager_->health_check(); }

std::vector<std::string> Service::kill_all() { return manager_->kill_all(); }

SequenceOptions Service::sequence_options(const CommandRequest &req) const {
  SequenceOptions so;
  so.cwd = req.cwd;
  so.timeout = req.timeout;
  so.stop_on_error = req.stop_on_error;
  so.commit_result = req.commit_result;
  so.commit_message = req.commit_message;
  return so;
}

SequenceResult Service::run_command(const std::string &command, const CommandRequest &req) {
  return sequencer_->run_command(command, sequence_options(req));
}

SequenceResult Service::run_command_sequence(const std::vector<std::string> &commands,
                                             const CommandRequest &req) {
  if (commands.empty()) {
    SequenceResult res;
    res.ok = false;
    CommandOutcome o;
    o.failure = make_failure(ErrorKind::InvalidArgument, "Command sequence is empty");
    res.outcomes.push_back(std::move(o));
    return res;
  }
  return sequencer_->run_sequence(commands, sequence_options(req));
}

SequenceResult Service::run_custom_tool(const std::string &name, const ToolArgs &args,
                                        const CommandRequest &req) {
  return sequencer_->run_custom_tool(name, args, sequence_options(req));
}

ProjectPolicy Service::get_allowed_commands() { return gate_->snapshot(); }

PolicyChange Service::add_allowed_command(const std::string &command) {
  return gate_->add_allowed_command(command);
}

PolicyChange Service::remove_allowed_command(const std::string &command) {
  return gate_->remove_allowed_command(command);
}

PolicyChange Service::define_custom_tool(const std::string &name,
                                         const std::string &command_template,
                                         const std::string &description) {
  return gate_->define_custom_tool(name, command_template, description);
}

CheckpointResult Service::checkpoint(const std::string &message,
                                     const std::vector<std::string> &files,
                                     bool skip_if_no_changes) {
  const auto policy = gate_->snapshot();
  CheckpointOptions co;
  co.files = files;
  co.skip_if_no_changes = skip_if_no_changes;
  co.message_template = policy.auto_commit_message;
  co.track_session = policy.session_tracking;
  co.max_session_commits = static_cast<std::size_t>(std::max(0, policy.max_session_commits));
  return checkpointer_->checkpoint(message, co);
}

Session Service::start_session(const std::string &description,
                               std::optional<std::string> branch) {
  return sessions_->start(description, std::move(branch));
}

std::optional<Session> Service::end_session() { return sessions_->end(); }

std::optional<Session> Service::get_current_session() { return sessions_->current(); }

} // namespace cmdgate
