#include <cmdgate/sequencer.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace cmdgate {

std::size_t SequenceResult::executed() const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const CommandOutcome &o) { return o.result.has_value(); }));
}

static std::chrono::milliseconds effective_timeout(const SequenceOptions &opts,
                                                   const ProjectPolicy &p) {
  if (opts.timeout)
    return *opts.timeout;
  return std::chrono::milliseconds(p.command_timeout_ms);
}

static std::string first_line(const std::string &s) {
  auto nl = s.find('\n');
  return nl == std::string::npos ? s : s.substr(0, nl);
}

CommandOutcome CommandSequencer::execute(const ApprovedCommand &cmd, const std::string &cwd,
                                         std::chrono::milliseconds timeout) {
  CommandOutcome o;
  o.command = cmd.command;

  RunOptions ro;
  ro.argv = cmd.argv;
  ro.cwd = ws_.resolve(cwd);
  ro.timeout = timeout;

  ExecutionResult r;
  try {
    r = launcher_.run(ro);
  } catch (const SpawnError &e) {
    spdlog::warn("[exec] spawn failed for '{}': {}", cmd.command, e.what());
    o.failure = make_failure(ErrorKind::SpawnFailure,
                             fmt::format("Failed to run '{}': {}", cmd.command, e.what()));
    return o;
  }
  r.command = cmd.command;

  if (r.timed_out) {
    o.failure = make_failure(ErrorKind::Timeout,
        fmt::format("Command '{}' timed out after {}ms", cmd.command, timeout.count()));
  } else if (r.exit_code != 0) {
    auto detail = first_line(r.stderr_data.empty() ? r.stdout_data : r.stderr_data);
    o.failure = make_failure(ErrorKind::NonZeroExit,
        detail.empty()
            ? fmt::format("Command '{}' exited with code {}", cmd.command, r.exit_code)
            : fmt::format("Command '{}' exited with code {}: {}", cmd.command, r.exit_code,
                          detail));
  }
  spdlog::debug("[exec] '{}' rc={} {}ms", cmd.command, r.exit_code, r.duration_ms);
  o.result = std::move(r);
  return o;
}

void CommandSequencer::commit_if_requested(SequenceResult &res, const SequenceOptions &opts,
                                           const ProjectPolicy &policy,
                                           const std::string &fallback) {
  if (!opts.commit_result || !res.ok || !checkpointer_)
    return;
  if (!policy.git_auto_commit) {
    spdlog::debug("[git] auto-commit disabled by policy");
    return;
  }
  CheckpointOptions co;
  co.skip_if_no_changes = true;
  co.message_template = policy.auto_commit_message;
  co.track_session = policy.session_tracking;
  co.max_session_commits = static_cast<std::size_t>(std::max(0, policy.max_session_commits));
  res.checkpoint = checkpointer_->checkpoint(
      opts.commit_message.empty() ? fallback : opts.commit_message, co);
}

SequenceResult CommandSequencer::run_sequence(const std::vector<std::string> &commands,
                                              const SequenceOptions &opts) {
  SequenceResult res;
  const ProjectPolicy policy = gate_.snapshot();
  const auto timeout = effective_timeout(opts, policy);

  for (const auto &command : commands) {
    auto decision = gate_.resolve(command);
    CommandOutcome o;
    if (!decision.ok()) {
      o.command = command;
      o.failure = decision.failure;
    } else {
      o = execute(*decision.approved, opts.cwd, timeout);
    }

    bool failed = !o.ok();
    res.outcomes.push_back(std::move(o));
    if (failed) {
      res.ok = false;
      if (opts.stop_on_error) {
        spdlog::info("[exec] sequence stopped at command {} of {}", res.outcomes.size(),
                     commands.size());
        break;
      }
    }
  }

  std::string fallback =
      commands.size() == 1
          ? fmt::format("Executed command: {}", commands.front())
          : fmt::format("Executed command sequence ({} commands)", commands.size());
  commit_if_requested(res, opts, policy, fallback);
  return res;
}

SequenceResult CommandSequencer::run_command(const std::string &command,
                                             const SequenceOptions &opts) {
  return run_sequence({command}, opts);
}

SequenceResult CommandSequencer::run_custom_tool(const std::string &name, const ToolArgs &args,
                                                 const SequenceOptions &opts) {
  SequenceResult res;
  const ProjectPolicy policy = gate_.snapshot();
  auto decision = gate_.resolve_tool(name, args);
  if (!decision.ok()) {
    CommandOutcome o;
    o.command = name;
    o.failure = decision.failure;
    res.outcomes.push_back(std::move(o));
    res.ok = false;
    return res;
  }

  res.outcomes.push_back(execute(*decision.approved, opts.cwd, effective_timeout(opts, policy)));
  res.ok = res.outcomes.back().ok();
  commit_if_requested(res, opts, policy,
                      fmt::format("Executed custom tool: {}", name));
  return res;
}

} // namespace cmdgate
