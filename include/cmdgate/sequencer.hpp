#pragma once
#include "checkpoint.hpp"
#include "command_gate.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "workspace.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

struct SequenceOptions {
  std::string cwd;
  std::optional<std::chrono::milliseconds> timeout; // per command
  bool stop_on_error = true;
  bool commit_result = false;
  std::string commit_message;
};

struct CommandOutcome {
  std::string command;
  std::optional<ExecutionResult> result; // absent when rejected before spawn
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

struct SequenceResult {
  std::vector<CommandOutcome> outcomes;
  bool ok = true;
  std::optional<CheckpointResult> checkpoint;

  // Outcomes that actually ran a process.
  std::size_t executed() const;
};

class CommandSequencer {
public:
  // `checkpointer` may be null; commit_result is then ignored.
  CommandSequencer(CommandGate &gate, Launcher &launcher, const Workspace &ws,
                   ChangeCheckpointer *checkpointer = nullptr)
      : gate_(gate), launcher_(launcher), ws_(ws), checkpointer_(checkpointer) {}

  SequenceResult run_sequence(const std::vector<std::string> &commands,
                              const SequenceOptions &opts = {});

  // The one-element sequence.
  SequenceResult run_command(const std::string &command, const SequenceOptions &opts = {});

  // Invocation skips the allow-list; definition was gated.
  SequenceResult run_custom_tool(const std::string &name, const ToolArgs &args,
                                 const SequenceOptions &opts = {});

private:
  CommandOutcome execute(const ApprovedCommand &cmd, const std::string &cwd,
                         std::chrono::milliseconds timeout);
  void commit_if_requested(SequenceResult &res, const SequenceOptions &opts,
                           const ProjectPolicy &policy, const std::string &fallback);

  CommandGate &gate_;
  Launcher &launcher_;
  const Workspace &ws_;
  ChangeCheckpointer *checkpointer_;
};

} // namespace cmdgate
