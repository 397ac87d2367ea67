#pragma once
#include "errors.hpp"
#include "policy.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

using ToolArgs = std::map<std::string, std::string>;

// Quote aware tokenizer: single quotes are literal, double quotes allow
// backslash escapes, unquoted whitespace separates tokens.
std::vector<std::string> split_command(const std::string &s);

// First token of split_command(command), "" for a blank command.
std::string leading_token(const std::string &command);

struct TemplateResult {
  std::vector<std::string> argv;
  std::vector<std::string> missing; // placeholder keys without a value
};

// Tokenizes the template, then replaces {{key}} inside each token.
TemplateResult render_template(const std::string &tmpl, const ToolArgs &args);

struct ApprovedCommand {
  std::string command;            // display form
  std::vector<std::string> argv;  // what gets executed
  std::string tool;               // custom tool name, empty otherwise
};

struct GateDecision {
  std::optional<ApprovedCommand> approved;
  std::optional<Failure> failure;

  bool ok() const { return approved.has_value(); }
};

struct PolicyChange {
  bool changed = false;
  std::string message;
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

class CommandGate {
public:
  explicit CommandGate(PolicyStore &store) : store_(store) {}

  bool is_allowed(const std::string &command);
  GateDecision resolve(const std::string &command);
  GateDecision resolve_tool(const std::string &name, const ToolArgs &args);

  PolicyChange add_allowed_command(const std::string &command);
  PolicyChange remove_allowed_command(const std::string &command);
  PolicyChange define_custom_tool(const std::string &name,
                                  const std::string &command_template,
                                  const std::string &description);

  ProjectPolicy snapshot();
  void invalidate();

private:
  const ProjectPolicy &policy_locked();
  PolicyChange persist_locked(ProjectPolicy next, std::string message);

  PolicyStore &store_;
  std::optional<ProjectPolicy> cache_;
  std::mutex mu_;
};

} // namespace cmdgate
