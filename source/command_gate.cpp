#include <cmdgate/command_gate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace cmdgate {

std::vector<std::string> split_command(const std::string& s){
  std::vector<std::string> out;
  std::string cur; bool in_single=false, in_double=false, esc=false, have=false;
  for(char c: s){
    if (esc){ cur.push_back(c); esc=false; continue; }
    if (c=='\\' && !in_single){ esc=true; have=true; continue; }
    if (c=='\'' && !in_double){ in_single=!in_single; have=true; continue; }
    if (c=='"'  && !in_single){ in_double=!in_double; have=true; continue; }
    if (!in_single && !in_double && std::isspace(static_cast<unsigned char>(c))){
      if (have){ out.push_back(cur); cur.clear(); have=false; }
      continue;
    }
    cur.push_back(c); have=true;
  }
  if (in_single || in_double || esc) return {};
  if (have) out.push_back(cur);
  return out;
}

std::string leading_token(const std::string& command){
  auto argv = split_command(command);
  return argv.empty() ? std::string{} : argv.front();
}

static bool is_key_char(char c){
  return std::isalnum(static_cast<unsigned char>(c)) || c=='_' || c=='-' || c=='.';
}

static std::string substitute(const std::string& token, const ToolArgs& args,
                              std::vector<std::string>& missing){
  std::string out;
  size_t i = 0;
  while (i < token.size()) {
    auto open = token.find("{{", i);
    if (open == std::string::npos) { out.append(token, i, std::string::npos); break; }
    auto close = token.find("}}", open + 2);
    if (close == std::string::npos) { out.append(token, i, std::string::npos); break; }

    std::string key = token.substr(open + 2, close - open - 2);
    bool valid = !key.empty() && std::all_of(key.begin(), key.end(), is_key_char);
    out.append(token, i, open - i);
    if (!valid) {
      out.append(token, open, close + 2 - open);
    } else if (auto it = args.find(key); it != args.end()) {
      out += it->second;
    } else {
      if (std::find(missing.begin(), missing.end(), key) == missing.end())
        missing.push_back(key);
    }
    i = close + 2;
  }
  return out;
}

TemplateResult render_template(const std::string& tmpl, const ToolArgs& args){
  TemplateResult r;
  for (const auto& tok : split_command(tmpl))
    r.argv.push_back(substitute(tok, args, r.missing));
  return r;
}

static std::string join_allowed(const ProjectPolicy& p){
  return p.allowed_commands.empty() ? std::string("(none)")
                                    : fmt::format("{}", fmt::join(p.allowed_commands, ", "));
}

const ProjectPolicy& CommandGate::policy_locked(){
  if (!cache_) cache_ = store_.load();
  return *cache_;
}

bool CommandGate::is_allowed(const std::string& command){
  return resolve(command).ok();
}

GateDecision CommandGate::resolve(const std::string& command){
  GateDecision d;
  auto argv = split_command(command);
  if (argv.empty()) {
    bool blank = std::all_of(command.begin(), command.end(),
                             [](char c){ return std::isspace(static_cast<unsigned char>(c)); });
    d.failure = blank
        ? make_failure(ErrorKind::PolicyViolation, "Empty command is not allowed")
        : make_failure(ErrorKind::InvalidArgument,
                       fmt::format("Cannot parse command (unbalanced quotes): {}", command));
    return d;
  }

  std::lock_guard<std::mutex> lk(mu_);
  const auto& p = policy_locked();
  if (!p.allows(argv.front())) {
    spdlog::warn("[gate] rejected '{}': '{}' not allowed", command, argv.front());
    d.failure = make_failure(ErrorKind::PolicyViolation,
        fmt::format("Command '{}' not allowed. Add it to the allowed commands first. "
                    "Currently allowed: {}", argv.front(), join_allowed(p)));
    return d;
  }
  d.approved = ApprovedCommand{command, std::move(argv), {}};
  return d;
}

GateDecision CommandGate::resolve_tool(const std::string& name, const ToolArgs& args){
  GateDecision d;
  std::string tmpl;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto* tool = policy_locked().find_tool(name);
    if (!tool) {
      d.failure = make_failure(ErrorKind::ToolNotFound,
          fmt::format("Custom tool '{}' not found in project configuration", name));
      return d;
    }
    tmpl = tool->command;
  }

  auto r = render_template(tmpl, args);
  if (!r.missing.empty()) {
    d.failure = make_failure(ErrorKind::MissingPlaceholder,
        fmt::format("Custom tool '{}' is missing argument(s): {}", name,
                    fmt::join(r.missing, ", ")));
    return d;
  }
  if (r.argv.empty()) {
    d.failure = make_failure(ErrorKind::InvalidArgument,
        fmt::format("Custom tool '{}' has an unparsable command template", name));
    return d;
  }
  std::string display = fmt::format("{}", fmt::join(r.argv, " "));
  spdlog::info("[gate] custom tool '{}' -> {}", name, display);
  d.approved = ApprovedCommand{std::move(display), std::move(r.argv), name};
  return d;
}

PolicyChange CommandGate::persist_locked(ProjectPolicy next, std::string message){
  PolicyChange c;
  try {
    store_.save(next);
  } catch (const std::exception& e) {
    spdlog::error("[gate] policy save failed: {}", e.what());
    cache_.reset();
    c.failure = make_failure(ErrorKind::PolicyStoreFailure,
                             fmt::format("Failed to save policy: {}", e.what()));
    return c;
  }
  cache_ = std::move(next);
  c.changed = true;
  c.message = std::move(message);
  return c;
}

// a name that survives the policy file's list syntax and the tokenizer as-is
static bool plain_command_name(const std::string& s) {
  return !s.empty() && s.find_first_of(" \t\r\n\v\f,;'\"\\") == std::string::npos;
}

PolicyChange CommandGate::add_allowed_command(const std::string& command){
  PolicyChange c;
  if (!plain_command_name(command)) {
    c.failure = make_failure(ErrorKind::InvalidArgument,
        fmt::format("'{}' is not a single command name", command));
    return c;
  }
  std::lock_guard<std::mutex> lk(mu_);
  ProjectPolicy next = policy_locked();
  if (next.allows(command)) {
    c.message = fmt::format("Command '{}' is already allowed", command);
    return c;
  }
  next.allowed_commands.push_back(command);
  spdlog::info("[gate] allow '{}'", command);
  return persist_locked(std::move(next),
                        fmt::format("Command '{}' added to allowed list", command));
}

PolicyChange CommandGate::remove_allowed_command(const std::string& command){
  PolicyChange c;
  if (command.empty()) {
    c.failure = make_failure(ErrorKind::InvalidArgument, "Command name required");
    return c;
  }
  std::lock_guard<std::mutex> lk(mu_);
  ProjectPolicy next = policy_locked();
  auto it = std::find(next.allowed_commands.begin(), next.allowed_commands.end(), command);
  if (it == next.allowed_commands.end()) {
    c.message = fmt::format("Command '{}' is not in the allowed list", command);
    return c;
  }
  next.allowed_commands.erase(it);
  spdlog::info("[gate] disallow '{}'", command);
  return persist_locked(std::move(next),
                        fmt::format("Command '{}' removed from allowed list", command));
}

PolicyChange CommandGate::define_custom_tool(const std::string& name,
                                             const std::string& command_template,
                                             const std::string& description){
  PolicyChange c;
  if (name.empty() || command_template.empty()) {
    c.failure = make_failure(ErrorKind::InvalidArgument, "Tool name and command are required");
    return c;
  }
  auto head = leading_token(command_template);
  if (head.empty()) {
    c.failure = make_failure(ErrorKind::InvalidArgument,
        fmt::format("Cannot parse command template: {}", command_template));
    return c;
  }
  if (head.find("{{") != std::string::npos) {
    c.failure = make_failure(ErrorKind::PolicyViolation,
        "The executable of a custom tool cannot be a placeholder");
    return c;
  }

  std::lock_guard<std::mutex> lk(mu_);
  ProjectPolicy next = policy_locked();
  if (!next.allows(head)) {
    c.failure = make_failure(ErrorKind::PolicyViolation,
        fmt::format("Custom tool '{}' runs '{}', which is not allowed", name, head));
    return c;
  }
  bool replaced = false;
  for (auto& t : next.custom_tools) {
    if (t.name == name) { t.command = command_template; t.description = description; replaced = true; }
  }
  if (!replaced) next.custom_tools.push_back(CustomTool{name, command_template, description});
  spdlog::info("[gate] {} custom tool '{}'", replaced ? "redefined" : "defined", name);
  return persist_locked(std::move(next),
      fmt::format("Custom tool '{}' {}", name, replaced ? "updated" : "defined"));
}

ProjectPolicy CommandGate::snapshot(){
  std::lock_guard<std::mutex> lk(mu_);
  return policy_locked();
}

void CommandGate::invalidate(){
  std::lock_guard<std::mutex> lk(mu_);
  cache_.reset();
}

} // namespace cmdgate
