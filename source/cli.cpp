#include <cmdgate/cli.hpp>

#include <cstdlib>
#include <string_view>

namespace cmdgate {

static bool has_arg(std::size_t i, std::size_t n) { return i + 1 < n; }

static std::optional<long> to_long(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  char *end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (*end != '\0' || v < 0)
    return std::nullopt;
  return v;
}

// Consumes --cwd/--timeout-ms/--commit/--message at args[i]; false if args[i]
// is not one of them. Sets `err` on a malformed value.
static bool take_exec_flag(const std::vector<std::string> &args, std::size_t &i,
                           ExecFlags &f, std::string &err) {
  std::string_view a = args[i];
  if (a == "--cwd" && has_arg(i, args.size())) {
    f.cwd = args[++i];
  } else if (a == "--timeout-ms" && has_arg(i, args.size())) {
    f.timeout_ms = to_long(args[++i]);
    if (!f.timeout_ms)
      err = "--timeout-ms expects a non-negative number";
  } else if (a == "--commit") {
    f.commit = true;
  } else if (a == "--message" && has_arg(i, args.size())) {
    f.message = args[++i];
    f.commit = true;
  } else {
    return false;
  }
  return true;
}

static bool take_port(const std::vector<std::string> &args, std::size_t &i,
                      std::optional<int> &port, std::string &err) {
  if (args[i] != "--port" || !has_arg(i, args.size()))
    return false;
  auto v = to_long(args[++i]);
  if (!v || *v == 0 || *v > 65535)
    err = "--port expects a number in 1..65535";
  else
    port = static_cast<int>(*v);
  return true;
}

template <typename Srv>
static ParseResult parse_server(const std::string &cmd, const std::vector<std::string> &args) {
  ParseResult r{};
  Srv c{};
  std::vector<std::string> pos;
  for (std::size_t i = 1; i < args.size(); i++) {
    if (take_port(args, i, c.port, r.error)) {
      if (!r.error.empty())
        return r;
    } else if (args[i] == "--cwd" && has_arg(i, args.size())) {
      c.cwd = args[++i];
    } else {
      pos.push_back(args[i]);
    }
  }
  if (pos.size() != 2) {
    r.error = cmd + ": <name> <command> required";
    return r;
  }
  c.name = pos[0];
  c.command = pos[1];
  r.cmd = c;
  return r;
}

static ParseResult single_arg(const std::string &cmd, const std::vector<std::string> &args,
                              const char *what, std::string &out) {
  ParseResult r{};
  if (args.size() != 2) {
    r.error = cmd + ": " + what + " required";
    return r;
  }
  out = args[1];
  return r;
}

ParseResult parse_args(const std::vector<std::string> &args) {
  ParseResult r{};
  if (args.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string &cmd = args[0];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "run") {
    CmdRun c{};
    std::vector<std::string> pos;
    for (std::size_t i = 1; i < args.size(); i++) {
      if (take_exec_flag(args, i, c.flags, r.error)) {
        if (!r.error.empty())
          return r;
      } else {
        pos.push_back(args[i]);
      }
    }
    if (pos.size() != 1) {
      r.error = "run: exactly one <command> required (quote it)";
      return r;
    }
    c.command = pos[0];
    r.cmd = c;
    return r;
  }

  if (cmd == "sequence") {
    CmdSequence c{};
    for (std::size_t i = 1; i < args.size(); i++) {
      if (args[i] == "--keep-going") {
        c.keep_going = true;
      } else if (take_exec_flag(args, i, c.flags, r.error)) {
        if (!r.error.empty())
          return r;
      } else {
        c.commands.push_back(args[i]);
      }
    }
    if (c.commands.empty()) {
      r.error = "sequence: at least one <command> required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "allowed") {
    r.cmd = CmdAllowed{};
    return r;
  }
  if (cmd == "allow") {
    CmdAllow c{};
    r = single_arg(cmd, args, "<command>", c.command);
    if (r.error.empty())
      r.cmd = c;
    return r;
  }
  if (cmd == "disallow") {
    CmdDisallow c{};
    r = single_arg(cmd, args, "<command>", c.command);
    if (r.error.empty())
      r.cmd = c;
    return r;
  }

  if (cmd == "define-tool") {
    CmdDefineTool c{};
    std::vector<std::string> pos;
    for (std::size_t i = 1; i < args.size(); i++) {
      if (args[i] == "--description" && has_arg(i, args.size()))
        c.description = args[++i];
      else
        pos.push_back(args[i]);
    }
    if (pos.size() != 2) {
      r.error = "define-tool: <name> <command-template> required";
      return r;
    }
    c.name = pos[0];
    c.command = pos[1];
    r.cmd = c;
    return r;
  }

  if (cmd == "tool") {
    CmdTool c{};
    for (std::size_t i = 1; i < args.size(); i++) {
      if (take_exec_flag(args, i, c.flags, r.error)) {
        if (!r.error.empty())
          return r;
        continue;
      }
      if (c.name.empty()) {
        c.name = args[i];
        continue;
      }
      auto eq = args[i].find('=');
      if (eq == std::string::npos || eq == 0) {
        r.error = "tool: arguments must look like key=value";
        return r;
      }
      c.args[args[i].substr(0, eq)] = args[i].substr(eq + 1);
    }
    if (c.name.empty()) {
      r.error = "tool: <name> required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "checkpoint") {
    CmdCheckpoint c{};
    for (std::size_t i = 1; i < args.size(); i++) {
      std::string_view a = args[i];
      if (a == "--file" && has_arg(i, args.size()))
        c.files.push_back(args[++i]);
      else if (a == "--skip-if-clean")
        c.skip_if_clean = true;
      else if (c.message.empty())
        c.message = args[i];
      else {
        r.error = "checkpoint: unexpected argument " + args[i];
        return r;
      }
    }
    if (c.message.empty()) {
      r.error = "checkpoint: <message> required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "serve")
    return parse_server<CmdServe>(cmd, args);
  if (cmd == "start")
    return parse_server<CmdStart>(cmd, args);

  if (cmd == "console") {
    r.cmd = CmdConsole{};
    return r;
  }
  if (cmd == "stop") {
    CmdStop c{};
    r = single_arg(cmd, args, "<name>", c.name);
    if (r.error.empty())
      r.cmd = c;
    return r;
  }
  if (cmd == "details") {
    CmdDetails c{};
    r = single_arg(cmd, args, "<name>", c.name);
    if (r.error.empty())
      r.cmd = c;
    return r;
  }
  if (cmd == "list") {
    r.cmd = CmdList{};
    return r;
  }
  if (cmd == "health") {
    r.cmd = CmdHealth{};
    return r;
  }
  if (cmd == "kill-all") {
    r.cmd = CmdKillAll{};
    return r;
  }
  if (cmd == "session-start") {
    CmdSessionStart c{};
    for (std::size_t i = 1; i < args.size(); i++) {
      if (args[i] == "--branch" && has_arg(i, args.size()))
        c.branch = args[++i];
      else if (c.description.empty())
        c.description = args[i];
      else
        c.description += " " + args[i];
    }
    if (c.description.empty()) {
      r.error = "session-start: <description> required";
      return r;
    }
    r.cmd = c;
    return r;
  }
  if (cmd == "session-end") {
    r.cmd = CmdSessionEnd{};
    return r;
  }
  if (cmd == "session") {
    r.cmd = CmdSession{};
    return r;
  }
  if (cmd == "quit" || cmd == "exit") {
    r.cmd = CmdQuit{};
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  GlobalFlags g;
  std::vector<std::string> rest;
  int i = 1;
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--workspace" && i + 1 < argc)
      g.workspace = argv[++i];
    else if (a == "--policy" && i + 1 < argc)
      g.policy_file = argv[++i];
    else
      break;
  }
  for (; i < argc; i++)
    rest.emplace_back(argv[i]);

  ParseResult r = parse_args(rest);
  r.globals = g;
  return r;
}

bool is_console_only(const Command &c) {
  return std::holds_alternative<CmdStart>(c) || std::holds_alternative<CmdStop>(c) ||
         std::holds_alternative<CmdList>(c) || std::holds_alternative<CmdDetails>(c) ||
         std::holds_alternative<CmdHealth>(c) || std::holds_alternative<CmdKillAll>(c) ||
         std::holds_alternative<CmdSessionStart>(c) ||
         std::holds_alternative<CmdSessionEnd>(c) || std::holds_alternative<CmdSession>(c) ||
         std::holds_alternative<CmdQuit>(c);
}

} // namespace cmdgate
