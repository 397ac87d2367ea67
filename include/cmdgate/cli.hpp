#pragma once
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cmdgate {

struct ExecFlags {
  std::string cwd;
  std::optional<long> timeout_ms;
  bool commit = false;
  std::string message;
};

struct CmdRun {
  std::string command;
  ExecFlags flags;
};
struct CmdSequence {
  std::vector<std::string> commands;
  bool keep_going = false;
  ExecFlags flags;
};
struct CmdAllowed {};
struct CmdAllow {
  std::string command;
};
struct CmdDisallow {
  std::string command;
};
struct CmdDefineTool {
  std::string name;
  std::string command;
  std::string description;
};
struct CmdTool {
  std::string name;
  std::map<std::string, std::string> args;
  ExecFlags flags;
};
struct CmdCheckpoint {
  std::string message;
  std::vector<std::string> files;
  bool skip_if_clean = false;
};
struct CmdServe {
  std::string name;
  std::string command;
  std::optional<int> port;
  std::string cwd;
};
struct CmdConsole {};

// console only
struct CmdStart {
  std::string name;
  std::string command;
  std::optional<int> port;
  std::string cwd;
};
struct CmdStop {
  std::string name;
};
struct CmdList {};
struct CmdDetails {
  std::string name;
};
struct CmdHealth {};
struct CmdKillAll {};
struct CmdSessionStart {
  std::string description;
  std::optional<std::string> branch;
};
struct CmdSessionEnd {};
struct CmdSession {};
struct CmdQuit {};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdRun, CmdSequence, CmdAllowed, CmdAllow, CmdDisallow,
                 CmdDefineTool, CmdTool, CmdCheckpoint, CmdServe, CmdConsole,
                 CmdStart, CmdStop, CmdList, CmdDetails, CmdHealth, CmdKillAll,
                 CmdSessionStart, CmdSessionEnd, CmdSession, CmdQuit, CmdHelp,
                 CmdVersion>;

struct GlobalFlags {
  std::optional<std::string> workspace;
  std::optional<std::string> policy_file;
};

struct ParseResult {
  std::optional<Command> cmd;
  GlobalFlags globals;
  std::string error;
};

// Commands that only make sense while a console keeps the service alive.
bool is_console_only(const Command &c);

ParseResult parse_cli(int argc, char **argv);

// Same grammar without the program name; used for console lines.
ParseResult parse_args(const std::vector<std::string> &args);

} // namespace cmdgate
