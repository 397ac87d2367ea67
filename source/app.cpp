#include <cmdgate/app.hpp>
#include <cmdgate/cli.hpp>
#include <cmdgate/command_gate.hpp>
#include <cmdgate/config.hpp>
#include <cmdgate/service.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#ifndef CMDGATE_COMMIT
#define CMDGATE_COMMIT "unknown"
#endif
#ifndef CMDGATE_BRANCH
#define CMDGATE_BRANCH "unknown"
#endif
#ifndef CMDGATE_BUILD_TIME
#define CMDGATE_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace cmdgate {

static std::atomic<bool> g_stop{false};

static void on_signal(int sig) {
  if (sig == SIGINT || sig == SIGTERM)
    g_stop.store(true);
}

static void print_help(std::ostream &out) {
  out << R"(cmdgate - allow-listed command runner and dev server manager

Usage:
  cmdgate [--workspace DIR] [--policy FILE] <command>

  cmdgate run "<command>" [--cwd DIR] [--timeout-ms N] [--commit] [--message MSG]
  cmdgate sequence "<command>"... [--keep-going] [--cwd DIR] [--timeout-ms N] [--commit]
  cmdgate tool <name> [key=value ...] [--cwd DIR] [--timeout-ms N] [--commit]

  cmdgate allowed
  cmdgate allow|disallow <command>
  cmdgate define-tool <name> "<command template>" [--description TEXT]

  cmdgate checkpoint <message> [--file PATH ...] [--skip-if-clean]

  cmdgate serve <name> "<command>" [--port N] [--cwd DIR]
  cmdgate console

Console only:
  start <name> "<command>" [--port N] [--cwd DIR]
  stop <name> | details <name> | list | health | kill-all
  session-start <description> [--branch B] | session-end | session
  quit
)";
}

static std::string format_time(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

static void print_failure(std::ostream &out, const Failure &f) {
  out << fmt::format("error [{}]: {}\n", to_string(f.kind), f.message);
}

static void print_checkpoint(std::ostream &out, const CheckpointResult &c) {
  if (c.failure)
    print_failure(out, *c.failure);
  else if (c.skipped)
    out << "No changes to commit, checkpoint skipped\n";
  else
    out << fmt::format("Committed {}: {}\n", c.commit_id.substr(0, 12), c.message);
}

static int print_sequence(std::ostream &out, const SequenceResult &r) {
  const bool many = r.outcomes.size() > 1;
  for (std::size_t i = 0; i < r.outcomes.size(); i++) {
    const auto &o = r.outcomes[i];
    if (many)
      out << fmt::format("[{}] $ {}\n", i + 1, o.command);
    if (o.result) {
      out << o.result->stdout_data;
      if (!o.result->stderr_data.empty())
        out << o.result->stderr_data;
      if (o.result->output_truncated)
        out << "(output truncated)\n";
    }
    if (o.failure)
      print_failure(out, *o.failure);
  }
  if (many)
    out << fmt::format("{} of {} command(s) ran, sequence {}\n", r.executed(),
                       r.outcomes.size(), r.ok ? "succeeded" : "failed");
  if (r.checkpoint)
    print_checkpoint(out, *r.checkpoint);
  return r.ok ? 0 : 1;
}

static void print_info(std::ostream &out, const ProcessInfo &i) {
  out << fmt::format("{:<16} pid={:<7} {:<8} port={:<5} since {}  {}  ({})\n", i.name, i.pid,
                     to_string(i.state), i.port ? std::to_string(*i.port) : "-",
                     format_time(i.started_at), i.command, i.cwd.string());
}

static void print_session(std::ostream &out, const Session &s) {
  out << fmt::format("{} \"{}\"{} started {} commits={}\n", s.id, s.description,
                     s.branch ? " on " + *s.branch : std::string{},
                     format_time(s.started_at), s.commit_hashes.size());
  for (const auto &h : s.commit_hashes)
    out << "  " << h << "\n";
}

static int print_change(std::ostream &out, const PolicyChange &c) {
  if (c.failure) {
    print_failure(out, *c.failure);
    return 1;
  }
  out << c.message << "\n";
  return 0;
}

static CommandRequest to_request(const ExecFlags &f, bool stop_on_error = true) {
  CommandRequest req;
  req.cwd = f.cwd;
  if (f.timeout_ms)
    req.timeout = std::chrono::milliseconds(*f.timeout_ms);
  req.stop_on_error = stop_on_error;
  req.commit_result = f.commit;
  req.commit_message = f.message;
  return req;
}

static int start_and_report(std::ostream &out, Service &svc, const ServerRequest &req) {
  auto r = svc.start_server(req);
  if (!r.initial_output.empty())
    out << r.initial_output << (r.initial_output.back() == '\n' ? "" : "\n");
  if (r.failure) {
    print_failure(out, *r.failure);
    return 1;
  }
  if (!r.running) {
    out << fmt::format("Server '{}' finished during startup with code {}\n", req.name,
                       r.exit_code.value_or(0));
    return 0;
  }
  out << fmt::format("Server '{}' started (pid {}){}\n", req.name, r.info.pid,
                     req.port ? fmt::format(" on port {}", *req.port) : std::string{});
  return 0;
}

static void install_signal_handlers() {
  g_stop.store(false);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
}

// Waits for a line on `in`; nothing when stdin closes or a signal arrives.
static std::optional<std::string> read_line(std::istream &in) {
  const bool is_stdin = &in == &std::cin;
  while (!g_stop.load()) {
    if (is_stdin && std::cin.rdbuf()->in_avail() <= 0) {
      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      int rc = ::poll(&pfd, 1, 200);
      if (rc == 0 || (rc < 0 && errno == EINTR))
        continue;
    }
    std::string line;
    if (!std::getline(in, line))
      return std::nullopt;
    return line;
  }
  return std::nullopt;
}

App::App() : App(std::cin, std::cout) {}

App::App(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help(out_);
    return pr.error.empty() ? 0 : 2;
  }
  if (std::holds_alternative<CmdHelp>(*pr.cmd)) {
    print_help(out_);
    return 0;
  }
  if (std::holds_alternative<CmdVersion>(*pr.cmd)) {
    out_ << fmt::format("cmdgate {} ({}, built {})\n", CMDGATE_COMMIT, CMDGATE_BRANCH,
                        CMDGATE_BUILD_TIME);
    return 0;
  }
  if (is_console_only(*pr.cmd)) {
    spdlog::error("this command is only available inside `cmdgate console`");
    return 2;
  }

  Config cfg = Config::FromEnv();
  if (pr.globals.workspace)
    cfg.workspace = fs::absolute(*pr.globals.workspace);
  if (pr.globals.policy_file)
    cfg.policy_file = *pr.globals.policy_file;
  apply_log_level(cfg.log_level);

  std::error_code ec;
  if (!fs::is_directory(cfg.workspace, ec)) {
    spdlog::error("workspace is not a directory: {}", cfg.workspace.string());
    return 2;
  }

  Service svc(cfg);
  bool quit = false;

  std::function<int(const Command &)> dispatch = [&](const Command &command) -> int {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help(out_);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            out_ << fmt::format("cmdgate {}\n", CMDGATE_COMMIT);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdRun>) {
            return print_sequence(out_, svc.run_command(c.command, to_request(c.flags)));

          } else if constexpr (std::is_same_v<T, CmdSequence>) {
            return print_sequence(
                out_, svc.run_command_sequence(c.commands, to_request(c.flags, !c.keep_going)));

          } else if constexpr (std::is_same_v<T, CmdTool>) {
            return print_sequence(out_, svc.run_custom_tool(c.name, c.args, to_request(c.flags)));

          } else if constexpr (std::is_same_v<T, CmdAllowed>) {
            auto p = svc.get_allowed_commands();
            out_ << fmt::format("Allowed commands: {}\n", fmt::join(p.allowed_commands, ", "));
            if (!p.custom_tools.empty()) {
              out_ << "Custom tools:\n";
              for (const auto &t : p.custom_tools)
                out_ << fmt::format("  {:<16} {}{}\n", t.name, t.command,
                                    t.description.empty() ? "" : "  # " + t.description);
            }
            out_ << fmt::format("Auto-commit: {}  Session tracking: {}  Timeout: {}ms\n",
                                p.git_auto_commit ? "on" : "off",
                                p.session_tracking ? "on" : "off", p.command_timeout_ms);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdAllow>) {
            return print_change(out_, svc.add_allowed_command(c.command));

          } else if constexpr (std::is_same_v<T, CmdDisallow>) {
            return print_change(out_, svc.remove_allowed_command(c.command));

          } else if constexpr (std::is_same_v<T, CmdDefineTool>) {
            return print_change(out_, svc.define_custom_tool(c.name, c.command, c.description));

          } else if constexpr (std::is_same_v<T, CmdCheckpoint>) {
            auto r = svc.checkpoint(c.message, c.files, c.skip_if_clean);
            print_checkpoint(out_, r);
            return r.ok() ? 0 : 1;

          } else if constexpr (std::is_same_v<T, CmdServe>) {
            install_signal_handlers();
            int rc = start_and_report(out_, svc, ServerRequest{c.command, c.name, c.port, c.cwd});
            if (rc != 0 || !svc.process_details(c.name).ok())
              return rc;
            spdlog::info("[serve] '{}' running, Ctrl-C to stop", c.name);
            while (!g_stop.load()) {
              std::this_thread::sleep_for(200ms);
              auto procs = svc.list_processes();
              if (procs.empty()) {
                out_ << fmt::format("Server '{}' exited\n", c.name);
                return 1;
              }
            }
            auto s = svc.stop_server(c.name);
            if (s.failure) {
              print_failure(out_, *s.failure);
              return 1;
            }
            out_ << fmt::format("Server '{}' stopped after {}s{}\n", c.name,
                                s.uptime.count() / 1000, s.forced ? " (killed)" : "");
            return 0;

          } else if constexpr (std::is_same_v<T, CmdConsole>) {
            install_signal_handlers();
            int last = 0;
            while (!quit) {
              out_ << "cmdgate> " << std::flush;
              auto line = read_line(in_);
              if (!line)
                break;
              auto argv = split_command(*line);
              if (argv.empty())
                continue;
              auto sub = parse_args(argv);
              if (!sub.cmd) {
                out_ << sub.error << "\n";
                last = 2;
                continue;
              }
              if (std::holds_alternative<CmdConsole>(*sub.cmd) ||
                  std::holds_alternative<CmdServe>(*sub.cmd)) {
                out_ << "already in a console\n";
                continue;
              }
              last = dispatch(*sub.cmd);
            }
            auto killed = svc.kill_all();
            if (!killed.empty())
              out_ << fmt::format("Killed: {}\n", fmt::join(killed, ", "));
            return last;

          } else if constexpr (std::is_same_v<T, CmdStart>) {
            return start_and_report(out_, svc, ServerRequest{c.command, c.name, c.port, c.cwd});

          } else if constexpr (std::is_same_v<T, CmdStop>) {
            auto s = svc.stop_server(c.name);
            if (s.failure) {
              print_failure(out_, *s.failure);
              return 1;
            }
            out_ << fmt::format("Server '{}' (pid {}) stopped after {}ms{}\n", c.name, s.pid,
                                s.uptime.count(), s.forced ? " (killed)" : "");
            return 0;

          } else if constexpr (std::is_same_v<T, CmdList>) {
            auto procs = svc.list_processes();
            if (procs.empty())
              out_ << "No processes running\n";
            for (const auto &i : procs)
              print_info(out_, i);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdDetails>) {
            auto d = svc.process_details(c.name);
            if (d.failure) {
              print_failure(out_, *d.failure);
              return 1;
            }
            print_info(out_, *d.info);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdHealth>) {
            auto h = svc.health_check();
            out_ << fmt::format("Service status: {}\nProcesses: {} tracked, {} running\n",
                                h.status(), h.total, h.running);
            for (const auto &p : h.problems)
              out_ << "  " << p << "\n";
            return h.healthy ? 0 : 1;

          } else if constexpr (std::is_same_v<T, CmdKillAll>) {
            auto killed = svc.kill_all();
            out_ << (killed.empty() ? std::string("No processes to kill")
                                    : fmt::format("Killed: {}", fmt::join(killed, ", ")))
                 << "\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSessionStart>) {
            auto s = svc.start_session(c.description, c.branch);
            out_ << fmt::format("Session started: {}\n", s.id);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSessionEnd>) {
            auto s = svc.end_session();
            if (!s)
              out_ << "No active session\n";
            else
              out_ << fmt::format("Session {} ended with {} commit(s)\n", s->id,
                                  s->commit_hashes.size());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSession>) {
            auto s = svc.get_current_session();
            if (!s)
              out_ << "No active session\n";
            else
              print_session(out_, *s);
            return 0;

          } else {
            static_assert(std::is_same_v<T, CmdQuit>);
            quit = true;
            return 0;
          }
        },
        command);
  };

  return dispatch(*pr.cmd);
}

} // namespace cmdgate
