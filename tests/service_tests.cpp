#include <catch2/catch_all.hpp>
#include <cmdgate/service.hpp>

#include <signal.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

using namespace cmdgate;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("cmdgate_svc_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

class SpyLauncher : public Launcher {
public:
  ChildProcess spawn(const SpawnOptions &o) override {
    ++spawns;
    return real.spawn(o);
  }
  ExecutionResult run(const RunOptions &o) override {
    if (!o.argv.empty() && o.argv[0] != "git")
      ++runs;
    return real.run(o);
  }

  PosixLauncher real;
  int spawns = 0;
  int runs = 0;
};

struct Fixture {
  explicit Fixture(const char *name) : dir(mkd(name)) {
    cfg.workspace = dir;
    cfg.logs_dir = dir / "logs";
    cfg.startup_delay = 50ms;
    cfg.stop_timeout = 500ms;
    cfg.process_timeout = 5000ms;

    ProjectPolicy p;
    p.allowed_commands = {"echo", "false", "sleep", "sh"};
    store = std::make_shared<MemoryPolicyStore>(p);
    launcher = std::make_shared<SpyLauncher>();
  }

  std::unique_ptr<Service> make() {
    ServiceDeps deps;
    deps.launcher = launcher;
    deps.policy_store = store;
    return std::make_unique<Service>(cfg, deps);
  }

  fs::path dir;
  Config cfg;
  std::shared_ptr<MemoryPolicyStore> store;
  std::shared_ptr<SpyLauncher> launcher;
};

TEST_CASE("disallowed commands spawn nothing") {
  Fixture fx("reject");
  auto svc = fx.make();

  auto run = svc->run_command("rm -rf /");
  REQUIRE(run.outcomes[0].failure->kind == ErrorKind::PolicyViolation);

  auto srv = svc->start_server(ServerRequest{"python3 -m http.server", "web", 8000, ""});
  REQUIRE(srv.failure->kind == ErrorKind::PolicyViolation);

  auto seq = svc->run_command_sequence({"echo ok", "curl x"});
  REQUIRE_FALSE(seq.ok);

  REQUIRE(fx.launcher->spawns == 0);
  REQUIRE(fx.launcher->runs == 1);
  REQUIRE(svc->list_processes().empty());
}

TEST_CASE("server lifecycle through the facade") {
  Fixture fx("servers");
  auto svc = fx.make();

  auto first = svc->start_server(ServerRequest{"sleep 30", "dev", 3000, ""});
  REQUIRE(first.ok());
  REQUIRE(first.running);
  REQUIRE(first.info.port == 3000);

  auto dup = svc->start_server(ServerRequest{"sleep 30", "dev", 3001, ""});
  REQUIRE(dup.failure->kind == ErrorKind::DuplicateName);
  REQUIRE(::kill(first.info.pid, 0) == 0);
  REQUIRE(fx.launcher->spawns == 1);

  auto d = svc->process_details("dev");
  REQUIRE(d.ok());
  REQUIRE(d.info->command == "sleep 30");

  auto health = svc->health_check();
  REQUIRE(health.total == 1);
  REQUIRE(health.healthy);

  auto stopped = svc->stop_server("dev");
  REQUIRE(stopped.ok());
  REQUIRE(svc->stop_server("dev").failure->kind == ErrorKind::NotFound);
  REQUIRE(svc->kill_all().empty());
}

TEST_CASE("start_server validates its arguments") {
  Fixture fx("validate");
  auto svc = fx.make();
  REQUIRE(svc->start_server(ServerRequest{"", "x", {}, ""}).failure->kind ==
          ErrorKind::InvalidArgument);
  REQUIRE(svc->start_server(ServerRequest{"sleep 1", "", {}, ""}).failure->kind ==
          ErrorKind::InvalidArgument);
  REQUIRE(svc->start_server(ServerRequest{"sleep 1", "x", 70000, ""}).failure->kind ==
          ErrorKind::InvalidArgument);
  REQUIRE(fx.launcher->spawns == 0);
}

TEST_CASE("a slow start is reported as a timeout and keeps running") {
  Fixture fx("slow_start");
  fx.cfg.startup_delay = 400ms;
  fx.cfg.process_timeout = 50ms;
  auto svc = fx.make();

  auto r = svc->start_server(ServerRequest{"sleep 30", "slow", {}, ""});
  REQUIRE(r.failure->kind == ErrorKind::Timeout);
  REQUIRE(r.failure->message.find("50ms") != std::string::npos);

  std::this_thread::sleep_for(800ms);
  auto procs = svc->list_processes();
  REQUIRE(procs.size() == 1);
  REQUIRE(svc->kill_all() == std::vector<std::string>{"slow"});
}

TEST_CASE("destroying the service kills its servers") {
  Fixture fx("shutdown");
  int pid = -1;
  {
    auto svc = fx.make();
    auto r = svc->start_server(ServerRequest{"sleep 30", "bg", {}, ""});
    REQUIRE(r.running);
    pid = r.info.pid;
  }
  REQUIRE(::kill(pid, 0) != 0);
}

TEST_CASE("sequence semantics through the facade") {
  Fixture fx("sequence");
  auto svc = fx.make();
  const std::vector<std::string> cmds{"echo a", "false", "echo b"};

  auto stopped = svc->run_command_sequence(cmds);
  REQUIRE_FALSE(stopped.ok);
  REQUIRE(stopped.outcomes.size() == 2);

  CommandRequest all;
  all.stop_on_error = false;
  auto full = svc->run_command_sequence(cmds, all);
  REQUIRE_FALSE(full.ok);
  REQUIRE(full.outcomes.size() == 3);
  REQUIRE(fx.launcher->runs == 5);

  auto empty = svc->run_command_sequence({});
  REQUIRE(empty.outcomes[0].failure->kind == ErrorKind::InvalidArgument);
}

TEST_CASE("policy operations through the facade") {
  Fixture fx("policy");
  auto svc = fx.make();

  REQUIRE(svc->add_allowed_command("docker").changed);
  auto again = svc->add_allowed_command("docker");
  REQUIRE_FALSE(again.changed);
  REQUIRE(again.message.find("already allowed") != std::string::npos);

  auto snap = svc->get_allowed_commands();
  REQUIRE(std::count(snap.allowed_commands.begin(), snap.allowed_commands.end(), "docker") == 1);

  REQUIRE(svc->define_custom_tool("say", "echo {{text}}", "print text").changed);
  auto said = svc->run_custom_tool("say", {{"text", "hi there"}});
  REQUIRE(said.ok);
  REQUIRE(said.outcomes[0].result->stdout_data == "hi there\n");

  REQUIRE(svc->remove_allowed_command("echo").changed);
  REQUIRE_FALSE(svc->run_command("echo hi").ok);
  REQUIRE(svc->run_custom_tool("say", {{"text", "still"}}).ok);
}

TEST_CASE("file backed policy survives a restart") {
  Fixture fx("file_policy");
  fx.cfg.policy_file = fx.dir / "policy.conf";
  {
    Service svc(fx.cfg);
    REQUIRE(svc.add_allowed_command("make").changed);
  }
  Service svc(fx.cfg);
  REQUIRE(svc.get_allowed_commands().allows("make"));
  REQUIRE(svc.get_allowed_commands().allows("npm"));
}

TEST_CASE("session scenario through the facade") {
  Fixture fx("session");
  sh("git init", fx.dir);
  sh("git config user.email test@example.com", fx.dir);
  sh("git config user.name tester", fx.dir);
  std::ofstream(fx.dir / ".gitignore") << "logs/\n";
  sh("git add . && git commit -m init", fx.dir);
  auto svc = fx.make();

  auto s = svc->start_session("refactor");
  REQUIRE(svc->get_current_session()->id == s.id);

  auto run = svc->run_command("sh -c 'echo ok > result.txt'");
  REQUIRE(run.ok);

  auto ck = svc->checkpoint("ran tests");
  REQUIRE(ck.ok());
  REQUIRE(ck.committed);
  REQUIRE(svc->get_current_session()->commit_hashes.size() == 1);

  auto clean = svc->checkpoint("again", {}, true);
  REQUIRE(clean.skipped);
  REQUIRE(svc->get_current_session()->commit_hashes.size() == 1);

  auto ended = svc->end_session();
  REQUIRE(ended->commit_hashes == std::vector<std::string>{ck.commit_id});
  REQUIRE_FALSE(svc->get_current_session());
  REQUIRE_FALSE(svc->end_session());
}
