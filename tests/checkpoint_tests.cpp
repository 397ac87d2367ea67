#include <catch2/catch_all.hpp>
#include <cmdgate/checkpoint.hpp>
#include <cmdgate/sequencer.hpp>
#include <cmdgate/session.hpp>
#include <cmdgate/vcs.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace cmdgate;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("cmdgate_ckpt_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

static fs::path make_repo(const char *name) {
  auto repo = mkd(name);
  sh("git init", repo);
  sh("git config user.email test@example.com", repo);
  sh("git config user.name tester", repo);
  std::ofstream(repo / "README.md") << "hello\n";
  sh("git add . && git commit -m init", repo);
  return repo;
}

static std::size_t commit_count(const fs::path &repo) {
  PosixLauncher l;
  RunOptions ro;
  ro.argv = {"git", "rev-list", "--count", "HEAD"};
  ro.cwd = repo;
  return static_cast<std::size_t>(std::stoul(l.run(ro).stdout_data));
}

static std::string head_subject(const fs::path &repo) {
  PosixLauncher l;
  RunOptions ro;
  ro.argv = {"git", "log", "-1", "--format=%s"};
  ro.cwd = repo;
  auto s = l.run(ro).stdout_data;
  while (!s.empty() && s.back() == '\n')
    s.pop_back();
  return s;
}

// Runs git for real and answers "npm test" itself.
class ScriptedLauncher : public Launcher {
public:
  explicit ScriptedLauncher(fs::path repo) : repo_(std::move(repo)) {}

  ChildProcess spawn(const SpawnOptions &o) override { return real_.spawn(o); }

  ExecutionResult run(const RunOptions &o) override {
    if (!o.argv.empty() && o.argv[0] == "npm") {
      ++npm_runs;
      std::ofstream(repo_ / "test-results.json") << "{\"passed\":12}\n";
      ExecutionResult r;
      r.exit_code = 0;
      r.stdout_data = "12 passing\n";
      return r;
    }
    return real_.run(o);
  }

  int npm_runs = 0;

private:
  fs::path repo_;
  PosixLauncher real_;
};

TEST_CASE("commit message template") {
  REQUIRE(format_commit_message("[AI] Auto-commit: {{message}}", "fix") ==
          "[AI] Auto-commit: fix");
  REQUIRE(format_commit_message("{{message}} / {{message}}", "x") == "x / x");
  REQUIRE(format_commit_message("no placeholder", "msg") == "msg");
}

TEST_CASE("clean working tree with skip_if_no_changes does nothing") {
  auto repo = make_repo("clean");
  PosixLauncher launcher;
  GitVersionControl git(launcher, repo);
  SessionTracker sessions;
  ChangeCheckpointer cp(git, sessions);

  auto before = commit_count(repo);
  CheckpointOptions o;
  o.skip_if_no_changes = true;
  auto r = cp.checkpoint("msg", o);
  REQUIRE(r.ok());
  REQUIRE(r.skipped);
  REQUIRE_FALSE(r.committed);
  REQUIRE(commit_count(repo) == before);

  o.skip_if_no_changes = false;
  auto strict = cp.checkpoint("msg", o);
  REQUIRE(strict.failure->kind == ErrorKind::CheckpointFailure);
  REQUIRE(commit_count(repo) == before);
}

TEST_CASE("changes are committed with the provenance prefix") {
  auto repo = make_repo("dirty");
  PosixLauncher launcher;
  GitVersionControl git(launcher, repo);
  SessionTracker sessions;
  ChangeCheckpointer cp(git, sessions);

  std::ofstream(repo / "a.txt") << "a\n";
  std::ofstream(repo / "b.txt") << "b\n";

  SECTION("whole tree") {
    auto r = cp.checkpoint("add files", CheckpointOptions{});
    REQUIRE(r.ok());
    REQUIRE(r.committed);
    REQUIRE(r.commit_id.size() == 40);
    REQUIRE(head_subject(repo) == "[AI] Auto-commit: add files");
    REQUIRE_FALSE(git.has_changes({}));
    REQUIRE(git.current_commit() == r.commit_id);
  }
  SECTION("restricted to files") {
    CheckpointOptions o;
    o.files = {"a.txt"};
    auto r = cp.checkpoint("only a", o);
    REQUIRE(r.committed);
    REQUIRE_FALSE(git.has_changes({"a.txt"}));
    REQUIRE(git.has_changes({"b.txt"}));
  }
  SECTION("no session means nothing is recorded") {
    auto r = cp.checkpoint("x", CheckpointOptions{});
    REQUIRE(r.committed);
    REQUIRE_FALSE(r.recorded_in_session);
  }
}

TEST_CASE("a directory outside version control reports a failure") {
  auto dir = mkd("norepo");
  std::ofstream(dir / "f.txt") << "x\n";
  PosixLauncher launcher;
  GitVersionControl git(launcher, dir);
  SessionTracker sessions;
  ChangeCheckpointer cp(git, sessions);

  CheckpointOptions o;
  o.skip_if_no_changes = true;
  CheckpointResult r;
  REQUIRE_NOTHROW(r = cp.checkpoint("msg", o));
  REQUIRE(r.failure->kind == ErrorKind::CheckpointFailure);
  REQUIRE_FALSE(r.committed);
}

TEST_CASE("session bookkeeping") {
  SessionTracker t;
  REQUIRE_FALSE(t.current());
  REQUIRE_FALSE(t.end());
  REQUIRE_FALSE(t.record_commit("abc", 10));

  auto s1 = t.start("first");
  REQUIRE(s1.id.rfind("session_", 0) == 0);
  REQUIRE(s1.active);
  auto s2 = t.start("second", std::string("feature/x"));
  REQUIRE(s2.id != s1.id);
  REQUIRE(t.current()->description == "second");
  REQUIRE(t.current()->branch == std::string("feature/x"));

  REQUIRE(t.record_commit("c1", 2));
  REQUIRE(t.record_commit("c2", 2));
  REQUIRE_FALSE(t.record_commit("c3", 2));
  REQUIRE(t.current()->commit_hashes == std::vector<std::string>{"c1", "c2"});

  auto ended = t.end();
  REQUIRE(ended->id == s2.id);
  REQUIRE_FALSE(ended->active);
  REQUIRE_FALSE(t.current());
}

TEST_CASE("session scenario: run tests, checkpoint, end") {
  auto repo = make_repo("scenario");
  ScriptedLauncher launcher(repo);
  ProjectPolicy p;
  p.allowed_commands = {"npm", "git"};
  MemoryPolicyStore store(p);
  CommandGate gate(store);
  Workspace ws(repo);
  GitVersionControl git(launcher, repo);
  SessionTracker sessions;
  ChangeCheckpointer cp(git, sessions);
  CommandSequencer seq(gate, launcher, ws, &cp);

  sessions.start("refactor");
  auto run = seq.run_command("npm test");
  REQUIRE(run.ok);
  REQUIRE(launcher.npm_runs == 1);
  REQUIRE_FALSE(run.checkpoint);

  auto before = sessions.current()->commit_hashes.size();
  auto r = cp.checkpoint("ran tests", CheckpointOptions{});
  REQUIRE(r.committed);
  REQUIRE(r.recorded_in_session);
  auto after = sessions.current()->commit_hashes;
  REQUIRE(after.size() == before + 1);
  REQUIRE(after.back() == r.commit_id);

  REQUIRE(sessions.end());
  REQUIRE_FALSE(sessions.current());
}

TEST_CASE("commit_result checkpoints a successful run") {
  auto repo = make_repo("commit_result");
  ScriptedLauncher launcher(repo);
  ProjectPolicy p;
  p.allowed_commands = {"npm", "false"};
  MemoryPolicyStore store(p);
  CommandGate gate(store);
  Workspace ws(repo);
  GitVersionControl git(launcher, repo);
  SessionTracker sessions;
  ChangeCheckpointer cp(git, sessions);
  CommandSequencer seq(gate, launcher, ws, &cp);

  SequenceOptions o;
  o.commit_result = true;

  auto before = commit_count(repo);
  auto r = seq.run_command("npm test", o);
  REQUIRE(r.ok);
  REQUIRE(r.checkpoint);
  REQUIRE(r.checkpoint->committed);
  REQUIRE(head_subject(repo) == "[AI] Auto-commit: Executed command: npm test");
  REQUIRE(commit_count(repo) == before + 1);

  SECTION("nothing new to commit is skipped") {
    auto again = seq.run_command("npm test", o);
    REQUIRE(again.checkpoint->skipped);
  }
  SECTION("a failed run is not committed") {
    std::ofstream(repo / "c.txt") << "c\n";
    auto failed = seq.run_sequence({"npm test", "false"}, o);
    REQUIRE_FALSE(failed.ok);
    REQUIRE_FALSE(failed.checkpoint);
  }
  SECTION("policy can switch auto-commit off") {
    p.git_auto_commit = false;
    store.save(p);
    gate.invalidate();
    std::ofstream(repo / "d.txt") << "d\n";
    REQUIRE_FALSE(seq.run_command("npm test", o).checkpoint);
  }
}
