#include <cmdgate/process.hpp>
#include <cmdgate/vcs.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace cmdgate {

static std::string chomp(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

GitVersionControl::GitVersionControl(Launcher &launcher, fs::path root,
                 std::chrono::milliseconds timeout)
    : launcher_(launcher), root_(std::move(root)), timeout_(timeout) {}

GitVersionControl::Output GitVersionControl::git(const std::vector<std::string> &args) {
  RunOptions ro;
  ro.argv.reserve(args.size() + 1);
  ro.argv.push_back("git");
  ro.argv.insert(ro.argv.end(), args.begin(), args.end());
  ro.cwd = root_;
  ro.timeout = timeout_;
  // never wait for a credential or editor prompt
  ro.env["GIT_TERMINAL_PROMPT"] = "0";
  ro.env["GIT_EDITOR"] = "true";

  ExecutionResult r;
  try {
    r = launcher_.run(ro);
  } catch (const SpawnError &e) {
    throw VcsError(fmt::format("cannot run git: {}", e.what()));
  }
  if (r.timed_out)
    throw VcsError(fmt::format("git {} timed out after {}ms", args.front(),
                               timeout_.count()));
  return Output{r.exit_code, std::move(r.stdout_data), std::move(r.stderr_data)};
}

GitVersionControl::Output GitVersionControl::git_checked(const std::vector<std::string> &args) {
  auto o = git(args);
  if (o.rc != 0) {
    auto msg = chomp(o.err.empty() ? o.out : o.err);
    spdlog::warn("[git] {} failed (rc={}): {}", fmt::join(args, " "), o.rc, msg);
    throw VcsError(fmt::format("git {} failed (rc={}): {}", args.front(), o.rc, msg));
  }
  return o;
}

static void append_pathspec(std::vector<std::string> &args,
                            const std::vector<std::string> &files) {
  if (files.empty())
    return;
  args.push_back("--");
  args.insert(args.end(), files.begin(), files.end());
}

bool GitVersionControl::has_changes(const std::vector<std::string> &files) {
  std::vector<std::string> args{"status", "--porcelain", "--untracked-files=all"};
  append_pathspec(args, files);
  auto o = git_checked(args);
  return !chomp(o.out).empty();
}

std::string GitVersionControl::stage_and_commit(const std::string &message,
                                      const std::vector<std::string> &files) {
  std::vector<std::string> add{"add", "-A"};
  append_pathspec(add, files);
  git_checked(add);

  std::vector<std::string> commit{"commit", "--no-verify", "-m", message};
  append_pathspec(commit, files);
  git_checked(commit);

  auto head = current_commit();
  if (!head)
    throw VcsError("commit succeeded but HEAD cannot be resolved");
  spdlog::info("[git] committed {} in {}", head->substr(0, 12), root_.string());
  return *head;
}

std::optional<std::string> GitVersionControl::current_commit() {
  auto o = git({"rev-parse", "HEAD"});
  if (o.rc != 0)
    return std::nullopt;
  return chomp(o.out);
}

} // namespace cmdgate
