#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cmdgate {

class Launcher;

class VcsError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class VersionControl {
public:
  virtual ~VersionControl() = default;

  // Staged, unstaged or untracked changes, limited to `files` when given.
  virtual bool has_changes(const std::vector<std::string> &files) = 0;

  // Stages and commits; returns the new commit id. Throws VcsError.
  virtual std::string stage_and_commit(const std::string &message,
                                       const std::vector<std::string> &files) = 0;
};

class GitVersionControl : public VersionControl {
public:
  GitVersionControl(Launcher &launcher, std::filesystem::path root,
          std::chrono::milliseconds timeout = std::chrono::seconds(30));

  const std::filesystem::path &root() const { return root_; }

  bool has_changes(const std::vector<std::string> &files) override;
  std::string stage_and_commit(const std::string &message,
                               const std::vector<std::string> &files) override;

  std::optional<std::string> current_commit();

private:
  struct Output {
    int rc;
    std::string out;
    std::string err;
  };
  Output git(const std::vector<std::string> &args);
  Output git_checked(const std::vector<std::string> &args);

  Launcher &launcher_;
  std::filesystem::path root_;
  std::chrono::milliseconds timeout_;
};

} // namespace cmdgate
