#pragma once
#include "errors.hpp"
#include "session.hpp"
#include "vcs.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

struct CheckpointOptions {
  std::vector<std::string> files; // empty -> whole working tree
  bool skip_if_no_changes = false;
  std::string message_template = "[AI] Auto-commit: {{message}}";
  bool track_session = true;
  std::size_t max_session_commits = 50;
};

struct CheckpointResult {
  bool committed = false;
  bool skipped = false;
  std::string commit_id;
  std::string message;
  bool recorded_in_session = false;
  std::optional<Failure> failure;

  bool ok() const { return !failure; }
};

// Replaces {{message}} in the commit message template.
std::string format_commit_message(const std::string &tmpl, const std::string &message);

class ChangeCheckpointer {
public:
  ChangeCheckpointer(VersionControl &vcs, SessionTracker &sessions)
      : vcs_(vcs), sessions_(sessions) {}

  // Never throws; git problems come back as CheckpointFailure.
  CheckpointResult checkpoint(const std::string &message,
                              const CheckpointOptions &opts);

private:
  VersionControl &vcs_;
  SessionTracker &sessions_;
};

} // namespace cmdgate
