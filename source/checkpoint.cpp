#include <cmdgate/checkpoint.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace cmdgate {

std::string format_commit_message(const std::string &tmpl, const std::string &message) {
  static const std::string key = "{{message}}";
  std::string out = tmpl;
  std::size_t pos = 0;
  bool seen = false;
  while ((pos = out.find(key, pos)) != std::string::npos) {
    out.replace(pos, key.size(), message);
    pos += message.size();
    seen = true;
  }
  if (!seen)
    return message.empty() ? tmpl : message;
  return out;
}

CheckpointResult ChangeCheckpointer::checkpoint(const std::string &message,
                                                const CheckpointOptions &opts) {
  CheckpointResult r;
  if (message.empty()) {
    r.failure = make_failure(ErrorKind::InvalidArgument, "Commit message is required");
    return r;
  }
  r.message = format_commit_message(opts.message_template, message);

  try {
    if (!vcs_.has_changes(opts.files)) {
      if (opts.skip_if_no_changes) {
        r.skipped = true;
        spdlog::debug("[git] nothing to commit, skipping checkpoint");
        return r;
      }
      r.failure = make_failure(ErrorKind::CheckpointFailure, "No changes to commit");
      return r;
    }
    r.commit_id = vcs_.stage_and_commit(r.message, opts.files);
    r.committed = true;
  } catch (const VcsError &e) {
    spdlog::warn("[git] checkpoint failed: {}", e.what());
    r.failure = make_failure(ErrorKind::CheckpointFailure,
                             fmt::format("Failed to commit changes: {}", e.what()));
    return r;
  }

  if (opts.track_session)
    r.recorded_in_session = sessions_.record_commit(r.commit_id, opts.max_session_commits);
  return r;
}

} // namespace cmdgate
