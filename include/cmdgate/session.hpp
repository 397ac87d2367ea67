#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

struct Session {
  std::string id;
  std::string description;
  std::optional<std::string> branch;
  std::chrono::system_clock::time_point started_at;
  std::vector<std::string> commit_hashes;
  bool active = false;
};

// Zero or one active session of related work.
class SessionTracker {
public:
  // Replaces any active session.
  Session start(const std::string &description,
                std::optional<std::string> branch = std::nullopt);

  // Ends and returns the active session; nothing when none is active.
  std::optional<Session> end();

  std::optional<Session> current() const;

  // Appends to the active session. False when there is no session or the
  // session already holds `max_commits` ids.
  bool record_commit(const std::string &commit_id, std::size_t max_commits);

private:
  mutable std::mutex mu_;
  std::optional<Session> active_;
};

std::string make_session_id(std::chrono::system_clock::time_point at,
                            const std::string &description);

} // namespace cmdgate
