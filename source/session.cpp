#include <cmdgate/session.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

namespace cmdgate {

std::string make_session_id(std::chrono::system_clock::time_point at,
                            const std::string &description) {
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                at.time_since_epoch())
                .count();
  std::string seed = fmt::format("{}:{}", ns, description);
  XXH64_hash_t h = XXH3_64bits(seed.data(), seed.size());
  return fmt::format("session_{:016x}", static_cast<unsigned long long>(h));
}

Session SessionTracker::start(const std::string &description,
                              std::optional<std::string> branch) {
  Session s;
  s.started_at = std::chrono::system_clock::now();
  s.id = make_session_id(s.started_at, description);
  s.description = description;
  s.branch = std::move(branch);
  s.active = true;

  std::lock_guard<std::mutex> lk(mu_);
  if (active_)
    spdlog::info("[session={}] replaced by {}", active_->id, s.id);
  active_ = s;
  spdlog::info("[session={}] started: {}", s.id, description);
  return s;
}

std::optional<Session> SessionTracker::end() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_)
    return std::nullopt;
  Session s = std::move(*active_);
  active_.reset();
  s.active = false;
  spdlog::info("[session={}] ended with {} commit(s)", s.id, s.commit_hashes.size());
  return s;
}

std::optional<Session> SessionTracker::current() const {
  std::lock_guard<std::mutex> lk(mu_);
  return active_;
}

bool SessionTracker::record_commit(const std::string &commit_id,
                                   std::size_t max_commits) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!active_)
    return false;
  if (active_->commit_hashes.size() >= max_commits) {
    spdlog::warn("[session={}] commit limit {} reached, {} not recorded", active_->id,
                 max_commits, commit_id);
    return false;
  }
  active_->commit_hashes.push_back(commit_id);
  return true;
}

} // namespace cmdgate
