#include <cmdgate/config.hpp>
#include <cmdgate/policy.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace fs = std::filesystem;

namespace cmdgate {

static long env_long(const char *name, long defv) {
  const char *v = ::getenv(name);
  if (!v || !*v)
    return defv;
  char *end = nullptr;
  long r = std::strtol(v, &end, 10);
  if (end == v || r < 0) {
    spdlog::warn("[config] ignoring {}='{}'", name, v);
    return defv;
  }
  return r;
}

fs::path Config::effective_policy_file() const {
  if (!policy_file.empty())
    return policy_file;
  return workspace / FilePolicyStore::kFileName;
}

Config Config::FromEnv() {
  Config c;
  if (const char *ws = ::getenv("CMDGATE_WORKSPACE"); ws && *ws)
    c.workspace = fs::absolute(ws);
  else
    c.workspace = fs::current_path();

  if (const char *pf = ::getenv("CMDGATE_POLICY_FILE"); pf && *pf)
    c.policy_file = pf;

  if (const char *ld = ::getenv("CMDGATE_LOGS_DIR"); ld && *ld)
    c.logs_dir = ld;
  else
    c.logs_dir = fs::temp_directory_path() / "cmdgate" / "logs";

  c.startup_delay = std::chrono::milliseconds(
      env_long("CMDGATE_STARTUP_DELAY_MS", c.startup_delay.count()));
  c.stop_timeout = std::chrono::milliseconds(
      env_long("CMDGATE_STOP_TIMEOUT_MS", c.stop_timeout.count()));
  c.process_timeout = std::chrono::milliseconds(
      env_long("CMDGATE_PROCESS_TIMEOUT_MS", c.process_timeout.count()));
  c.log_max_mb = static_cast<std::uintmax_t>(
      env_long("CMDGATE_LOG_MAX_MB", static_cast<long>(c.log_max_mb)));

  if (const char *lvl = ::getenv("CMDGATE_LOG_LEVEL"); lvl && *lvl)
    c.log_level = lvl;
  return c;
}

void apply_log_level(const std::string &level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("[config] unknown log level '{}', keeping info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

} // namespace cmdgate
