#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cmdgate {

struct Config {
  std::filesystem::path workspace;
  std::filesystem::path policy_file; // empty -> <workspace>/.cmdgate.conf
  std::filesystem::path logs_dir;

  std::chrono::milliseconds startup_delay{2000};
  std::chrono::milliseconds stop_timeout{1000};
  std::chrono::milliseconds process_timeout{30000};

  std::uintmax_t log_max_mb = 5;
  int log_backups = 3;
  std::string log_level = "info";

  std::filesystem::path effective_policy_file() const;

  // Defaults overridden by CMDGATE_* environment variables.
  static Config FromEnv();
};

// Applies a textual level (trace|debug|info|warn|error|off) to spdlog.
void apply_log_level(const std::string &level);

} // namespace cmdgate
