#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace cmdgate {

struct CustomTool {
  std::string name;
  std::string command; // template with {{key}} placeholders
  std::string description;
};

struct ProjectPolicy {
  std::vector<std::string> allowed_commands;
  std::vector<CustomTool> custom_tools;

  bool git_auto_commit = true;
  std::string auto_commit_message = "[AI] Auto-commit: {{message}}";
  bool session_tracking = true;
  int max_session_commits = 50;
  int command_timeout_ms = 30000;

  bool allows(const std::string &executable) const;
  const CustomTool *find_tool(const std::string &name) const;

  static ProjectPolicy Defaults();
};

// Where the policy lives. Load never fails: a missing or unreadable source
// yields defaults. Save throws std::runtime_error.
class PolicyStore {
public:
  virtual ~PolicyStore() = default;
  virtual ProjectPolicy load() = 0;
  virtual void save(const ProjectPolicy &p) = 0;
};

class FilePolicyStore : public PolicyStore {
public:
  static constexpr const char *kFileName = ".cmdgate.conf";

  explicit FilePolicyStore(std::filesystem::path file);

  ProjectPolicy load() override;
  void save(const ProjectPolicy &p) override;

  const std::filesystem::path &path() const { return path_; }

  static ProjectPolicy Parse(const std::string &text);
  static std::string Render(const ProjectPolicy &p);

private:
  std::filesystem::path path_;
};

class MemoryPolicyStore : public PolicyStore {
public:
  MemoryPolicyStore() : policy_(ProjectPolicy::Defaults()) {}
  explicit MemoryPolicyStore(ProjectPolicy p) : policy_(std::move(p)) {}

  ProjectPolicy load() override { ++loads_; return policy_; }
  void save(const ProjectPolicy &p) override { ++saves_; policy_ = p; }

  int loads() const { return loads_; }
  int saves() const { return saves_; }

private:
  ProjectPolicy policy_;
  int loads_ = 0;
  int saves_ = 0;
};

} // namespace cmdgate
