#pragma once
#include <filesystem>
#include <string>

namespace cmdgate {

// Turns user supplied working directories into absolute paths under a root.
class Workspace {
public:
  explicit Workspace(std::filesystem::path root);

  const std::filesystem::path &root() const { return root_; }

  // "" -> root, relative -> root/rel, absolute -> unchanged (normalized)
  std::filesystem::path resolve(const std::string &rel_or_abs) const;

private:
  std::filesystem::path root_;
};

} // namespace cmdgate
