#include <cmdgate/workspace.hpp>

namespace fs = std::filesystem;

namespace cmdgate {

Workspace::Workspace(fs::path root)
    : root_(fs::absolute(root).lexically_normal()) {}

fs::path Workspace::resolve(const std::string &rel_or_abs) const {
  if (rel_or_abs.empty())
    return root_;
  fs::path p(rel_or_abs);
  if (p.is_absolute())
    return p.lexically_normal();
  return (root_ / p).lexically_normal();
}

} // namespace cmdgate
