#include "files/path_validator.hpp"

#include <filesystem>
#include <system_error>

namespace bridge_fs {

namespace fs = std::filesystem;

static std::string normalize_root(const std::string &dir) {
  std::string normal = fs::path(dir).lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

PathValidator::PathValidator(const std::vector<std::string> &allowed_dirs) {
  for (const auto &dir : allowed_dirs) {
    if (dir.empty() || !fs::path(dir).is_absolute()) {
      continue;
    }

    const std::string root = normalize_root(dir);
    roots_.push_back(root);

    std::error_code ec;
    const fs::path canonical = fs::canonical(root, ec);
    canonical_roots_.push_back(ec ? root : normalize_root(canonical.string()));
  }
}

PathValidator::PathValidator(const doppler_bridge::AccessConfig &access)
    : PathValidator(access.allowed_dirs) {}

bool PathValidator::is_under(const std::string &path,
                             const std::vector<std::string> &roots) {
  for (const auto &root : roots) {
    if (root == "/") {
      return true;
    }
    if (path == root) {
      return true;
    }
    if (path.size() > root.size() && path.compare(0, root.size(), root) == 0 &&
        path[root.size()] == '/') {
      return true;
    }
  }
  return false;
}

std::optional<std::string>
PathValidator::resolve(const std::string &path) const {
  if (path.empty() || !fs::path(path).is_absolute()) {
    return std::nullopt;
  }

  // Raw prefix gate first; no filesystem access for obviously foreign paths.
  if (!is_under(path, roots_)) {
    return std::nullopt;
  }

  std::error_code ec;
  const fs::path canonical = fs::canonical(path, ec);
  if (ec) {
    return std::nullopt;
  }

  std::string resolved = canonical.string();
  if (!is_under(resolved, canonical_roots_)) {
    return std::nullopt;
  }
  return resolved;
}

bool PathValidator::is_allowed(const std::string &path) const {
  return resolve(path).has_value();
}

} // namespace bridge_fs
