#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"

namespace bridge_fs {

/**
 * @brief Authorization gate for every READ.
 *
 * A path is readable iff it is absolute, its string lies under one of the
 * allow-listed roots, and its canonical form (symlinks, "." and ".." resolved)
 * still lies under one of the canonical roots. Containment respects directory
 * boundaries: "/home/user" does not admit "/home/username".
 *
 * Roots are normalized once at construction. Roots that exist are
 * canonicalized so that symlinked roots (e.g. /tmp -> /private/tmp) compare
 * against resolved paths; missing roots keep their lexical form.
 */
class PathValidator {
public:
  explicit PathValidator(const std::vector<std::string> &allowed_dirs);
  explicit PathValidator(const doppler_bridge::AccessConfig &access);

  bool is_allowed(const std::string &path) const;

  // Canonical, symlink-free form of path when it is allowed. Callers open
  // this path rather than the requested one so the file read is the file
  // that was checked.
  std::optional<std::string> resolve(const std::string &path) const;

  // Roots as configured, lexically normalized
  const std::vector<std::string> &roots() const { return roots_; }

  // Roots after canonicalization
  const std::vector<std::string> &canonical_roots() const {
    return canonical_roots_;
  }

private:
  static bool is_under(const std::string &path,
                       const std::vector<std::string> &roots);

  std::vector<std::string> roots_;
  std::vector<std::string> canonical_roots_;
};

} // namespace bridge_fs
