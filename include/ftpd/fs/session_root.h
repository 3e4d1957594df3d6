#ifndef FTPD_FS_SESSION_ROOT_H
#define FTPD_FS_SESSION_ROOT_H

#include <string>

#include "ftpd/core/result.h"

namespace ftpd {
namespace fs {

/**
 * The directory a session is confined to, and the session's virtual working
 * directory inside it.
 *
 * Client paths are virtual: "/" is the root. Resolution first normalizes
 * the virtual path lexically, then maps it onto the host and canonicalizes
 * it, so a symlink pointing outside the root is caught as well as "..".
 * Every failure is ErrorKind::Path.
 */
class SessionRoot {
 public:
  // Canonicalizes root, which must be an existing directory
  static Result<SessionRoot> create(const std::string& root);

  const std::string& hostRoot() const { return root_; }
  const std::string& cwd() const { return cwd_; }

  // Lexical absolute virtual path for arg; climbing above "/" fails
  Result<std::string> virtualPath(const std::string& arg) const;

  // Canonical host path of an existing target inside the root
  Result<std::string> resolveExisting(const std::string& arg) const;

  // Host path for a target that may not exist yet; its parent must exist
  // inside the root
  Result<std::string> resolveForCreate(const std::string& arg) const;

  // Changes the virtual cwd; the target must be an existing directory
  VoidResult changeDirectory(const std::string& arg);

 private:
  explicit SessionRoot(std::string root) : root_(std::move(root)), cwd_("/") {}

  bool contains(const std::string& host_path) const;
  std::string toHost(const std::string& virtual_path) const;

  std::string root_;
  std::string cwd_;
};

}  // namespace fs
}  // namespace ftpd

#endif  // FTPD_FS_SESSION_ROOT_H
