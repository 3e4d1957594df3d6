#include "ftpd/fs/session_root.h"

#include <filesystem>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace ftpd {
namespace fs {

namespace stdfs = std::filesystem;

namespace {

Error pathError(const std::string& message) {
  return Error(ErrorKind::Path, message);
}

}  // namespace

Result<SessionRoot> SessionRoot::create(const std::string& root) {
  std::error_code ec;
  stdfs::path canonical = stdfs::canonical(root, ec);
  if (ec) {
    return makeError<SessionRoot>(pathError(
        fmt::format("root '{}' unavailable: {}", root, ec.message())));
  }
  if (!stdfs::is_directory(canonical, ec)) {
    return makeError<SessionRoot>(
        pathError(fmt::format("root '{}' is not a directory", root)));
  }
  return Result<SessionRoot>(SessionRoot(canonical.string()));
}

Result<std::string> SessionRoot::virtualPath(const std::string& arg) const {
  std::string joined = (!arg.empty() && arg[0] == '/') ? arg : cwd_ + "/" + arg;

  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= joined.size()) {
    size_t slash = joined.find('/', start);
    if (slash == std::string::npos) {
      slash = joined.size();
    }
    std::string part = joined.substr(start, slash - start);
    start = slash + 1;

    if (part.empty() || part == ".") {
      continue;
    }
    if (part == "..") {
      if (parts.empty()) {
        return makeError<std::string>(
            pathError(fmt::format("'{}' escapes the root", arg)));
      }
      parts.pop_back();
      continue;
    }
    parts.push_back(part);
  }

  std::string result;
  for (const auto& part : parts) {
    result += "/" + part;
  }
  return makeSuccess(result.empty() ? std::string("/") : result);
}

std::string SessionRoot::toHost(const std::string& virtual_path) const {
  return virtual_path == "/" ? root_ : root_ + virtual_path;
}

bool SessionRoot::contains(const std::string& host_path) const {
  if (host_path == root_) {
    return true;
  }
  std::string prefix = root_ == "/" ? root_ : root_ + "/";
  return host_path.compare(0, prefix.size(), prefix) == 0;
}

Result<std::string> SessionRoot::resolveExisting(const std::string& arg) const {
  auto virt = virtualPath(arg);
  if (isError(virt)) {
    return virt;
  }

  std::error_code ec;
  stdfs::path canonical = stdfs::canonical(toHost(get<std::string>(virt)), ec);
  if (ec) {
    return makeError<std::string>(
        pathError(fmt::format("'{}': {}", arg, ec.message())));
  }
  if (!contains(canonical.string())) {
    return makeError<std::string>(
        pathError(fmt::format("'{}' escapes the root", arg)));
  }
  return makeSuccess(canonical.string());
}

Result<std::string> SessionRoot::resolveForCreate(
    const std::string& arg) const {
  auto virt = virtualPath(arg);
  if (isError(virt)) {
    return virt;
  }
  const std::string& path = get<std::string>(virt);
  if (path == "/") {
    return makeError<std::string>(
        pathError(fmt::format("'{}' names the root", arg)));
  }

  size_t slash = path.rfind('/');
  std::string parent = slash == 0 ? "/" : path.substr(0, slash);
  std::string name = path.substr(slash + 1);

  auto host_parent = resolveExisting(parent);
  if (isError(host_parent)) {
    return host_parent;
  }
  std::error_code ec;
  if (!stdfs::is_directory(get<std::string>(host_parent), ec)) {
    return makeError<std::string>(
        pathError(fmt::format("'{}' is not a directory", parent)));
  }

  std::string target = get<std::string>(host_parent) + "/" + name;

  // An existing symlink at the target is followed by open()
  if (stdfs::is_symlink(stdfs::symlink_status(target, ec))) {
    stdfs::path canonical = stdfs::canonical(target, ec);
    if (ec || !contains(canonical.string())) {
      return makeError<std::string>(
          pathError(fmt::format("'{}' escapes the root", arg)));
    }
    return makeSuccess(canonical.string());
  }
  return makeSuccess(target);
}

VoidResult SessionRoot::changeDirectory(const std::string& arg) {
  auto virt = virtualPath(arg);
  if (isError(virt)) {
    return makeVoidError(get<Error>(virt));
  }
  auto host = resolveExisting(arg);
  if (isError(host)) {
    return makeVoidError(get<Error>(host));
  }
  std::error_code ec;
  if (!stdfs::is_directory(get<std::string>(host), ec)) {
    return makeVoidError(
        pathError(fmt::format("'{}' is not a directory", arg)));
  }
  cwd_ = get<std::string>(virt);
  return makeVoidSuccess();
}

}  // namespace fs
}  // namespace ftpd
