#define FTPD_LOG_COMPONENT "Filesystem.local"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include "ftpd/fs/file_system.h"
#include "ftpd/logging/log_macros.h"

namespace ftpd {
namespace fs {

namespace stdfs = std::filesystem;

namespace {

Error ioError(const std::string& what, const std::string& path, int err) {
  return Error(ErrorKind::Io,
               fmt::format("{} '{}': {}", what, path, std::strerror(err)), err);
}

Error ioError(const std::string& what,
              const std::string& path,
              const std::error_code& ec) {
  return Error(ErrorKind::Io,
               fmt::format("{} '{}': {}", what, path, ec.message()),
               ec.value());
}

std::string userName(uid_t uid) {
  struct passwd pwd;
  struct passwd* found = nullptr;
  char buf[1024];
  if (::getpwuid_r(uid, &pwd, buf, sizeof(buf), &found) == 0 && found) {
    return found->pw_name;
  }
  return std::to_string(uid);
}

std::string groupName(gid_t gid) {
  struct group grp;
  struct group* found = nullptr;
  char buf[1024];
  if (::getgrgid_r(gid, &grp, buf, sizeof(buf), &found) == 0 && found) {
    return found->gr_name;
  }
  return std::to_string(gid);
}

optional<DirEntry> statEntry(const std::string& path, const std::string& name) {
  struct stat st;
  if (::lstat(path.c_str(), &st) != 0) {
    return nullopt;
  }
  DirEntry entry;
  entry.name = name;
  entry.is_symlink = S_ISLNK(st.st_mode);
  if (entry.is_symlink) {
    // Report what the link points at, keeping the link flag
    struct stat target;
    if (::stat(path.c_str(), &target) == 0) {
      entry.is_directory = S_ISDIR(target.st_mode);
    }
  } else {
    entry.is_directory = S_ISDIR(st.st_mode);
  }
  entry.size = static_cast<uint64_t>(st.st_size);
  entry.mode = st.st_mode;
  entry.mtime = st.st_mtime;
  entry.owner = userName(st.st_uid);
  entry.group = groupName(st.st_gid);
  entry.nlink = static_cast<uint64_t>(st.st_nlink);
  return entry;
}

}  // namespace

// ===== FileHandle =====

FileHandle::~FileHandle() { close(); }

FileHandle::FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) {
  other.fd_ = -1;
}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

IoCallResult FileHandle::readAt(uint64_t offset,
                                void* buffer,
                                size_t length) const {
  ssize_t n;
  do {
    n = ::pread(fd_, buffer, length, static_cast<off_t>(offset));
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    return IoCallResult::from_errno(errno);
  }
  return IoCallResult::success(static_cast<size_t>(n));
}

IoCallResult FileHandle::write(const void* data, size_t length) {
  const char* p = static_cast<const char*>(data);
  size_t written = 0;
  while (written < length) {
    ssize_t n = ::write(fd_, p + written, length - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return IoCallResult::from_errno(errno);
    }
    written += static_cast<size_t>(n);
  }
  return IoCallResult::success(written);
}

void FileHandle::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// ===== LocalFileSystem =====

Result<FileHandle> LocalFileSystem::open(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return makeError<FileHandle>(ioError("open", path, errno));
  }
  struct stat st;
  if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
    ::close(fd);
    return makeError<FileHandle>(ioError("open", path, EISDIR));
  }
  return Result<FileHandle>(FileHandle(fd));
}

Result<FileHandle> LocalFileSystem::create(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return makeError<FileHandle>(ioError("create", path, errno));
  }
  return Result<FileHandle>(FileHandle(fd));
}

Result<std::vector<DirEntry>> LocalFileSystem::list(const std::string& path) {
  std::vector<DirEntry> entries;
  std::error_code ec;

  if (!stdfs::is_directory(path, ec)) {
    auto entry = statEntry(path, stdfs::path(path).filename().string());
    if (!entry) {
      return makeError<std::vector<DirEntry>>(ioError("stat", path, errno));
    }
    entries.push_back(std::move(*entry));
    return makeSuccess(std::move(entries));
  }

  stdfs::directory_iterator it(path, ec);
  if (ec) {
    return makeError<std::vector<DirEntry>>(ioError("list", path, ec));
  }
  for (; it != stdfs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return makeError<std::vector<DirEntry>>(ioError("list", path, ec));
    }
    auto entry = statEntry(it->path().string(),
                           it->path().filename().string());
    if (entry) {
      entries.push_back(std::move(*entry));
    } else {
      // Entry vanished between readdir and lstat
      FTPD_LOG_DEBUG("skipping {}: {}", it->path().string(),
                     std::strerror(errno));
    }
  }
  if (ec) {
    return makeError<std::vector<DirEntry>>(ioError("list", path, ec));
  }

  std::sort(entries.begin(), entries.end(),
            [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
  return makeSuccess(std::move(entries));
}

VoidResult LocalFileSystem::makeDirectory(const std::string& path) {
  if (::mkdir(path.c_str(), 0755) != 0) {
    return makeVoidError(ioError("mkdir", path, errno));
  }
  return makeVoidSuccess();
}

VoidResult LocalFileSystem::removeDirectory(const std::string& path) {
  std::error_code ec;
  if (!stdfs::is_directory(stdfs::symlink_status(path, ec))) {
    return makeVoidError(ioError("rmdir", path, ENOTDIR));
  }
  stdfs::remove_all(path, ec);
  if (ec) {
    return makeVoidError(ioError("rmdir", path, ec));
  }
  return makeVoidSuccess();
}

VoidResult LocalFileSystem::removeFile(const std::string& path) {
  std::error_code ec;
  if (stdfs::is_directory(stdfs::symlink_status(path, ec))) {
    return makeVoidError(ioError("unlink", path, EISDIR));
  }
  if (::unlink(path.c_str()) != 0) {
    return makeVoidError(ioError("unlink", path, errno));
  }
  return makeVoidSuccess();
}

VoidResult LocalFileSystem::rename(const std::string& from,
                                   const std::string& to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    return makeVoidError(ioError("rename", from, errno));
  }
  return makeVoidSuccess();
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
  std::error_code ec;
  return stdfs::is_directory(path, ec);
}

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return stdfs::exists(stdfs::symlink_status(path, ec));
}

}  // namespace fs
}  // namespace ftpd
