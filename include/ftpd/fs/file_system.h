#ifndef FTPD_FS_FILE_SYSTEM_H
#define FTPD_FS_FILE_SYSTEM_H

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

#include "ftpd/core/result.h"
#include "ftpd/io_result.h"

namespace ftpd {
namespace fs {

/**
 * Owning wrapper around an open file descriptor. Move-only; the descriptor
 * is closed on destruction.
 */
class FileHandle {
 public:
  FileHandle() = default;
  explicit FileHandle(int fd) : fd_(fd) {}
  ~FileHandle();

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  FileHandle(FileHandle&& other) noexcept;
  FileHandle& operator=(FileHandle&& other) noexcept;

  bool isOpen() const { return fd_ >= 0; }
  int fd() const { return fd_; }

  // Positional read; 0 bytes means end of file
  IoCallResult readAt(uint64_t offset, void* buffer, size_t length) const;

  // Appends at the current file position. Short writes are retried.
  IoCallResult write(const void* data, size_t length);

  void close();

 private:
  int fd_{-1};
};

struct DirEntry {
  std::string name;
  bool is_directory{false};
  bool is_symlink{false};
  uint64_t size{0};
  mode_t mode{0};
  std::time_t mtime{0};
  std::string owner;
  std::string group;
  uint64_t nlink{1};
};

/**
 * Host file system access used by a session. All paths are host paths that
 * SessionRoot has already confined to the session root.
 */
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  virtual Result<FileHandle> open(const std::string& path) = 0;

  // Create or truncate for writing
  virtual Result<FileHandle> create(const std::string& path) = 0;

  // Entries sorted by name. A regular file lists as itself.
  virtual Result<std::vector<DirEntry>> list(const std::string& path) = 0;

  virtual VoidResult makeDirectory(const std::string& path) = 0;

  // Removes the directory and everything below it
  virtual VoidResult removeDirectory(const std::string& path) = 0;

  virtual VoidResult removeFile(const std::string& path) = 0;

  virtual VoidResult rename(const std::string& from, const std::string& to) = 0;

  virtual bool isDirectory(const std::string& path) const = 0;

  virtual bool exists(const std::string& path) const = 0;
};

using FileSystemSharedPtr = std::shared_ptr<FileSystem>;

class LocalFileSystem : public FileSystem {
 public:
  Result<FileHandle> open(const std::string& path) override;
  Result<FileHandle> create(const std::string& path) override;
  Result<std::vector<DirEntry>> list(const std::string& path) override;
  VoidResult makeDirectory(const std::string& path) override;
  VoidResult removeDirectory(const std::string& path) override;
  VoidResult removeFile(const std::string& path) override;
  VoidResult rename(const std::string& from, const std::string& to) override;
  bool isDirectory(const std::string& path) const override;
  bool exists(const std::string& path) const override;
};

// One "ls -l" style line, CRLF terminated
std::string formatListingLine(const DirEntry& entry);

std::string formatListing(const std::vector<DirEntry>& entries);

}  // namespace fs
}  // namespace ftpd

#endif  // FTPD_FS_FILE_SYSTEM_H
