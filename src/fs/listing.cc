#include <ctime>

#include <sys/stat.h>

#include <fmt/format.h>

#include "ftpd/fs/file_system.h"

namespace ftpd {
namespace fs {

namespace {

char typeChar(const DirEntry& entry) {
  if (entry.is_symlink) {
    return 'l';
  }
  return entry.is_directory ? 'd' : '-';
}

std::string permissionString(const DirEntry& entry) {
  static const char kFlags[] = "rwxrwxrwx";
  std::string perms(1, typeChar(entry));
  for (int bit = 0; bit < 9; ++bit) {
    bool set = (entry.mode & (0400 >> bit)) != 0;
    perms.push_back(set ? kFlags[bit] : '-');
  }
  return perms;
}

std::string formatTime(std::time_t mtime) {
  std::tm tm{};
  ::localtime_r(&mtime, &tm);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tm);
  return std::string(buf, n);
}

}  // namespace

std::string formatListingLine(const DirEntry& entry) {
  return fmt::format("{} {} {} {} {:>8} {} {}\r\n", permissionString(entry),
                     entry.nlink, entry.owner, entry.group, entry.size,
                     formatTime(entry.mtime), entry.name);
}

std::string formatListing(const std::vector<DirEntry>& entries) {
  std::string out;
  for (const auto& entry : entries) {
    out += formatListingLine(entry);
  }
  return out;
}

}  // namespace fs
}  // namespace ftpd
