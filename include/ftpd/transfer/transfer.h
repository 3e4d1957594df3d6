#ifndef FTPD_TRANSFER_TRANSFER_H
#define FTPD_TRANSFER_TRANSFER_H

#include <cstdint>
#include <string>

#include "ftpd/core/compat.h"
#include "ftpd/fs/file_system.h"

namespace ftpd {
namespace transfer {

// In-memory payload, used for directory listings
struct BufferPayload {
  std::string bytes;
  size_t offset{0};

  size_t remaining() const { return bytes.size() - offset; }
};

// File read from offset onwards (RETR)
struct FileStream {
  fs::FileHandle file;
  uint64_t offset{0};
};

// File written with whatever the client sends until EOF (STOR)
struct FileSink {
  fs::FileHandle file;
  uint64_t bytes_written{0};
};

// monostate: the data connection is open but no command has used it yet
using Transfer = variant<monostate, BufferPayload, FileStream, FileSink>;

inline bool isIdle(const Transfer& transfer) {
  return holds_alternative<monostate>(transfer);
}

inline const char* transferKindToString(const Transfer& transfer) {
  switch (transfer.index()) {
    case 0:
      return "idle";
    case 1:
      return "buffer";
    case 2:
      return "file-stream";
    case 3:
      return "file-sink";
  }
  return "unknown";
}

}  // namespace transfer
}  // namespace ftpd

#endif  // FTPD_TRANSFER_TRANSFER_H
