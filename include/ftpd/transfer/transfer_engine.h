#ifndef FTPD_TRANSFER_TRANSFER_ENGINE_H
#define FTPD_TRANSFER_TRANSFER_ENGINE_H

#include <cstdint>
#include <vector>

#include "ftpd/core/result.h"
#include "ftpd/network/io_handle.h"
#include "ftpd/transfer/transfer.h"

namespace ftpd {
namespace transfer {

struct TransferProgress {
  enum class Status {
    InProgress,  // Keep the current interest armed
    Complete,
    Failed,
  };

  Status status{Status::InProgress};
  size_t bytes{0};  // Moved during this call
  optional<Error> error;  // Set when Failed
};

/**
 * Moves at most one chunk per readiness event between a data socket and the
 * transfer attached to it. A short read or write is ordinary progress;
 * would-block leaves the transfer untouched.
 */
class TransferEngine {
 public:
  explicit TransferEngine(size_t chunk_size);

  // Downloads: BufferPayload and FileStream
  TransferProgress onWritable(Transfer& transfer, network::IoHandle& socket);

  // Uploads: FileSink. End of stream completes the upload.
  TransferProgress onReadable(Transfer& transfer, network::IoHandle& socket);

  // Readiness interest a data socket needs for this transfer; 0 when idle
  static uint32_t interestFor(const Transfer& transfer);

  size_t chunkSize() const { return chunk_size_; }

 private:
  TransferProgress writeChunk(const void* data,
                              size_t length,
                              network::IoHandle& socket);

  size_t chunk_size_;
  std::vector<char> scratch_;
};

}  // namespace transfer
}  // namespace ftpd

#endif  // FTPD_TRANSFER_TRANSFER_ENGINE_H
