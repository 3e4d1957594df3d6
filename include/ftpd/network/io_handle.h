#ifndef FTPD_NETWORK_IO_HANDLE_H
#define FTPD_NETWORK_IO_HANDLE_H

#include <memory>
#include <string>

#include "ftpd/core/compat.h"
#include "ftpd/event/event_loop.h"
#include "ftpd/io_result.h"
#include "ftpd/network/address.h"

namespace ftpd {
namespace network {

class IoHandle;
using IoHandlePtr = std::unique_ptr<IoHandle>;

using os_fd_t = int;
constexpr os_fd_t INVALID_SOCKET_FD = -1;

// Bring IoResult types into this namespace
using ::ftpd::IoCallResult;
using ::ftpd::IoResult;
using ::ftpd::IoVoidResult;
using ::ftpd::SystemError;

// Mutable memory region for vectored reads
struct RawSlice {
  void* mem_ = nullptr;
  size_t len_ = 0;
};

// Immutable memory region for vectored writes
struct ConstRawSlice {
  const void* mem_ = nullptr;
  size_t len_ = 0;
};

/**
 * Abstract interface for I/O operations on sockets.
 *
 * Every call reports failure through IoResult instead of throwing. A
 * would-block condition is reported as an error whose wouldBlock() is true
 * and is never fatal to the caller.
 */
class IoHandle {
 public:
  virtual ~IoHandle() = default;

  // ===== Core I/O Operations =====

  /**
   * Read data into buffer slices (vectored I/O).
   * @param max_length Maximum bytes to read
   * @return Number of bytes read (0 at end of stream) or error
   */
  virtual IoCallResult readv(size_t max_length,
                             RawSlice* slices,
                             size_t num_slices) = 0;

  /**
   * Write data from buffer slices (vectored I/O). Partial writes are normal.
   * @return Number of bytes written or error
   */
  virtual IoCallResult writev(const ConstRawSlice* slices,
                              size_t num_slices) = 0;

  // ===== Socket Operations =====

  virtual IoVoidResult close() = 0;

  virtual bool isOpen() const = 0;

  virtual IoResult<int> bind(
      const Address::InstanceConstSharedPtr& address) = 0;

  virtual IoResult<int> listen(int backlog) = 0;

  /**
   * Accept a new connection. The returned handle is non-blocking.
   */
  virtual IoResult<IoHandlePtr> accept() = 0;

  /**
   * Connect to an address. A non-blocking handle reports EINPROGRESS.
   */
  virtual IoResult<int> connect(
      const Address::InstanceConstSharedPtr& address) = 0;

  /**
   * Shutdown the socket.
   * @param how SHUT_RD, SHUT_WR, or SHUT_RDWR
   */
  virtual IoResult<int> shutdown(int how) = 0;

  virtual IoResult<int> setSocketOption(int level,
                                        int optname,
                                        const void* optval,
                                        socklen_t optlen) = 0;

  // ===== Event Integration =====

  /**
   * Initialize file event monitoring. Throws std::runtime_error if the
   * dispatcher cannot register the descriptor.
   */
  virtual void initializeFileEvent(event::Dispatcher& dispatcher,
                                   event::FileReadyCb cb,
                                   event::FileTriggerType trigger,
                                   uint32_t events) = 0;

  virtual bool hasFileEvent() const = 0;

  /**
   * Change the monitored interest set; 0 disarms.
   */
  virtual void enableFileEvents(uint32_t events) = 0;

  /**
   * Reset file events (remove from event loop).
   */
  virtual void resetFileEvents() = 0;

  // ===== Information =====

  /**
   * Get the file descriptor.
   * Note: Should only be used for debugging/logging, not for operations.
   */
  virtual os_fd_t fd() const = 0;

  virtual IoResult<Address::InstanceConstSharedPtr> localAddress() const = 0;

  virtual IoResult<Address::InstanceConstSharedPtr> peerAddress() const = 0;

  virtual IoResult<int> setBlocking(bool blocking) = 0;
};

}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_IO_HANDLE_H
