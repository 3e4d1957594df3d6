#ifndef FTPD_NETWORK_IO_SOCKET_HANDLE_IMPL_H
#define FTPD_NETWORK_IO_SOCKET_HANDLE_IMPL_H

#include "ftpd/event/event_loop.h"
#include "ftpd/network/io_handle.h"

namespace ftpd {
namespace network {

/**
 * Standard implementation of IoHandle for POSIX sockets.
 *
 * Descriptors handed to the constructor are switched to non-blocking mode.
 * Plain pipes are accepted as well, which keeps socket pairs and pipes
 * usable in tests.
 */
class IoSocketHandleImpl : public IoHandle {
 public:
  explicit IoSocketHandleImpl(os_fd_t fd = INVALID_SOCKET_FD,
                              bool socket_v6only = false);
  ~IoSocketHandleImpl() override;

  // Disable copy
  IoSocketHandleImpl(const IoSocketHandleImpl&) = delete;
  IoSocketHandleImpl& operator=(const IoSocketHandleImpl&) = delete;

  // IoHandle interface
  IoCallResult readv(size_t max_length,
                     RawSlice* slices,
                     size_t num_slices) override;
  IoCallResult writev(const ConstRawSlice* slices, size_t num_slices) override;

  IoVoidResult close() override;
  bool isOpen() const override { return fd_ != INVALID_SOCKET_FD; }

  IoResult<int> bind(const Address::InstanceConstSharedPtr& address) override;
  IoResult<int> listen(int backlog) override;
  IoResult<IoHandlePtr> accept() override;
  IoResult<int> connect(
      const Address::InstanceConstSharedPtr& address) override;
  IoResult<int> shutdown(int how) override;

  IoResult<int> setSocketOption(int level,
                                int optname,
                                const void* optval,
                                socklen_t optlen) override;

  void initializeFileEvent(event::Dispatcher& dispatcher,
                           event::FileReadyCb cb,
                           event::FileTriggerType trigger,
                           uint32_t events) override;
  bool hasFileEvent() const override { return file_event_ != nullptr; }
  void enableFileEvents(uint32_t events) override;
  void resetFileEvents() override;

  os_fd_t fd() const override { return fd_; }

  IoResult<Address::InstanceConstSharedPtr> localAddress() const override;
  IoResult<Address::InstanceConstSharedPtr> peerAddress() const override;

  IoResult<int> setBlocking(bool blocking) override;

 protected:
  void setNonBlocking();

  os_fd_t fd_;
  bool socket_v6only_;
  event::FileEventPtr file_event_;
};

}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_IO_SOCKET_HANDLE_IMPL_H
