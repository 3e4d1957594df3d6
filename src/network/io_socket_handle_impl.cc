#include "ftpd/network/io_socket_handle_impl.h"

#include <algorithm>
#include <cstring>
#include <vector>

#include <errno.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include "ftpd/network/socket_interface.h"

namespace ftpd {
namespace network {

namespace {

// Maximum number of iovecs for vectored I/O
#ifdef IOV_MAX
constexpr size_t MAX_IOV = IOV_MAX;
#else
constexpr size_t MAX_IOV = 1024;
#endif

}  // namespace

IoSocketHandleImpl::IoSocketHandleImpl(os_fd_t fd, bool socket_v6only)
    : fd_(fd), socket_v6only_(socket_v6only) {
  if (fd_ != INVALID_SOCKET_FD) {
    setNonBlocking();
  }
}

IoSocketHandleImpl::~IoSocketHandleImpl() {
  if (isOpen()) {
    close();
  }
}

void IoSocketHandleImpl::setNonBlocking() {
  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags != -1) {
    ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
  }
}

IoCallResult IoSocketHandleImpl::readv(size_t max_length,
                                       RawSlice* slices,
                                       size_t num_slices) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF);
  }

  // Clip the slices to max_length
  std::vector<iovec> iov;
  size_t bytes_to_read = 0;
  for (size_t i = 0; i < num_slices && bytes_to_read < max_length &&
                     iov.size() < MAX_IOV;
       ++i) {
    size_t slice_len = std::min(slices[i].len_, max_length - bytes_to_read);
    if (slice_len > 0) {
      iov.push_back(iovec{slices[i].mem_, slice_len});
      bytes_to_read += slice_len;
    }
  }

  if (iov.empty()) {
    return IoCallResult::success(0);
  }

  ssize_t result;
  if (iov.size() == 1) {
    // read() rather than recv() so that pipes work too
    result = ::read(fd_, iov[0].iov_base, iov[0].iov_len);
  } else {
    result = ::readv(fd_, iov.data(), static_cast<int>(iov.size()));
  }

  if (result >= 0) {
    return IoCallResult::success(static_cast<size_t>(result));
  }
  return IoCallResult::error(errno);
}

IoCallResult IoSocketHandleImpl::writev(const ConstRawSlice* slices,
                                        size_t num_slices) {
  if (!isOpen()) {
    return IoCallResult::error(EBADF);
  }

  if (num_slices == 0) {
    return IoCallResult::success(0);
  }

  num_slices = std::min(num_slices, MAX_IOV);

  std::vector<iovec> iov(num_slices);
  for (size_t i = 0; i < num_slices; ++i) {
    iov[i].iov_base = const_cast<void*>(slices[i].mem_);
    iov[i].iov_len = slices[i].len_;
  }

  // sendmsg with MSG_NOSIGNAL so a vanished peer yields EPIPE instead of a
  // signal; pipes fall back to plain writev
  msghdr msg;
  std::memset(&msg, 0, sizeof(msg));
  msg.msg_iov = iov.data();
  msg.msg_iovlen = num_slices;

  ssize_t result = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
  if (result < 0 && errno == ENOTSOCK) {
    result = ::writev(fd_, iov.data(), static_cast<int>(num_slices));
  }

  if (result >= 0) {
    return IoCallResult::success(static_cast<size_t>(result));
  }
  return IoCallResult::error(errno);
}

IoVoidResult IoSocketHandleImpl::close() {
  if (!isOpen()) {
    return IoVoidResult::success();
  }

  // Reset file events first
  resetFileEvents();

  int result = ::close(fd_);
  int err = errno;
  fd_ = INVALID_SOCKET_FD;

  if (result == 0) {
    return IoVoidResult::success();
  }
  return IoVoidResult::error(err);
}

IoResult<int> IoSocketHandleImpl::bind(
    const Address::InstanceConstSharedPtr& address) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }
  if (!address) {
    return IoResult<int>::error(EINVAL);
  }

  if (::bind(fd_, address->sockAddr(), address->sockAddrLen()) == 0) {
    return IoResult<int>::success(0);
  }
  return IoResult<int>::error(errno);
}

IoResult<int> IoSocketHandleImpl::listen(int backlog) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }

  if (::listen(fd_, backlog) == 0) {
    return IoResult<int>::success(0);
  }
  return IoResult<int>::error(errno);
}

IoResult<IoHandlePtr> IoSocketHandleImpl::accept() {
  if (!isOpen()) {
    return IoResult<IoHandlePtr>::error(EBADF);
  }

  sockaddr_storage addr;
  socklen_t addr_len = sizeof(addr);

  int new_fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len,
                         SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (new_fd != -1) {
    return IoResult<IoHandlePtr>::success(
        socketInterface().ioHandleForFd(new_fd, socket_v6only_));
  }
  return IoResult<IoHandlePtr>::error(errno);
}

IoResult<int> IoSocketHandleImpl::connect(
    const Address::InstanceConstSharedPtr& address) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }
  if (!address) {
    return IoResult<int>::error(EINVAL);
  }

  int result = ::connect(fd_, address->sockAddr(), address->sockAddrLen());
  if (result == 0) {
    return IoResult<int>::success(0);
  }

  int error = errno;
  // Normalize so callers only need to check EINPROGRESS
  if (error == EINPROGRESS || error == EAGAIN) {
    return IoResult<int>::error(EINPROGRESS);
  }
  return IoResult<int>::error(error);
}

IoResult<int> IoSocketHandleImpl::shutdown(int how) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }

  if (::shutdown(fd_, how) == 0) {
    return IoResult<int>::success(0);
  }
  return IoResult<int>::error(errno);
}

IoResult<int> IoSocketHandleImpl::setSocketOption(int level,
                                                  int optname,
                                                  const void* optval,
                                                  socklen_t optlen) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }

  if (::setsockopt(fd_, level, optname, optval, optlen) == 0) {
    return IoResult<int>::success(0);
  }
  return IoResult<int>::error(errno);
}

void IoSocketHandleImpl::initializeFileEvent(event::Dispatcher& dispatcher,
                                             event::FileReadyCb cb,
                                             event::FileTriggerType trigger,
                                             uint32_t events) {
  if (!isOpen()) {
    return;
  }

  file_event_ = dispatcher.createFileEvent(fd_, std::move(cb), trigger, events);
}

void IoSocketHandleImpl::enableFileEvents(uint32_t events) {
  if (file_event_) {
    file_event_->setEnabled(events);
  }
}

void IoSocketHandleImpl::resetFileEvents() { file_event_.reset(); }

IoResult<Address::InstanceConstSharedPtr> IoSocketHandleImpl::localAddress()
    const {
  if (!isOpen()) {
    return IoResult<Address::InstanceConstSharedPtr>::error(EBADF);
  }

  sockaddr_storage addr;
  socklen_t addr_len = sizeof(addr);

  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0) {
    return IoResult<Address::InstanceConstSharedPtr>::success(
        Address::addressFromSockAddr(addr, addr_len, socket_v6only_));
  }
  return IoResult<Address::InstanceConstSharedPtr>::error(errno);
}

IoResult<Address::InstanceConstSharedPtr> IoSocketHandleImpl::peerAddress()
    const {
  if (!isOpen()) {
    return IoResult<Address::InstanceConstSharedPtr>::error(EBADF);
  }

  sockaddr_storage addr;
  socklen_t addr_len = sizeof(addr);

  if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0) {
    return IoResult<Address::InstanceConstSharedPtr>::success(
        Address::addressFromSockAddr(addr, addr_len, socket_v6only_));
  }
  return IoResult<Address::InstanceConstSharedPtr>::error(errno);
}

IoResult<int> IoSocketHandleImpl::setBlocking(bool blocking) {
  if (!isOpen()) {
    return IoResult<int>::error(EBADF);
  }

  int flags = ::fcntl(fd_, F_GETFL, 0);
  if (flags == -1) {
    return IoResult<int>::error(errno);
  }

  if (blocking) {
    flags &= ~O_NONBLOCK;
  } else {
    flags |= O_NONBLOCK;
  }

  if (::fcntl(fd_, F_SETFL, flags) == 0) {
    return IoResult<int>::success(0);
  }
  return IoResult<int>::error(errno);
}

}  // namespace network
}  // namespace ftpd
