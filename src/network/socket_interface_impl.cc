#include "ftpd/network/socket_interface_impl.h"

#include <mutex>

#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "ftpd/network/io_socket_handle_impl.h"

#define FTPD_LOG_COMPONENT "Network.socket"
#include "ftpd/logging/log_macros.h"

namespace ftpd {
namespace network {

namespace {

std::mutex g_socket_interface_mutex;
SocketInterfacePtr g_socket_interface;

int socketTypeToInt(SocketType type) {
  switch (type) {
    case SocketType::Stream:
      return SOCK_STREAM;
    case SocketType::Datagram:
      return SOCK_DGRAM;
  }
  return -1;
}

int addressTypeToDomain(Address::Type addr_type,
                        optional<Address::IpVersion> version) {
  switch (addr_type) {
    case Address::Type::Ip:
      if (version.has_value() && *version == Address::IpVersion::v6) {
        return AF_INET6;
      }
      return AF_INET;
  }
  return -1;
}

}  // namespace

IoResult<os_fd_t> SocketInterfaceImpl::socket(
    SocketType type,
    Address::Type addr_type,
    optional<Address::IpVersion> version,
    bool socket_v6only) {
  int domain = addressTypeToDomain(addr_type, version);
  if (domain < 0) {
    return IoResult<os_fd_t>::error(EAFNOSUPPORT);
  }

  int sock_type = socketTypeToInt(type);
  if (sock_type < 0) {
    return IoResult<os_fd_t>::error(EINVAL);
  }

  sock_type |= SOCK_CLOEXEC | SOCK_NONBLOCK;

  os_fd_t fd = ::socket(domain, sock_type, 0);
  if (fd == INVALID_SOCKET_FD) {
    int err = errno;
    FTPD_LOG_DEBUG("::socket() failed: {}", err);
    return IoResult<os_fd_t>::error(err);
  }

  if (socket_v6only && domain == AF_INET6) {
    int opt = 1;
    if (::setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &opt, sizeof(opt)) != 0) {
      FTPD_LOG_WARNING("failed to set IPV6_V6ONLY on fd={}: {}", fd, errno);
    }
  }

  return IoResult<os_fd_t>::success(fd);
}

IoResult<int> SocketInterfaceImpl::socketPair(SocketType type,
                                              os_fd_t fds[2]) {
  int sock_type = socketTypeToInt(type);
  if (sock_type < 0) {
    return IoResult<int>::error(EINVAL);
  }

  if (::socketpair(AF_UNIX, sock_type | SOCK_CLOEXEC | SOCK_NONBLOCK, 0,
                   fds) != 0) {
    return IoResult<int>::error(errno);
  }
  return IoResult<int>::success(0);
}

IoHandlePtr SocketInterfaceImpl::ioHandleForFd(os_fd_t fd,
                                               bool socket_v6only) {
  return std::make_unique<IoSocketHandleImpl>(fd, socket_v6only);
}

const std::string& SocketInterfaceImpl::platformName() const {
  static const std::string name = "posix";
  return name;
}

// ===== Global Functions =====

SocketInterface& socketInterface() {
  std::lock_guard<std::mutex> lock(g_socket_interface_mutex);
  if (!g_socket_interface) {
    g_socket_interface = createDefaultSocketInterface();
  }
  return *g_socket_interface;
}

void setSocketInterface(SocketInterfacePtr iface) {
  std::lock_guard<std::mutex> lock(g_socket_interface_mutex);
  g_socket_interface = std::move(iface);
}

void resetSocketInterface() {
  std::lock_guard<std::mutex> lock(g_socket_interface_mutex);
  g_socket_interface.reset();
}

SocketInterfacePtr createDefaultSocketInterface() {
  return std::make_unique<SocketInterfaceImpl>();
}

IoResult<IoHandlePtr> createStreamHandle(
    const Address::InstanceConstSharedPtr& address) {
  if (!address || !address->ip()) {
    return IoResult<IoHandlePtr>::error(EAFNOSUPPORT);
  }

  auto& iface = socketInterface();
  auto fd = iface.socket(SocketType::Stream, Address::Type::Ip,
                         address->ip()->version());
  if (!fd.ok()) {
    return IoResult<IoHandlePtr>::error(fd.error_code());
  }
  return IoResult<IoHandlePtr>::success(iface.ioHandleForFd(*fd));
}

IoResult<IoHandlePtr> createListeningHandle(
    const Address::InstanceConstSharedPtr& address, int backlog) {
  auto handle = createStreamHandle(address);
  if (!handle.ok()) {
    return handle;
  }

  int reuse = 1;
  auto opt = (*handle)->setSocketOption(SOL_SOCKET, SO_REUSEADDR, &reuse,
                                        sizeof(reuse));
  if (!opt.ok()) {
    return IoResult<IoHandlePtr>::error(opt.error_code());
  }

  auto bound = (*handle)->bind(address);
  if (!bound.ok()) {
    return IoResult<IoHandlePtr>::error(bound.error_code());
  }

  auto listening = (*handle)->listen(backlog);
  if (!listening.ok()) {
    return IoResult<IoHandlePtr>::error(listening.error_code());
  }

  return handle;
}

}  // namespace network
}  // namespace ftpd
