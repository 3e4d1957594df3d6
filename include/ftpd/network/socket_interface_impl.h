#ifndef FTPD_NETWORK_SOCKET_INTERFACE_IMPL_H
#define FTPD_NETWORK_SOCKET_INTERFACE_IMPL_H

#include "ftpd/network/socket_interface.h"

namespace ftpd {
namespace network {

/**
 * Default socket interface implementation over BSD sockets.
 */
class SocketInterfaceImpl : public SocketInterface {
 public:
  SocketInterfaceImpl() = default;
  ~SocketInterfaceImpl() override = default;

  IoResult<os_fd_t> socket(SocketType type,
                           Address::Type addr_type,
                           optional<Address::IpVersion> version = nullopt,
                           bool socket_v6only = false) override;

  IoResult<int> socketPair(SocketType type, os_fd_t fds[2]) override;

  IoHandlePtr ioHandleForFd(os_fd_t fd, bool socket_v6only = false) override;

  const std::string& platformName() const override;
};

}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_SOCKET_INTERFACE_IMPL_H
