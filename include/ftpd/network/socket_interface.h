#ifndef FTPD_NETWORK_SOCKET_INTERFACE_H
#define FTPD_NETWORK_SOCKET_INTERFACE_H

#include <memory>
#include <string>

#include "ftpd/core/compat.h"
#include "ftpd/network/address.h"
#include "ftpd/network/io_handle.h"

namespace ftpd {
namespace network {

enum class SocketType { Stream, Datagram };

/**
 * Factory for OS sockets and the IoHandles wrapping them.
 *
 * All sockets created here are non-blocking and close-on-exec. Accepted
 * descriptors are wrapped through ioHandleForFd() as well, so replacing the
 * process-wide interface (tests do) instruments every handle the server
 * creates.
 */
class SocketInterface {
 public:
  virtual ~SocketInterface() = default;

  /**
   * Create a new socket.
   * @param version IP version for Address::Type::Ip
   * @param socket_v6only Set IPV6_V6ONLY on IPv6 sockets
   * @return Descriptor or error
   */
  virtual IoResult<os_fd_t> socket(
      SocketType type,
      Address::Type addr_type,
      optional<Address::IpVersion> version = nullopt,
      bool socket_v6only = false) = 0;

  /**
   * Create a connected pair of local stream sockets.
   */
  virtual IoResult<int> socketPair(SocketType type, os_fd_t fds[2]) = 0;

  /**
   * Wrap an existing descriptor. The handle takes ownership.
   */
  virtual IoHandlePtr ioHandleForFd(os_fd_t fd, bool socket_v6only = false) = 0;

  virtual const std::string& platformName() const = 0;
};

using SocketInterfacePtr = std::unique_ptr<SocketInterface>;

/**
 * Get the process-wide socket interface, creating the default on first use.
 */
SocketInterface& socketInterface();

/**
 * Replace the process-wide socket interface.
 */
void setSocketInterface(SocketInterfacePtr interface);

/**
 * Restore the default socket interface on next use.
 */
void resetSocketInterface();

SocketInterfacePtr createDefaultSocketInterface();

/**
 * Create a stream socket bound to address and listening.
 * SO_REUSEADDR is set before binding.
 */
IoResult<IoHandlePtr> createListeningHandle(
    const Address::InstanceConstSharedPtr& address, int backlog);

/**
 * Create a stream socket for the address family of address, unconnected.
 */
IoResult<IoHandlePtr> createStreamHandle(
    const Address::InstanceConstSharedPtr& address);

}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_SOCKET_INTERFACE_H
