#ifndef FTPD_NETWORK_ADDRESS_H
#define FTPD_NETWORK_ADDRESS_H

#include <array>
#include <memory>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

#include "ftpd/core/compat.h"

namespace ftpd {
namespace network {

namespace Address {

class Instance;
class Ip;
using InstanceConstSharedPtr = std::shared_ptr<const Instance>;

/**
 * Address types
 */
enum class Type {
  Ip,  // IPv4 or IPv6
};

/**
 * IP versions
 */
enum class IpVersion { v4, v6 };

/**
 * Base address interface
 */
class Instance {
 public:
  virtual ~Instance() = default;

  virtual Type type() const = 0;

  /**
   * Get the IP interface if this is an IP address.
   * @return IP interface or nullptr
   */
  virtual const Ip* ip() const { return nullptr; }

  virtual const sockaddr* sockAddr() const = 0;
  virtual socklen_t sockAddrLen() const = 0;

  /**
   * Convert to human-readable string including the port.
   */
  virtual std::string asString() const = 0;

  virtual bool operator==(const Instance& rhs) const = 0;
  bool operator!=(const Instance& rhs) const { return !(*this == rhs); }
};

/**
 * IP address interface
 */
class Ip : public Instance {
 public:
  virtual uint32_t port() const = 0;

  virtual IpVersion version() const = 0;

  /**
   * Get address as string without port.
   */
  virtual std::string addressAsString() const = 0;

  /**
   * Check if this is an any address (0.0.0.0 or ::).
   */
  virtual bool isAnyAddress() const = 0;

  virtual bool isLoopbackAddress() const = 0;

  /**
   * Get IPv4 address as uint32_t (network byte order).
   * @return Address or nullopt for IPv6
   */
  virtual optional<uint32_t> ipv4() const { return nullopt; }

  /**
   * Get IPv6 address as array.
   * @return Address or nullopt for IPv4
   */
  virtual optional<std::array<uint8_t, 16>> ipv6() const { return nullopt; }

  const Ip* ip() const override { return this; }
};

/**
 * Create an IP address from string.
 * @param address Address string ("1.2.3.4", "1.2.3.4:21", "[::1]:21", "::1")
 * @param port Default port if not in string
 * @return Address instance or nullptr on error
 */
InstanceConstSharedPtr parseInternetAddress(const std::string& address,
                                            uint16_t port = 0);

/**
 * Create an IP address from string without port.
 * @return Address instance or nullptr on error
 */
InstanceConstSharedPtr parseInternetAddressNoPort(const std::string& address,
                                                  uint16_t port = 0);

/**
 * Create an address from sockaddr. IPv4-mapped IPv6 addresses are
 * converted to IPv4 unless v6only is set.
 * @return Address instance or nullptr for unsupported families
 */
InstanceConstSharedPtr addressFromSockAddr(const sockaddr_storage& addr,
                                           socklen_t len,
                                           bool v6only = true);

/**
 * Get any address for IP version (0.0.0.0 or ::).
 */
InstanceConstSharedPtr anyAddress(IpVersion version, uint16_t port = 0);

/**
 * Get loopback address for IP version (127.0.0.1 or ::1).
 */
InstanceConstSharedPtr loopbackAddress(IpVersion version, uint16_t port = 0);

}  // namespace Address

}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_ADDRESS_H
