#ifndef FTPD_NETWORK_ADDRESS_IMPL_H
#define FTPD_NETWORK_ADDRESS_IMPL_H

#include <array>

#include "ftpd/network/address.h"

namespace ftpd {
namespace network {
namespace Address {

/**
 * IPv4 address implementation
 */
class Ipv4Instance : public Ip {
 public:
  explicit Ipv4Instance(const sockaddr_in* address);
  // Throws std::invalid_argument if address is not a dotted quad
  Ipv4Instance(const std::string& address, uint16_t port = 0);
  // Octets in wire order, as carried by a PORT argument
  Ipv4Instance(const std::array<uint8_t, 4>& octets, uint16_t port);

  // Instance interface
  Type type() const override { return Type::Ip; }
  const sockaddr* sockAddr() const override {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  socklen_t sockAddrLen() const override { return sizeof(addr_); }
  std::string asString() const override;
  bool operator==(const Instance& rhs) const override;

  // Ip interface
  uint32_t port() const override { return ntohs(addr_.sin_port); }
  IpVersion version() const override { return IpVersion::v4; }
  std::string addressAsString() const override;
  bool isAnyAddress() const override;
  bool isLoopbackAddress() const override;
  optional<uint32_t> ipv4() const override { return addr_.sin_addr.s_addr; }

  std::array<uint8_t, 4> octets() const;

 private:
  sockaddr_in addr_;
};

/**
 * IPv6 address implementation
 */
class Ipv6Instance : public Ip {
 public:
  explicit Ipv6Instance(const sockaddr_in6* address);
  // Throws std::invalid_argument if address is not valid IPv6 text
  Ipv6Instance(const std::string& address, uint16_t port = 0);

  // Instance interface
  Type type() const override { return Type::Ip; }
  const sockaddr* sockAddr() const override {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  socklen_t sockAddrLen() const override { return sizeof(addr_); }
  std::string asString() const override;
  bool operator==(const Instance& rhs) const override;

  // Ip interface
  uint32_t port() const override { return ntohs(addr_.sin6_port); }
  IpVersion version() const override { return IpVersion::v6; }
  std::string addressAsString() const override;
  bool isAnyAddress() const override;
  bool isLoopbackAddress() const override;
  optional<std::array<uint8_t, 16>> ipv6() const override;

 private:
  sockaddr_in6 addr_;
};

}  // namespace Address
}  // namespace network
}  // namespace ftpd

#endif  // FTPD_NETWORK_ADDRESS_IMPL_H
