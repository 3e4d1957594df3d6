#include "ftpd/network/address_impl.h"

#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>

namespace ftpd {
namespace network {
namespace Address {

namespace {

bool isInRange(uint32_t addr, uint32_t base, uint32_t mask) {
  return (ntohl(addr) & mask) == base;
}

bool parsePort(const std::string& text, uint16_t& port) {
  if (text.empty() || text.size() > 5) {
    return false;
  }
  uint32_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

// ===== IPv4 Implementation =====

Ipv4Instance::Ipv4Instance(const sockaddr_in* address) {
  std::memset(&addr_, 0, sizeof(addr_));
  std::memcpy(&addr_, address, sizeof(sockaddr_in));
}

Ipv4Instance::Ipv4Instance(const std::string& address, uint16_t port) {
  std::memset(&addr_, 0, sizeof(addr_));
  addr_.sin_family = AF_INET;
  addr_.sin_port = htons(port);

  if (::inet_pton(AF_INET, address.c_str(), &addr_.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 address: " + address);
  }
}

Ipv4Instance::Ipv4Instance(const std::array<uint8_t, 4>& octets,
                           uint16_t port) {
  std::memset(&addr_, 0, sizeof(addr_));
  addr_.sin_family = AF_INET;
  addr_.sin_port = htons(port);
  std::memcpy(&addr_.sin_addr, octets.data(), octets.size());
}

std::string Ipv4Instance::asString() const {
  return addressAsString() + ":" + std::to_string(port());
}

std::string Ipv4Instance::addressAsString() const {
  char buffer[INET_ADDRSTRLEN];
  if (::inet_ntop(AF_INET, &addr_.sin_addr, buffer, sizeof(buffer)) !=
      nullptr) {
    return buffer;
  }
  return "";
}

bool Ipv4Instance::operator==(const Instance& rhs) const {
  const Ip* other_ip = rhs.ip();
  if (!other_ip || other_ip->version() != IpVersion::v4) {
    return false;
  }

  auto other_v4 = other_ip->ipv4();
  return other_v4.has_value() && addr_.sin_addr.s_addr == *other_v4 &&
         port() == other_ip->port();
}

bool Ipv4Instance::isAnyAddress() const {
  return addr_.sin_addr.s_addr == INADDR_ANY;
}

bool Ipv4Instance::isLoopbackAddress() const {
  // 127.0.0.0/8
  return isInRange(addr_.sin_addr.s_addr, 0x7F000000, 0xFF000000);
}

std::array<uint8_t, 4> Ipv4Instance::octets() const {
  std::array<uint8_t, 4> result;
  std::memcpy(result.data(), &addr_.sin_addr, result.size());
  return result;
}

// ===== IPv6 Implementation =====

Ipv6Instance::Ipv6Instance(const sockaddr_in6* address) {
  std::memset(&addr_, 0, sizeof(addr_));
  std::memcpy(&addr_, address, sizeof(sockaddr_in6));
}

Ipv6Instance::Ipv6Instance(const std::string& address, uint16_t port) {
  std::memset(&addr_, 0, sizeof(addr_));
  addr_.sin6_family = AF_INET6;
  addr_.sin6_port = htons(port);

  if (::inet_pton(AF_INET6, address.c_str(), &addr_.sin6_addr) != 1) {
    throw std::invalid_argument("Invalid IPv6 address: " + address);
  }
}

std::string Ipv6Instance::asString() const {
  return "[" + addressAsString() + "]:" + std::to_string(port());
}

std::string Ipv6Instance::addressAsString() const {
  char buffer[INET6_ADDRSTRLEN];
  if (::inet_ntop(AF_INET6, &addr_.sin6_addr, buffer, sizeof(buffer)) !=
      nullptr) {
    return buffer;
  }
  return "";
}

bool Ipv6Instance::operator==(const Instance& rhs) const {
  const Ip* other_ip = rhs.ip();
  if (!other_ip || other_ip->version() != IpVersion::v6) {
    return false;
  }

  auto other_v6 = other_ip->ipv6();
  if (!other_v6.has_value()) {
    return false;
  }

  return std::memcmp(&addr_.sin6_addr, other_v6->data(), sizeof(in6_addr)) ==
             0 &&
         port() == other_ip->port();
}

bool Ipv6Instance::isAnyAddress() const {
  return IN6_IS_ADDR_UNSPECIFIED(&addr_.sin6_addr);
}

bool Ipv6Instance::isLoopbackAddress() const {
  return IN6_IS_ADDR_LOOPBACK(&addr_.sin6_addr);
}

optional<std::array<uint8_t, 16>> Ipv6Instance::ipv6() const {
  std::array<uint8_t, 16> result;
  std::memcpy(result.data(), &addr_.sin6_addr, 16);
  return result;
}

// ===== Factory Functions =====

InstanceConstSharedPtr parseInternetAddress(const std::string& address,
                                            uint16_t default_port) {
  if (!address.empty() && address.front() == '[') {
    // [IPv6]:port format
    size_t bracket_pos = address.find(']');
    if (bracket_pos == std::string::npos) {
      return nullptr;
    }
    std::string addr_part = address.substr(1, bracket_pos - 1);
    uint16_t port = default_port;
    if (bracket_pos + 1 < address.size()) {
      if (address[bracket_pos + 1] != ':' ||
          !parsePort(address.substr(bracket_pos + 2), port)) {
        return nullptr;
      }
    }
    return parseInternetAddressNoPort(addr_part, port);
  }

  size_t first_colon = address.find(':');
  if (first_colon != std::string::npos &&
      first_colon == address.rfind(':')) {
    // IPv4:port format
    uint16_t port = 0;
    if (!parsePort(address.substr(first_colon + 1), port)) {
      return nullptr;
    }
    return parseInternetAddressNoPort(address.substr(0, first_colon), port);
  }

  // Bare IPv4 or IPv6 without port
  return parseInternetAddressNoPort(address, default_port);
}

InstanceConstSharedPtr parseInternetAddressNoPort(const std::string& address,
                                                  uint16_t port) {
  in_addr v4;
  if (::inet_pton(AF_INET, address.c_str(), &v4) == 1) {
    return std::make_shared<Ipv4Instance>(address, port);
  }

  in6_addr v6;
  if (::inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
    return std::make_shared<Ipv6Instance>(address, port);
  }

  return nullptr;
}

InstanceConstSharedPtr addressFromSockAddr(const sockaddr_storage& addr,
                                           socklen_t len,
                                           bool v6only) {
  switch (addr.ss_family) {
    case AF_INET:
      if (len >= sizeof(sockaddr_in)) {
        return std::make_shared<Ipv4Instance>(
            reinterpret_cast<const sockaddr_in*>(&addr));
      }
      break;

    case AF_INET6:
      if (len >= sizeof(sockaddr_in6)) {
        const auto* addr6 = reinterpret_cast<const sockaddr_in6*>(&addr);

        if (!v6only && IN6_IS_ADDR_V4MAPPED(&addr6->sin6_addr)) {
          sockaddr_in addr4;
          std::memset(&addr4, 0, sizeof(addr4));
          addr4.sin_family = AF_INET;
          addr4.sin_port = addr6->sin6_port;
          std::memcpy(&addr4.sin_addr, &addr6->sin6_addr.s6_addr[12], 4);
          return std::make_shared<Ipv4Instance>(&addr4);
        }

        return std::make_shared<Ipv6Instance>(addr6);
      }
      break;
  }

  return nullptr;
}

InstanceConstSharedPtr anyAddress(IpVersion version, uint16_t port) {
  if (version == IpVersion::v4) {
    return std::make_shared<Ipv4Instance>("0.0.0.0", port);
  }
  return std::make_shared<Ipv6Instance>("::", port);
}

InstanceConstSharedPtr loopbackAddress(IpVersion version, uint16_t port) {
  if (version == IpVersion::v4) {
    return std::make_shared<Ipv4Instance>("127.0.0.1", port);
  }
  return std::make_shared<Ipv6Instance>("::1", port);
}

}  // namespace Address
}  // namespace network
}  // namespace ftpd
