#ifndef FTPD_PROTOCOL_COMMAND_H
#define FTPD_PROTOCOL_COMMAND_H

#include <array>
#include <cstdint>
#include <string>

#include "ftpd/core/compat.h"

namespace ftpd {
namespace protocol {

enum class Verb {
  Port,
  Pasv,
  List,
  Retr,
  Stor,
  Quit,
  User,
  Pass,
  Pwd,
  Cwd,
  Mkd,
  Rmd,
  Dele,
  Rnfr,
  Rnto,
  Type,
  Syst,
  Noop,
};

const char* verbToString(Verb verb);

// Case-insensitive lookup of a verb token
optional<Verb> verbFromString(const std::string& token);

// Decoded "h1,h2,h3,h4,p1,p2" argument
struct HostPort {
  std::array<uint8_t, 4> host{};
  uint16_t port{0};

  bool operator==(const HostPort& other) const {
    return host == other.host && port == other.port;
  }
};

struct Command {
  Verb verb{Verb::Noop};
  std::string argument;  // Empty when the verb takes none
  optional<HostPort> host_port;  // Set for PORT only
};

}  // namespace protocol
}  // namespace ftpd

#endif  // FTPD_PROTOCOL_COMMAND_H
