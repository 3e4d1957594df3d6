#ifndef FTPD_PROTOCOL_COMMAND_PARSER_H
#define FTPD_PROTOCOL_COMMAND_PARSER_H

#include <string>

#include "ftpd/core/result.h"
#include "ftpd/protocol/command.h"

namespace ftpd {
namespace protocol {

/**
 * Decodes one control line of the form "VERB [SP argument] CRLF".
 *
 * Only the first line of the input is considered; a command split across
 * two reads is not reassembled. Errors are ErrorKind::Parse with the reply
 * code to send in Error::code:
 * - 500 when the input holds no line terminator or no verb
 * - 502 for a verb outside the supported set
 * - 501 for a missing or malformed argument
 */
class CommandParser {
 public:
  explicit CommandParser(size_t max_command_length)
      : max_command_length_(max_command_length) {}

  Result<Command> parse(const std::string& input) const;

  // An input this long is fatal to the control connection and is never
  // handed to parse().
  bool exceedsLimit(size_t input_length) const {
    return input_length > max_command_length_;
  }

  size_t maxCommandLength() const { return max_command_length_; }

  static Result<HostPort> parseHostPort(const std::string& argument);

  // Inverse of parseHostPort, as used in the 227 reply
  static std::string encodeHostPort(const HostPort& host_port);

 private:
  size_t max_command_length_;
};

}  // namespace protocol
}  // namespace ftpd

#endif  // FTPD_PROTOCOL_COMMAND_PARSER_H
