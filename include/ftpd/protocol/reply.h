#ifndef FTPD_PROTOCOL_REPLY_H
#define FTPD_PROTOCOL_REPLY_H

#include <string>

namespace ftpd {
namespace protocol {

// Reply codes used by the server
enum class ReplyCode : int {
  FileStatusOkay = 150,
  CommandOkay = 200,
  SystemType = 215,
  ServiceReady = 220,
  ServiceClosingControl = 221,
  ClosingDataConnection = 226,
  EnteringPassiveMode = 227,
  UserLoggedIn = 230,
  FileActionOkay = 250,
  PathCreated = 257,
  UserNameOkay = 331,
  FileActionPending = 350,
  TooManyUsers = 421,
  CantOpenDataConnection = 425,
  TransferAborted = 426,
  SyntaxErrorCommand = 500,
  SyntaxErrorArguments = 501,
  NotImplemented = 502,
  BadSequence = 503,
  FileUnavailable = 550,
};

inline int replyCodeValue(ReplyCode code) { return static_cast<int>(code); }

// Standard text for a code. PathCreated has no fixed text and yields "".
const char* defaultReplyText(ReplyCode code);

// "<3-digit-code> <message>\r\n"
std::string formatReply(ReplyCode code, const std::string& message);
std::string formatReply(ReplyCode code);

// Same as formatReply for a numeric code taken from a parse error
std::string formatReply(int code, const std::string& message);

}  // namespace protocol
}  // namespace ftpd

#endif  // FTPD_PROTOCOL_REPLY_H
