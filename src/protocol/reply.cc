#include "ftpd/protocol/reply.h"

#include <fmt/format.h>

namespace ftpd {
namespace protocol {

const char* defaultReplyText(ReplyCode code) {
  switch (code) {
    case ReplyCode::FileStatusOkay:
      return "File status okay; about to open data connection.";
    case ReplyCode::CommandOkay:
      return "Command okay.";
    case ReplyCode::SystemType:
      return "UNIX Type: L8";
    case ReplyCode::ServiceReady:
      return "Service ready for new user.";
    case ReplyCode::ServiceClosingControl:
      return "Service closing control connection.";
    case ReplyCode::ClosingDataConnection:
      return "Closing data connection. Requested file action successful (for "
             "example, file transfer or file abort).";
    case ReplyCode::EnteringPassiveMode:
      return "Entering Passive Mode.";
    case ReplyCode::UserLoggedIn:
      return "User logged in, proceed.";
    case ReplyCode::FileActionOkay:
      return "Requested file action okay, completed.";
    case ReplyCode::PathCreated:
      return "";
    case ReplyCode::UserNameOkay:
      return "User name okay, need password.";
    case ReplyCode::FileActionPending:
      return "Requested file action pending further information.";
    case ReplyCode::TooManyUsers:
      return "Too many users, closing control connection.";
    case ReplyCode::CantOpenDataConnection:
      return "Can't open data connection.";
    case ReplyCode::TransferAborted:
      return "Connection closed; transfer aborted.";
    case ReplyCode::SyntaxErrorCommand:
      return "Syntax error, command unrecognized.";
    case ReplyCode::SyntaxErrorArguments:
      return "Syntax error in parameters or arguments.";
    case ReplyCode::NotImplemented:
      return "Command not implemented.";
    case ReplyCode::BadSequence:
      return "Bad sequence of commands.";
    case ReplyCode::FileUnavailable:
      return "Requested action not taken. File unavailable.";
  }
  return "";
}

std::string formatReply(ReplyCode code, const std::string& message) {
  return formatReply(replyCodeValue(code), message);
}

std::string formatReply(ReplyCode code) {
  return formatReply(code, defaultReplyText(code));
}

std::string formatReply(int code, const std::string& message) {
  return fmt::format("{:03d} {}\r\n", code, message);
}

}  // namespace protocol
}  // namespace ftpd
