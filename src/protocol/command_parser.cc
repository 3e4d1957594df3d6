#include "ftpd/protocol/command_parser.h"

#include <cctype>

#include <fmt/format.h>

#include "ftpd/protocol/reply.h"

namespace ftpd {
namespace protocol {

namespace {

struct VerbSpec {
  Verb verb;
  const char* name;
  enum { None, Optional, Required } argument;
};

constexpr VerbSpec kVerbs[] = {
    {Verb::Port, "PORT", VerbSpec::Required},
    {Verb::Pasv, "PASV", VerbSpec::None},
    {Verb::List, "LIST", VerbSpec::Optional},
    {Verb::Retr, "RETR", VerbSpec::Required},
    {Verb::Stor, "STOR", VerbSpec::Required},
    {Verb::Quit, "QUIT", VerbSpec::None},
    {Verb::User, "USER", VerbSpec::Required},
    {Verb::Pass, "PASS", VerbSpec::Optional},
    {Verb::Pwd, "PWD", VerbSpec::None},
    {Verb::Cwd, "CWD", VerbSpec::Required},
    {Verb::Mkd, "MKD", VerbSpec::Required},
    {Verb::Rmd, "RMD", VerbSpec::Required},
    {Verb::Dele, "DELE", VerbSpec::Required},
    {Verb::Rnfr, "RNFR", VerbSpec::Required},
    {Verb::Rnto, "RNTO", VerbSpec::Required},
    {Verb::Type, "TYPE", VerbSpec::Required},
    {Verb::Syst, "SYST", VerbSpec::None},
    {Verb::Noop, "NOOP", VerbSpec::None},
};

const VerbSpec* findSpec(Verb verb) {
  for (const auto& spec : kVerbs) {
    if (spec.verb == verb) {
      return &spec;
    }
  }
  return nullptr;
}

Error parseError(ReplyCode code, const std::string& message) {
  return Error(ErrorKind::Parse, message, replyCodeValue(code));
}

// Decimal 0..255 with one to three digits
bool parseOctet(const std::string& token, uint8_t& out) {
  if (token.empty() || token.size() > 3) {
    return false;
  }
  unsigned value = 0;
  for (char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  if (value > 255) {
    return false;
  }
  out = static_cast<uint8_t>(value);
  return true;
}

}  // namespace

const char* verbToString(Verb verb) {
  const VerbSpec* spec = findSpec(verb);
  return spec ? spec->name : "UNKNOWN";
}

optional<Verb> verbFromString(const std::string& token) {
  std::string upper;
  upper.reserve(token.size());
  for (char c : token) {
    upper.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  for (const auto& spec : kVerbs) {
    if (upper == spec.name) {
      return spec.verb;
    }
  }
  return nullopt;
}

Result<Command> CommandParser::parse(const std::string& input) const {
  size_t newline = input.find('\n');
  if (newline == std::string::npos) {
    return makeError<Command>(
        parseError(ReplyCode::SyntaxErrorCommand, "unterminated command line"));
  }

  // Bare LF is tolerated; CRLF is what clients send
  size_t line_end = newline;
  if (line_end > 0 && input[line_end - 1] == '\r') {
    --line_end;
  }
  std::string line = input.substr(0, line_end);

  size_t space = line.find(' ');
  std::string verb_token = line.substr(0, space);
  std::string argument =
      space == std::string::npos ? std::string() : line.substr(space + 1);

  if (verb_token.empty()) {
    return makeError<Command>(
        parseError(ReplyCode::SyntaxErrorCommand, "empty command line"));
  }

  auto verb = verbFromString(verb_token);
  if (!verb.has_value()) {
    return makeError<Command>(parseError(
        ReplyCode::NotImplemented,
        fmt::format("unsupported command '{}'", verb_token)));
  }

  const VerbSpec* spec = findSpec(*verb);
  if (spec->argument == VerbSpec::Required && argument.empty()) {
    return makeError<Command>(
        parseError(ReplyCode::SyntaxErrorArguments,
                   fmt::format("{} requires an argument", spec->name)));
  }

  Command command;
  command.verb = *verb;
  if (spec->argument != VerbSpec::None) {
    command.argument = argument;
  }

  if (command.verb == Verb::Port) {
    auto host_port = parseHostPort(command.argument);
    if (auto* error = get_if<Error>(&host_port)) {
      return makeError<Command>(*error);
    }
    command.host_port = get<HostPort>(host_port);
  }

  return makeSuccess(std::move(command));
}

Result<HostPort> CommandParser::parseHostPort(const std::string& argument) {
  uint8_t values[6];
  size_t count = 0;
  size_t start = 0;

  while (true) {
    size_t comma = argument.find(',', start);
    std::string token = argument.substr(
        start, comma == std::string::npos ? std::string::npos : comma - start);
    if (count == 6 || !parseOctet(token, values[count])) {
      return makeError<HostPort>(
          parseError(ReplyCode::SyntaxErrorArguments,
                     fmt::format("malformed host-port '{}'", argument)));
    }
    ++count;
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }

  if (count != 6) {
    return makeError<HostPort>(
        parseError(ReplyCode::SyntaxErrorArguments,
                   fmt::format("malformed host-port '{}'", argument)));
  }

  HostPort result;
  for (size_t i = 0; i < 4; ++i) {
    result.host[i] = values[i];
  }
  result.port = static_cast<uint16_t>(values[4] * 256 + values[5]);
  return makeSuccess(result);
}

std::string CommandParser::encodeHostPort(const HostPort& host_port) {
  return fmt::format("{},{},{},{},{},{}", host_port.host[0], host_port.host[1],
                     host_port.host[2], host_port.host[3],
                     host_port.port / 256, host_port.port % 256);
}

}  // namespace protocol
}  // namespace ftpd
