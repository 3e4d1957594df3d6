#define FTPD_LOG_COMPONENT "Server.connection"

#include "ftpd/server/connection_state_machine.h"

#include <sys/socket.h>
#include <sys/time.h>

#include <utility>

#include <fmt/format.h>

#include "ftpd/logging/log_macros.h"
#include "ftpd/network/address_impl.h"
#include "ftpd/network/socket_interface.h"

namespace ftpd {
namespace server {

using protocol::Command;
using protocol::DeferredAction;
using protocol::ReplyCode;
using protocol::Verb;

namespace {

constexpr uint32_t kRead = static_cast<uint32_t>(event::FileReadyType::Read);
constexpr uint32_t kWrite = static_cast<uint32_t>(event::FileReadyType::Write);

std::string defaultText(ReplyCode code) {
  return protocol::defaultReplyText(code);
}

bool validUserName(const std::string& user) {
  return !user.empty() && user != "." && user != ".." &&
         user.find('/') == std::string::npos;
}

// LIST accepts ls-style flags from common clients; they are not a path
std::string listTarget(const std::string& argument) {
  if (argument.empty() || argument[0] == '-') {
    return ".";
  }
  return argument;
}

}  // namespace

ConnectionStateMachine::ConnectionStateMachine(
    Reactor& reactor,
    ConnectionRegistry& registry,
    fs::FileSystemSharedPtr file_system,
    fs::SessionRoot base_root,
    StateMachineOptions options)
    : reactor_(reactor),
      registry_(registry),
      file_system_(std::move(file_system)),
      base_root_(std::move(base_root)),
      options_(std::move(options)),
      parser_(options_.max_command_length),
      engine_(options_.transfer_chunk_size),
      read_buffer_(options_.max_command_length + 1) {}

// ===== Helpers =====

void ConnectionStateMachine::schedule(ReactorAction::Kind kind,
                                      ConnectionId id,
                                      uint32_t events) {
  reactor_.submit(ReactorAction{kind, id, events});
}

network::IoHandle* ConnectionStateMachine::socketOf(ConnectionId id) {
  auto socket = registry_.withConnection(id, [](Connection& connection) {
    return &connectionSocket(connection);
  });
  return socket ? *socket : nullptr;
}

void ConnectionStateMachine::reply(ConnectionId id,
                                   ReplyCode code,
                                   const std::string& message) {
  bool found = registry_.withConnection(id, [&](Connection& connection) {
    if (auto* control = get_if<ControlChannel>(&connection)) {
      control->pending_response.append(code, message);
    }
  });
  if (found) {
    schedule(ReactorAction::Kind::Rearm, id, kWrite);
  }
}

bool ConnectionStateMachine::transferActive(ConnectionId id) {
  auto active = registry_.withConnection(id, [](Connection& connection) {
    return visit(overloaded{
                     [](DataChannel& data) {
                       return !transfer::isIdle(data.transfer);
                     },
                     [](PassiveListener& listener) {
                       return !transfer::isIdle(listener.pending);
                     },
                     [](ControlChannel&) { return false; },
                 },
                 connection);
  });
  return active.value_or(false);
}

void ConnectionStateMachine::releaseData(ConnectionId owner,
                                         ConnectionId data_id) {
  auto running = registry_.withConnection(data_id, [](Connection& connection) {
    return visit(overloaded{
                     [](DataChannel& data) {
                       return !transfer::isIdle(data.transfer);
                     },
                     [](PassiveListener&) { return false; },
                     [](ControlChannel&) { return false; },
                 },
                 connection);
  });
  if (running && *running) {
    FTPD_CONN_LOG_INFO(owner, "control: data connection {} unlinked mid-transfer",
                       data_id);
    return;
  }
  schedule(ReactorAction::Kind::Close, data_id);
}

// ===== Accept =====

ConnectionId ConnectionStateMachine::acceptControl(
    network::IoHandlePtr socket) {
  std::string peer = "unknown";
  auto peer_address = socket->peerAddress();
  if (peer_address.ok() && *peer_address) {
    peer = (*peer_address)->asString();
  }

  ControlChannel control(std::move(socket), base_root_);
  control.pending_response.reset(ReplyCode::ServiceReady);
  ConnectionId id = registry_.insert(Connection(std::move(control)));

  FTPD_CONN_LOG_INFO(id, "control: accepted from {}", peer);
  schedule(ReactorAction::Kind::Register, id, kWrite);
  return id;
}

// ===== Dispatch =====

void ConnectionStateMachine::onReady(ConnectionId id, uint32_t events) {
  enum class Role { Missing, Control, Listener, Data };

  auto role = registry_.withConnection(id, [](Connection& connection) {
    return visit(overloaded{
                     [](ControlChannel&) { return Role::Control; },
                     [](PassiveListener&) { return Role::Listener; },
                     [](DataChannel&) { return Role::Data; },
                 },
                 connection);
  });

  switch (role.value_or(Role::Missing)) {
    case Role::Missing:
      return;
    case Role::Control:
      if (events & kWrite) {
        onControlWritable(id);
      } else if (events & kRead) {
        onControlReadable(id);
      }
      return;
    case Role::Listener:
      onListenerReadable(id);
      return;
    case Role::Data:
      onDataReady(id, events);
      return;
  }
}

// ===== Control channel =====

void ConnectionStateMachine::onControlReadable(ConnectionId id) {
  network::IoHandle* socket = socketOf(id);
  if (socket == nullptr) {
    return;
  }

  network::RawSlice slice{read_buffer_.data(), read_buffer_.size()};
  auto result = socket->readv(read_buffer_.size(), &slice, 1);
  if (!result.ok()) {
    if (result.wouldBlock()) {
      return;
    }
    FTPD_CONN_LOG_ERROR(id, "control: IoError: read: {}",
                        result.error_message());
    socket->enableFileEvents(0);
    schedule(ReactorAction::Kind::Close, id);
    return;
  }

  // Reading resumes once the reply to this command is flushed
  socket->enableFileEvents(0);

  if (*result == 0) {
    FTPD_CONN_LOG_INFO(id, "control: closed by peer");
    schedule(ReactorAction::Kind::Close, id);
    return;
  }
  if (parser_.exceedsLimit(*result)) {
    FTPD_CONN_LOG_WARNING(id, "control: command line exceeds {} bytes, closing",
                          parser_.maxCommandLength());
    schedule(ReactorAction::Kind::Close, id);
    return;
  }

  std::string line(read_buffer_.data(), *result);
  auto parsed = parser_.parse(line);
  if (auto* error = get_if<Error>(&parsed)) {
    auto code = static_cast<ReplyCode>(error->code);
    FTPD_CONN_LOG_DEBUG(id, "control: {}: {}", errorKindToString(error->kind),
                        error->message);
    reply(id, code, defaultText(code));
    return;
  }

  handleCommand(id, get<Command>(parsed));
}

void ConnectionStateMachine::onControlWritable(ConnectionId id) {
  struct WriteState {
    network::IoHandle* socket;
    protocol::PendingResponse::Unsent unsent;
  };

  auto state = registry_.withConnection(id, [](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    return WriteState{control.socket.get(), control.pending_response.unsent()};
  });
  if (!state) {
    return;
  }

  if (!state->unsent.bytes.empty()) {
    network::ConstRawSlice slice{state->unsent.bytes.data(),
                                 state->unsent.bytes.size()};
    auto result = state->socket->writev(&slice, 1);
    if (!result.ok()) {
      if (result.wouldBlock()) {
        return;
      }
      FTPD_CONN_LOG_ERROR(id, "control: IoError: write: {}",
                          result.error_message());
      state->socket->enableFileEvents(0);
      schedule(ReactorAction::Kind::Close, id);
      return;
    }
    size_t written = *result;
    registry_.withConnection(id, [&](Connection& connection) {
      get<ControlChannel>(connection).pending_response.consume(
          written, state->unsent.generation);
    });
  }

  struct FlushState {
    bool flushed;
    optional<DeferredAction> action;
  };
  auto flush = registry_.withConnection(id, [](Connection& connection) {
    auto& pending = get<ControlChannel>(connection).pending_response;
    return FlushState{pending.flushed(), pending.takeActionIfFlushed()};
  });
  if (!flush || !flush->flushed) {
    // Partial write; stay armed for writing
    return;
  }

  if (flush->action) {
    if (flush->action->kind == DeferredAction::Kind::CloseSession) {
      state->socket->enableFileEvents(0);
      schedule(ReactorAction::Kind::Close, id);
      return;
    }
    runDeferred(id, *flush->action);
  }

  // runDeferred may have queued a failure reply
  auto flushed = registry_.withConnection(id, [](Connection& connection) {
    return get<ControlChannel>(connection).pending_response.flushed();
  });
  if (flushed) {
    state->socket->enableFileEvents(*flushed ? kRead : kWrite);
  }
}

void ConnectionStateMachine::handleCommand(ConnectionId id,
                                           const Command& command) {
  FTPD_CONN_LOG_DEBUG(id, "control: {} {}",
                      protocol::verbToString(command.verb), command.argument);

  if (command.verb == Verb::Port) {
    handlePort(id, *command.host_port);
    return;
  }
  if (command.verb == Verb::Pasv) {
    handlePasv(id);
    return;
  }

  auto snapshot = registry_.withConnection(id, [](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    return ControlSnapshot{control.session, control.linked_data};
  });
  if (!snapshot) {
    return;
  }

  applyOutcome(id, executeCommand(command, *snapshot));
}

ConnectionStateMachine::CommandOutcome ConnectionStateMachine::executeCommand(
    const Command& command,
    ControlSnapshot& snapshot) {
  CommandOutcome outcome;
  Session& session = snapshot.session;

  // A rename is only valid as the command right after RNFR
  if (command.verb != Verb::Rnto && command.verb != Verb::Rnfr &&
      session.rename_from) {
    session.rename_from.reset();
    outcome.session = session;
  }

  auto fail = [&](ReplyCode code, const Error& error) {
    FTPD_LOG_DEBUG("{} {}: {}: {}", protocol::verbToString(command.verb),
                   command.argument, errorKindToString(error.kind),
                   error.message);
    outcome.code = code;
    outcome.message = defaultText(code);
    return outcome;
  };
  auto ok = [&](ReplyCode code, std::string message) {
    outcome.code = code;
    outcome.message = std::move(message);
    return outcome;
  };

  switch (command.verb) {
    case Verb::List:
    case Verb::Retr:
    case Verb::Stor: {
      CommandOutcome data = executeDataCommand(command, snapshot);
      data.session = outcome.session;
      return data;
    }

    case Verb::User:
    case Verb::Pass:
      return executeLogin(command, snapshot);

    case Verb::Quit:
      outcome.action = DeferredAction{DeferredAction::Kind::CloseSession, ""};
      return ok(ReplyCode::ServiceClosingControl,
                defaultText(ReplyCode::ServiceClosingControl));

    case Verb::Pwd:
      return ok(ReplyCode::PathCreated,
                fmt::format("\"{}\"", session.root.cwd()));

    case Verb::Cwd: {
      auto changed = session.root.changeDirectory(command.argument);
      if (isError(changed)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(changed));
      }
      outcome.session = session;
      return ok(ReplyCode::FileActionOkay,
                defaultText(ReplyCode::FileActionOkay));
    }

    case Verb::Mkd: {
      auto path = session.root.resolveForCreate(command.argument);
      if (isError(path)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(path));
      }
      auto made = file_system_->makeDirectory(get<std::string>(path));
      if (isError(made)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(made));
      }
      return ok(ReplyCode::PathCreated,
                fmt::format("'{}' directory created.", command.argument));
    }

    case Verb::Rmd: {
      auto path = session.root.resolveExisting(command.argument);
      if (isError(path)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(path));
      }
      if (get<std::string>(path) == session.root.hostRoot()) {
        return fail(ReplyCode::FileUnavailable,
                    Error(ErrorKind::Path, "refusing to remove the root"));
      }
      auto removed = file_system_->removeDirectory(get<std::string>(path));
      if (isError(removed)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(removed));
      }
      return ok(ReplyCode::FileActionOkay,
                defaultText(ReplyCode::FileActionOkay));
    }

    case Verb::Dele: {
      auto path = session.root.resolveExisting(command.argument);
      if (isError(path)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(path));
      }
      auto removed = file_system_->removeFile(get<std::string>(path));
      if (isError(removed)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(removed));
      }
      return ok(ReplyCode::FileActionOkay,
                defaultText(ReplyCode::FileActionOkay));
    }

    case Verb::Rnfr: {
      auto path = session.root.resolveExisting(command.argument);
      if (isError(path)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(path));
      }
      if (get<std::string>(path) == session.root.hostRoot()) {
        return fail(ReplyCode::FileUnavailable,
                    Error(ErrorKind::Path, "refusing to rename the root"));
      }
      session.rename_from = get<std::string>(path);
      outcome.session = session;
      return ok(ReplyCode::FileActionPending,
                defaultText(ReplyCode::FileActionPending));
    }

    case Verb::Rnto: {
      if (!session.rename_from) {
        return fail(ReplyCode::BadSequence,
                    Error(ErrorKind::Sequence, "RNTO without RNFR"));
      }
      std::string from = *session.rename_from;
      session.rename_from.reset();
      outcome.session = session;

      auto to = session.root.resolveForCreate(command.argument);
      if (isError(to)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(to));
      }
      auto renamed = file_system_->rename(from, get<std::string>(to));
      if (isError(renamed)) {
        return fail(ReplyCode::FileUnavailable, get<Error>(renamed));
      }
      return ok(ReplyCode::FileActionOkay,
                defaultText(ReplyCode::FileActionOkay));
    }

    case Verb::Type:
    case Verb::Noop:
      return ok(ReplyCode::CommandOkay, defaultText(ReplyCode::CommandOkay));

    case Verb::Syst:
      return ok(ReplyCode::SystemType, defaultText(ReplyCode::SystemType));

    case Verb::Port:
    case Verb::Pasv:
      break;
  }

  return fail(ReplyCode::NotImplemented,
              Error(ErrorKind::Parse, "unexpected verb"));
}

ConnectionStateMachine::CommandOutcome
ConnectionStateMachine::executeDataCommand(const Command& command,
                                           const ControlSnapshot& snapshot) {
  CommandOutcome outcome;
  const fs::SessionRoot& root = snapshot.session.root;

  if (!snapshot.linked_data) {
    outcome.code = ReplyCode::BadSequence;
    outcome.message = defaultText(ReplyCode::BadSequence);
    return outcome;
  }
  // One transfer per data connection
  if (transferActive(*snapshot.linked_data)) {
    FTPD_CONN_LOG_DEBUG(*snapshot.linked_data, "{}: data connection is busy",
                        protocol::verbToString(command.verb));
    outcome.code = ReplyCode::BadSequence;
    outcome.message = defaultText(ReplyCode::BadSequence);
    return outcome;
  }

  DeferredAction action;
  Result<std::string> path = std::string();
  switch (command.verb) {
    case Verb::List:
      action.kind = DeferredAction::Kind::StartListing;
      path = root.resolveExisting(listTarget(command.argument));
      break;
    case Verb::Retr:
      action.kind = DeferredAction::Kind::StartDownload;
      path = root.resolveExisting(command.argument);
      if (!isError(path) &&
          file_system_->isDirectory(get<std::string>(path))) {
        path = makeError<std::string>(
            ErrorKind::Path,
            fmt::format("'{}' is a directory", command.argument));
      }
      break;
    default:
      action.kind = DeferredAction::Kind::StartUpload;
      path = root.resolveForCreate(command.argument);
      if (!isError(path) &&
          file_system_->isDirectory(get<std::string>(path))) {
        path = makeError<std::string>(
            ErrorKind::Path,
            fmt::format("'{}' is a directory", command.argument));
      }
      break;
  }

  if (auto* error = get_if<Error>(&path)) {
    FTPD_LOG_DEBUG("{} {}: {}: {}", protocol::verbToString(command.verb),
                   command.argument, errorKindToString(error->kind),
                   error->message);
    outcome.code = ReplyCode::FileUnavailable;
    outcome.message = defaultText(ReplyCode::FileUnavailable);
    return outcome;
  }

  action.path = get<std::string>(path);
  outcome.code = ReplyCode::FileStatusOkay;
  outcome.message = defaultText(ReplyCode::FileStatusOkay);
  outcome.action = std::move(action);
  outcome.requires_data = true;
  return outcome;
}

ConnectionStateMachine::CommandOutcome ConnectionStateMachine::executeLogin(
    const Command& command,
    ControlSnapshot& snapshot) {
  CommandOutcome outcome;
  Session& session = snapshot.session;

  if (command.verb == Verb::User) {
    if (!validUserName(command.argument)) {
      outcome.code = ReplyCode::SyntaxErrorArguments;
      outcome.message = defaultText(ReplyCode::SyntaxErrorArguments);
      return outcome;
    }
    session.user = command.argument;
    session.logged_in = false;
    outcome.session = session;
    outcome.code = ReplyCode::UserNameOkay;
    outcome.message = defaultText(ReplyCode::UserNameOkay);
    return outcome;
  }

  if (session.user.empty()) {
    outcome.code = ReplyCode::BadSequence;
    outcome.message = defaultText(ReplyCode::BadSequence);
    return outcome;
  }

  if (options_.per_user_directories) {
    std::string home = base_root_.hostRoot() + "/" + session.user;
    if (!file_system_->isDirectory(home)) {
      auto made = file_system_->makeDirectory(home);
      if (auto* error = get_if<Error>(&made)) {
        FTPD_LOG_ERROR("user {}: {}: {}", session.user,
                       errorKindToString(error->kind), error->message);
        outcome.code = ReplyCode::FileUnavailable;
        outcome.message = defaultText(ReplyCode::FileUnavailable);
        return outcome;
      }
    }
    auto root = fs::SessionRoot::create(home);
    if (auto* error = get_if<Error>(&root)) {
      FTPD_LOG_ERROR("user {}: {}: {}", session.user,
                     errorKindToString(error->kind), error->message);
      outcome.code = ReplyCode::FileUnavailable;
      outcome.message = defaultText(ReplyCode::FileUnavailable);
      return outcome;
    }
    session.root = std::move(get<fs::SessionRoot>(root));
  }

  session.logged_in = true;
  FTPD_LOG_INFO("user {} logged in", session.user);
  outcome.session = session;
  outcome.code = ReplyCode::UserLoggedIn;
  outcome.message = defaultText(ReplyCode::UserLoggedIn);
  return outcome;
}

void ConnectionStateMachine::applyOutcome(ConnectionId id,
                                          CommandOutcome outcome) {
  bool found = registry_.withConnection(id, [&](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    if (outcome.session) {
      control.session = std::move(*outcome.session);
    }
    if (outcome.requires_data && !control.linked_data) {
      control.pending_response.reset(ReplyCode::BadSequence);
      return;
    }
    // Keep a completion reply the client has not received yet
    if (control.pending_response.flushed()) {
      control.pending_response.reset(outcome.code, outcome.message);
    } else {
      control.pending_response.append(outcome.code, outcome.message);
    }
    if (outcome.action) {
      auto attached = control.pending_response.attach(std::move(*outcome.action));
      if (isError(attached)) {
        control.pending_response.reset(ReplyCode::BadSequence);
      }
    }
  });
  if (found) {
    schedule(ReactorAction::Kind::Rearm, id, kWrite);
  }
}

// ===== Mode switching =====

void ConnectionStateMachine::handlePort(ConnectionId id,
                                        const protocol::HostPort& target) {
  auto previous = registry_.withConnection(id, [](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    optional<ConnectionId> linked = control.linked_data;
    control.linked_data.reset();
    return linked;
  });
  if (!previous) {
    return;
  }
  if (*previous) {
    releaseData(id, **previous);
  }

  FTPD_CONN_LOG_INFO(id, "control: PORT {}",
                     protocol::CommandParser::encodeHostPort(target));

  // The control stays disarmed until the worker has replied
  reactor_.spawnWorker([this, id, target]() { connectActive(id, target); });
}

void ConnectionStateMachine::connectActive(ConnectionId owner,
                                           protocol::HostPort target) {
  auto address = std::make_shared<network::Address::Ipv4Instance>(
      target.host, target.port);

  auto fail = [&](const std::string& what, const std::string& message) {
    FTPD_CONN_LOG_ERROR(owner, "control: IoError: {} {}: {}", what,
                        address->asString(), message);
    registry_.withConnection(owner, [](Connection& connection) {
      if (auto* control = get_if<ControlChannel>(&connection)) {
        control->pending_response.append(
            ReplyCode::BadSequence,
            defaultText(ReplyCode::CantOpenDataConnection));
      }
    });
    schedule(ReactorAction::Kind::Rearm, owner, kWrite);
  };

  auto handle = network::createStreamHandle(address);
  if (!handle.ok()) {
    fail("socket", handle.error_message());
    return;
  }
  network::IoHandlePtr socket = std::move(*handle);

  auto blocking = socket->setBlocking(true);
  if (!blocking.ok()) {
    fail("socket", blocking.error_message());
    return;
  }

  auto timeout_ms = options_.port_connect_timeout.count();
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(timeout_ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
  auto timeout = socket->setSocketOption(SOL_SOCKET, SO_SNDTIMEO, &tv,
                                         sizeof(tv));
  if (!timeout.ok()) {
    fail("setsockopt", timeout.error_message());
    return;
  }

  auto connected = socket->connect(address);
  if (!connected.ok()) {
    fail("connect", connected.error_message());
    return;
  }

  auto nonblocking = socket->setBlocking(false);
  if (!nonblocking.ok()) {
    fail("socket", nonblocking.error_message());
    return;
  }

  DataChannelActive data;
  data.socket = std::move(socket);
  data.owner = owner;
  ConnectionId data_id = registry_.insert(Connection(std::move(data)));

  struct LinkResult {
    optional<ConnectionId> replaced;
  };
  auto linked = registry_.withConnection(owner, [&](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    LinkResult result{linkData(control, data_id)};
    control.pending_response.append(ReplyCode::CommandOkay);
    return result;
  });

  if (!linked) {
    // Control channel went away while connecting
    schedule(ReactorAction::Kind::Close, data_id);
    return;
  }

  FTPD_CONN_LOG_INFO(owner, "control: active data connection {} to {}",
                     data_id, address->asString());
  reactor_.enqueue(ReactorAction{ReactorAction::Kind::Register, data_id, 0});
  if (linked->replaced) {
    releaseData(owner, *linked->replaced);
  }
  schedule(ReactorAction::Kind::Rearm, owner, kWrite);
}

void ConnectionStateMachine::handlePasv(ConnectionId id) {
  network::IoHandle* control_socket = socketOf(id);
  if (control_socket == nullptr) {
    return;
  }

  auto local = control_socket->localAddress();
  const network::Address::Ip* local_ip =
      local.ok() && *local ? (*local)->ip() : nullptr;
  if (local_ip == nullptr ||
      local_ip->version() != network::Address::IpVersion::v4) {
    FTPD_CONN_LOG_ERROR(id, "control: PASV needs an IPv4 control socket");
    reply(id, ReplyCode::CantOpenDataConnection,
          defaultText(ReplyCode::CantOpenDataConnection));
    return;
  }
  auto local_octets =
      static_cast<const network::Address::Ipv4Instance*>(local_ip)->octets();

  std::array<uint8_t, 4> announced = local_octets;
  if (!options_.passive_address.empty()) {
    auto configured =
        network::Address::parseInternetAddressNoPort(options_.passive_address);
    if (configured && configured->ip() &&
        configured->ip()->version() == network::Address::IpVersion::v4) {
      announced = static_cast<const network::Address::Ipv4Instance*>(
                      configured->ip())
                      ->octets();
    }
  }

  auto bind_address =
      std::make_shared<network::Address::Ipv4Instance>(local_octets, 0);
  auto listening = network::createListeningHandle(bind_address, 1);
  if (!listening.ok()) {
    FTPD_CONN_LOG_ERROR(id, "control: IoError: passive listen: {}",
                        listening.error_message());
    reply(id, ReplyCode::CantOpenDataConnection,
          defaultText(ReplyCode::CantOpenDataConnection));
    return;
  }
  network::IoHandlePtr socket = std::move(*listening);

  auto bound = socket->localAddress();
  if (!bound.ok() || !*bound || !(*bound)->ip()) {
    FTPD_CONN_LOG_ERROR(id, "control: IoError: passive listen: {}",
                        bound.error_message());
    reply(id, ReplyCode::CantOpenDataConnection,
          defaultText(ReplyCode::CantOpenDataConnection));
    return;
  }
  protocol::HostPort host_port;
  host_port.host = announced;
  host_port.port = static_cast<uint16_t>((*bound)->ip()->port());

  PassiveListener listener;
  listener.socket = std::move(socket);
  listener.owner = id;
  ConnectionId listener_id = registry_.insert(Connection(std::move(listener)));

  auto replaced = registry_.withConnection(id, [&](Connection& connection) {
    auto& control = get<ControlChannel>(connection);
    optional<ConnectionId> previous = linkData(control, listener_id);
    control.pending_response.append(
        ReplyCode::EnteringPassiveMode,
        fmt::format("Entering Passive Mode ({}).",
                    protocol::CommandParser::encodeHostPort(host_port)));
    return previous;
  });

  FTPD_CONN_LOG_INFO(id, "control: passive listener {} on port {}",
                     listener_id, host_port.port);
  reactor_.enqueue(
      ReactorAction{ReactorAction::Kind::Register, listener_id, kRead});
  if (replaced && *replaced) {
    releaseData(id, **replaced);
  }
  schedule(ReactorAction::Kind::Rearm, id, kWrite);
}

// ===== Deferred actions =====

Result<transfer::Transfer> ConnectionStateMachine::prepareTransfer(
    const DeferredAction& action) {
  switch (action.kind) {
    case DeferredAction::Kind::StartListing: {
      auto entries = file_system_->list(action.path);
      if (auto* error = get_if<Error>(&entries)) {
        return makeError<transfer::Transfer>(*error);
      }
      transfer::BufferPayload payload;
      payload.bytes =
          fs::formatListing(get<std::vector<fs::DirEntry>>(entries));
      return Result<transfer::Transfer>(transfer::Transfer(std::move(payload)));
    }
    case DeferredAction::Kind::StartDownload: {
      auto file = file_system_->open(action.path);
      if (auto* error = get_if<Error>(&file)) {
        return makeError<transfer::Transfer>(*error);
      }
      transfer::FileStream stream;
      stream.file = std::move(get<fs::FileHandle>(file));
      return Result<transfer::Transfer>(transfer::Transfer(std::move(stream)));
    }
    case DeferredAction::Kind::StartUpload: {
      auto file = file_system_->create(action.path);
      if (auto* error = get_if<Error>(&file)) {
        return makeError<transfer::Transfer>(*error);
      }
      transfer::FileSink sink;
      sink.file = std::move(get<fs::FileHandle>(file));
      return Result<transfer::Transfer>(transfer::Transfer(std::move(sink)));
    }
    case DeferredAction::Kind::CloseSession:
      break;
  }
  return makeError<transfer::Transfer>(ErrorKind::Sequence,
                                       "action carries no transfer");
}

void ConnectionStateMachine::runDeferred(ConnectionId id,
                                         const DeferredAction& action) {
  FTPD_CONN_LOG_DEBUG(id, "control: {} {}",
                      protocol::deferredActionKindToString(action.kind),
                      action.path);

  auto linked = registry_.withConnection(id, [](Connection& connection) {
    return get<ControlChannel>(connection).linked_data;
  });
  if (!linked) {
    return;
  }

  auto fail_control = [&](ReplyCode code) {
    auto previous = registry_.withConnection(id, [&](Connection& connection) {
      auto& control = get<ControlChannel>(connection);
      optional<ConnectionId> data = control.linked_data;
      control.linked_data.reset();
      control.pending_response.append(code);
      return data;
    });
    if (previous && *previous) {
      schedule(ReactorAction::Kind::Close, **previous);
    }
  };

  if (!*linked) {
    fail_control(ReplyCode::CantOpenDataConnection);
    return;
  }
  ConnectionId data_id = **linked;

  auto prepared = prepareTransfer(action);
  if (auto* error = get_if<Error>(&prepared)) {
    FTPD_CONN_LOG_ERROR(id, "control: {}: {}", errorKindToString(error->kind),
                        error->message);
    fail_control(ReplyCode::FileUnavailable);
    return;
  }
  transfer::Transfer transfer = std::move(get<transfer::Transfer>(prepared));
  uint32_t interest = transfer::TransferEngine::interestFor(transfer);

  enum class Attach { Started, Parked, Busy };
  auto attached = registry_.withConnection(data_id, [&](Connection& connection) {
    return visit(
        overloaded{
            [&](ControlChannel&) { return Attach::Busy; },
            [&](PassiveListener& listener) {
              if (!transfer::isIdle(listener.pending)) {
                return Attach::Busy;
              }
              listener.pending = std::move(transfer);
              return Attach::Parked;
            },
            [&](DataChannel& data) {
              if (!transfer::isIdle(data.transfer)) {
                return Attach::Busy;
              }
              data.transfer = std::move(transfer);
              return Attach::Started;
            },
        },
        connection);
  });

  if (!attached) {
    fail_control(ReplyCode::CantOpenDataConnection);
    return;
  }
  if (*attached == Attach::Busy) {
    // Leave the running transfer alone
    bool found = registry_.withConnection(id, [](Connection& connection) {
      get<ControlChannel>(connection).pending_response.append(
          ReplyCode::BadSequence);
    });
    if (found) {
      schedule(ReactorAction::Kind::Rearm, id, kWrite);
    }
    return;
  }
  if (*attached == Attach::Started) {
    schedule(ReactorAction::Kind::Rearm, data_id, interest);
  }
}

// ===== Passive listener =====

void ConnectionStateMachine::onListenerReadable(ConnectionId id) {
  network::IoHandle* socket = socketOf(id);
  if (socket == nullptr) {
    return;
  }

  auto accepted = socket->accept();
  if (!accepted.ok()) {
    if (accepted.wouldBlock()) {
      return;
    }
    FTPD_CONN_LOG_ERROR(id, "listener: IoError: accept: {}",
                        accepted.error_message());
    socket->enableFileEvents(0);
    schedule(ReactorAction::Kind::Close, id);
    return;
  }

  // Single use: no further accepts
  socket->enableFileEvents(0);

  struct Taken {
    ConnectionId owner;
    transfer::Transfer pending;
  };
  auto taken = registry_.withConnection(id, [](Connection& connection) {
    auto& listener = get<PassiveListener>(connection);
    return Taken{listener.owner,
                 std::exchange(listener.pending, transfer::Transfer())};
  });
  if (!taken) {
    return;
  }

  uint32_t interest = transfer::TransferEngine::interestFor(taken->pending);
  DataChannelPassive data;
  data.socket = std::move(*accepted);
  data.owner = taken->owner;
  data.transfer = std::move(taken->pending);
  ConnectionId data_id = registry_.insert(Connection(std::move(data)));

  auto relinked = registry_.withConnection(
      taken->owner, [&](Connection& connection) {
        auto* control = get_if<ControlChannel>(&connection);
        if (control == nullptr || control->linked_data != id) {
          return false;
        }
        control->linked_data = data_id;
        return true;
      });

  reactor_.enqueue(ReactorAction{ReactorAction::Kind::Close, id, 0});
  if (!relinked || !*relinked) {
    reactor_.enqueue(ReactorAction{ReactorAction::Kind::Close, data_id, 0});
  } else {
    FTPD_CONN_LOG_INFO(taken->owner,
                       "control: passive data connection {} accepted", data_id);
    reactor_.enqueue(
        ReactorAction{ReactorAction::Kind::Register, data_id, interest});
  }
  reactor_.wake();
}

// ===== Data channels =====

void ConnectionStateMachine::onDataReady(ConnectionId id, uint32_t events) {
  struct Taken {
    network::IoHandle* socket;
    ConnectionId owner;
    transfer::Transfer transfer;
  };
  auto taken = registry_.withConnection(id, [](Connection& connection) {
    return visit(overloaded{
                     [](DataChannel& data) -> optional<Taken> {
                       // Leaves the entry idle until the transfer goes back
                       return Taken{
                           data.socket.get(), data.owner,
                           std::exchange(data.transfer, transfer::Transfer())};
                     },
                     [](ControlChannel&) -> optional<Taken> {
                       return nullopt;
                     },
                     [](PassiveListener&) -> optional<Taken> {
                       return nullopt;
                     },
                 },
                 connection);
  });
  if (!taken || !*taken) {
    return;
  }
  Taken& data = **taken;

  if (transfer::isIdle(data.transfer)) {
    data.socket->enableFileEvents(0);
    return;
  }

  transfer::TransferProgress progress;
  if (events & kWrite) {
    progress = engine_.onWritable(data.transfer, *data.socket);
  } else {
    progress = engine_.onReadable(data.transfer, *data.socket);
  }

  switch (progress.status) {
    case transfer::TransferProgress::Status::InProgress:
      registry_.withConnection(id, [&](Connection& connection) {
        visit(overloaded{
                  [&](DataChannel& channel) {
                    channel.transfer = std::move(data.transfer);
                  },
                  [](ControlChannel&) {},
                  [](PassiveListener&) {},
              },
              connection);
      });
      return;
    case transfer::TransferProgress::Status::Complete:
      FTPD_CONN_LOG_INFO(id, "data: {} transfer complete",
                         transfer::transferKindToString(data.transfer));
      data.socket->enableFileEvents(0);
      finishTransfer(id, data.owner, ReplyCode::ClosingDataConnection);
      return;
    case transfer::TransferProgress::Status::Failed:
      FTPD_CONN_LOG_ERROR(id, "data: {}: {}",
                          errorKindToString(progress.error->kind),
                          progress.error->message);
      data.socket->enableFileEvents(0);
      finishTransfer(id, data.owner, ReplyCode::TransferAborted);
      return;
  }
}

void ConnectionStateMachine::finishTransfer(ConnectionId id,
                                            ConnectionId owner,
                                            ReplyCode code) {
  bool found = registry_.withConnection(owner, [&](Connection& connection) {
    auto* control = get_if<ControlChannel>(&connection);
    if (control == nullptr) {
      return;
    }
    if (control->linked_data == id) {
      control->linked_data.reset();
    }
    control->pending_response.append(code);
  });
  if (found) {
    reactor_.enqueue(ReactorAction{ReactorAction::Kind::Rearm, owner, kWrite});
  }
  schedule(ReactorAction::Kind::Close, id);
}

// ===== Teardown =====

void ConnectionStateMachine::onClose(ConnectionId id) {
  auto removed = registry_.remove(id);
  if (!removed) {
    return;
  }

  if (holds_alternative<ControlChannel>(*removed)) {
    FTPD_CONN_LOG_INFO(id, "control: closed");
    // Linked and unlinked data connections alike
    for (ConnectionId other : registry_.ids()) {
      auto owned = registry_.withConnection(other, [id](Connection& connection) {
        return connectionOwner(connection) == id;
      });
      if (owned && *owned) {
        reactor_.enqueue(ReactorAction{ReactorAction::Kind::Close, other, 0});
      }
    }
    return;
  }

  optional<ConnectionId> owner = connectionOwner(*removed);
  bool interrupted = visit(overloaded{
                               [](DataChannel& data) {
                                 return !transfer::isIdle(data.transfer);
                               },
                               [](PassiveListener& listener) {
                                 return !transfer::isIdle(listener.pending);
                               },
                               [](ControlChannel&) { return false; },
                           },
                           *removed);
  FTPD_CONN_LOG_DEBUG(id, "{}: closed", connectionRoleToString(*removed));

  if (!owner) {
    return;
  }
  bool notify = false;
  registry_.withConnection(*owner, [&](Connection& connection) {
    auto* control = get_if<ControlChannel>(&connection);
    if (control == nullptr) {
      return;
    }
    if (control->linked_data == id) {
      control->linked_data.reset();
    }
    if (interrupted) {
      control->pending_response.append(ReplyCode::TransferAborted);
      notify = true;
    }
  });
  if (notify) {
    reactor_.enqueue(
        ReactorAction{ReactorAction::Kind::Rearm, *owner, kWrite});
  }
}

}  // namespace server
}  // namespace ftpd
