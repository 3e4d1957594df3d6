#ifndef FTPD_SERVER_CONNECTION_STATE_MACHINE_H
#define FTPD_SERVER_CONNECTION_STATE_MACHINE_H

#include <chrono>
#include <string>
#include <vector>

#include "ftpd/fs/file_system.h"
#include "ftpd/fs/session_root.h"
#include "ftpd/protocol/command_parser.h"
#include "ftpd/server/connection_registry.h"
#include "ftpd/server/reactor.h"
#include "ftpd/transfer/transfer_engine.h"

namespace ftpd {
namespace server {

struct StateMachineOptions {
  size_t max_command_length{1024};
  size_t transfer_chunk_size{8192};
  // Dotted quad announced in 227 replies; empty uses the control socket's
  // local address
  std::string passive_address;
  bool per_user_directories{false};
  // Bound on the blocking connect a PORT worker performs
  std::chrono::milliseconds port_connect_timeout{10000};
};

/**
 * Per-role behavior of every registered connection.
 *
 * All entry points except the PORT worker run on the dispatcher thread.
 * Connection state is only touched inside ConnectionRegistry::withConnection
 * and socket calls are made after the entry lock is released. Changes to
 * readiness interest and teardown go through the reactor's action queue.
 *
 * Control channel cycle: the channel is armed for reading only while no
 * reply is pending. A command produces a reply and disarms reading; once
 * the reply is flushed the deferred action (if any) runs and reading is
 * armed again.
 */
class ConnectionStateMachine : public ConnectionHandler {
 public:
  ConnectionStateMachine(Reactor& reactor,
                         ConnectionRegistry& registry,
                         fs::FileSystemSharedPtr file_system,
                         fs::SessionRoot base_root,
                         StateMachineOptions options);

  // Registers an accepted control socket and queues the greeting
  ConnectionId acceptControl(network::IoHandlePtr socket);

  // ConnectionHandler
  void onReady(ConnectionId id, uint32_t events) override;
  void onClose(ConnectionId id) override;

  const StateMachineOptions& options() const { return options_; }

 private:
  struct ControlSnapshot {
    Session session;
    optional<ConnectionId> linked_data;
  };

  struct CommandOutcome {
    protocol::ReplyCode code{protocol::ReplyCode::CommandOkay};
    std::string message;
    optional<protocol::DeferredAction> action;
    optional<Session> session;  // Replaces the channel's session when set
    bool requires_data{false};
  };

  // Control channel
  void onControlReadable(ConnectionId id);
  void onControlWritable(ConnectionId id);
  void handleCommand(ConnectionId id, const protocol::Command& command);
  CommandOutcome executeCommand(const protocol::Command& command,
                                ControlSnapshot& snapshot);
  CommandOutcome executeDataCommand(const protocol::Command& command,
                                    const ControlSnapshot& snapshot);
  CommandOutcome executeLogin(const protocol::Command& command,
                              ControlSnapshot& snapshot);
  void applyOutcome(ConnectionId id, CommandOutcome outcome);
  void handlePort(ConnectionId id, const protocol::HostPort& target);
  void handlePasv(ConnectionId id);
  void connectActive(ConnectionId owner, protocol::HostPort target);
  void runDeferred(ConnectionId id, const protocol::DeferredAction& action);
  Result<transfer::Transfer> prepareTransfer(
      const protocol::DeferredAction& action);

  // Passive listener
  void onListenerReadable(ConnectionId id);

  // Data channels
  void onDataReady(ConnectionId id, uint32_t events);
  void finishTransfer(ConnectionId id,
                      ConnectionId owner,
                      protocol::ReplyCode code);

  void reply(ConnectionId id,
             protocol::ReplyCode code,
             const std::string& message);
  void schedule(ReactorAction::Kind kind, ConnectionId id, uint32_t events = 0);
  // True while a data channel moves bytes or a listener holds a parked
  // transfer
  bool transferActive(ConnectionId id);
  // Closes a data connection its control channel no longer links, unless it
  // is mid-transfer; that one finishes and reports 226 or 426 on its own
  void releaseData(ConnectionId owner, ConnectionId data_id);
  network::IoHandle* socketOf(ConnectionId id);

  Reactor& reactor_;
  ConnectionRegistry& registry_;
  fs::FileSystemSharedPtr file_system_;
  fs::SessionRoot base_root_;
  StateMachineOptions options_;
  protocol::CommandParser parser_;
  transfer::TransferEngine engine_;
  std::vector<char> read_buffer_;
};

}  // namespace server
}  // namespace ftpd

#endif  // FTPD_SERVER_CONNECTION_STATE_MACHINE_H
