#ifndef FTPD_SERVER_CONNECTION_H
#define FTPD_SERVER_CONNECTION_H

#include <cstdint>
#include <string>

#include "ftpd/core/compat.h"
#include "ftpd/fs/session_root.h"
#include "ftpd/network/io_handle.h"
#include "ftpd/protocol/pending_response.h"
#include "ftpd/transfer/transfer.h"

namespace ftpd {
namespace server {

// Monotonic and never reused within a process
using ConnectionId = uint64_t;

struct Session {
  std::string user;
  bool logged_in{false};
  fs::SessionRoot root;
  optional<std::string> rename_from;  // Host path remembered by RNFR

  explicit Session(fs::SessionRoot r) : root(std::move(r)) {}
};

struct ControlChannel {
  network::IoHandlePtr socket;
  protocol::PendingResponse pending_response;
  optional<ConnectionId> linked_data;
  Session session;

  ControlChannel(network::IoHandlePtr s, fs::SessionRoot root)
      : socket(std::move(s)), session(std::move(root)) {}
};

struct DataChannel {
  network::IoHandlePtr socket;
  transfer::Transfer transfer;
  ConnectionId owner{0};
};

// Dialed by the server after PORT
struct DataChannelActive : DataChannel {};

// Accepted on a PassiveListener after PASV
struct DataChannelPassive : DataChannel {};

struct PassiveListener {
  network::IoHandlePtr socket;
  ConnectionId owner{0};
  // A transfer started before the client connected; it moves to the
  // accepted DataChannelPassive
  transfer::Transfer pending;
};

using Connection = variant<ControlChannel,
                           DataChannelActive,
                           DataChannelPassive,
                           PassiveListener>;

const char* connectionRoleToString(const Connection& connection);

network::IoHandle& connectionSocket(Connection& connection);

// The owning control channel of a data-role connection
optional<ConnectionId> connectionOwner(const Connection& connection);

// Points the control channel at a new data-role connection and returns the
// one it replaces, which the caller must close
optional<ConnectionId> linkData(ControlChannel& control, ConnectionId data);

}  // namespace server
}  // namespace ftpd

#endif  // FTPD_SERVER_CONNECTION_H
