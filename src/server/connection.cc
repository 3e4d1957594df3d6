#include "ftpd/server/connection.h"

namespace ftpd {
namespace server {

const char* connectionRoleToString(const Connection& connection) {
  return visit(overloaded{
                   [](const ControlChannel&) { return "control"; },
                   [](const DataChannelActive&) { return "data-active"; },
                   [](const DataChannelPassive&) { return "data-passive"; },
                   [](const PassiveListener&) { return "passive-listener"; },
               },
               connection);
}

network::IoHandle& connectionSocket(Connection& connection) {
  return *visit([](auto& c) -> network::IoHandle* { return c.socket.get(); },
                connection);
}

optional<ConnectionId> connectionOwner(const Connection& connection) {
  return visit(overloaded{
                   [](const ControlChannel&) -> optional<ConnectionId> {
                     return nullopt;
                   },
                   [](const DataChannel& data) -> optional<ConnectionId> {
                     return data.owner;
                   },
                   [](const PassiveListener& l) -> optional<ConnectionId> {
                     return l.owner;
                   },
               },
               connection);
}

optional<ConnectionId> linkData(ControlChannel& control, ConnectionId data) {
  optional<ConnectionId> previous = control.linked_data;
  control.linked_data = data;
  if (previous && *previous == data) {
    return nullopt;
  }
  return previous;
}

}  // namespace server
}  // namespace ftpd
