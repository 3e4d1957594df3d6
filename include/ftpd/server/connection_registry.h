#ifndef FTPD_SERVER_CONNECTION_REGISTRY_H
#define FTPD_SERVER_CONNECTION_REGISTRY_H

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "ftpd/server/connection.h"

namespace ftpd {
namespace server {

/**
 * Sole owner of every live Connection.
 *
 * Other code reaches a connection only through its id and only for the
 * duration of one withConnection() call. The map lock is held just long
 * enough to find the entry; the entry lock is held while the callback runs.
 * Lock order is always map then entry. Callbacks must not re-enter the
 * registry and must not perform socket I/O that can block.
 */
class ConnectionRegistry {
 public:
  ConnectionId insert(Connection connection);

  // Runs fn(Connection&) under the entry lock. Returns nullopt (or false for
  // void callbacks) when the id is not registered.
  template <typename Fn>
  auto withConnection(ConnectionId id, Fn&& fn)
      -> std::conditional_t<
          std::is_void<std::invoke_result_t<Fn, Connection&>>::value,
          bool,
          optional<std::invoke_result_t<Fn, Connection&>>> {
    using R = std::invoke_result_t<Fn, Connection&>;
    std::unique_lock<std::mutex> entry_lock;
    Entry* entry = nullptr;
    {
      std::lock_guard<std::mutex> map_lock(mutex_);
      auto it = entries_.find(id);
      if (it == entries_.end()) {
        if constexpr (std::is_void<R>::value) {
          return false;
        } else {
          return nullopt;
        }
      }
      entry = it->second.get();
      entry_lock = std::unique_lock<std::mutex>(entry->mutex);
    }
    if constexpr (std::is_void<R>::value) {
      fn(entry->connection);
      return true;
    } else {
      return optional<R>(fn(entry->connection));
    }
  }

  // Takes the connection out of the registry. Only the reactor removes.
  optional<Connection> remove(ConnectionId id);

  bool contains(ConnectionId id) const;
  size_t size() const;
  size_t controlChannelCount() const;
  std::vector<ConnectionId> ids() const;

 private:
  struct Entry {
    std::mutex mutex;
    Connection connection;

    explicit Entry(Connection c) : connection(std::move(c)) {}
  };

  mutable std::mutex mutex_;
  std::unordered_map<ConnectionId, std::unique_ptr<Entry>> entries_;
  std::atomic<ConnectionId> next_id_{1};
  size_t control_channels_{0};
};

}  // namespace server
}  // namespace ftpd

#endif  // FTPD_SERVER_CONNECTION_REGISTRY_H
