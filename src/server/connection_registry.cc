#include "ftpd/server/connection_registry.h"

namespace ftpd {
namespace server {

ConnectionId ConnectionRegistry::insert(Connection connection) {
  ConnectionId id = next_id_.fetch_add(1);
  bool is_control = holds_alternative<ControlChannel>(connection);
  auto entry = std::make_unique<Entry>(std::move(connection));

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.emplace(id, std::move(entry));
  if (is_control) {
    ++control_channels_;
  }
  return id;
}

optional<Connection> ConnectionRegistry::remove(ConnectionId id) {
  std::unique_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return nullopt;
    }
    // Wait out any worker currently inside withConnection() for this id
    std::lock_guard<std::mutex> entry_lock(it->second->mutex);
    entry = std::move(it->second);
    entries_.erase(it);
    if (holds_alternative<ControlChannel>(entry->connection)) {
      --control_channels_;
    }
  }
  return optional<Connection>(std::move(entry->connection));
}

bool ConnectionRegistry::contains(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) != 0;
}

size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t ConnectionRegistry::controlChannelCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return control_channels_;
}

std::vector<ConnectionId> ConnectionRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionId> result;
  result.reserve(entries_.size());
  for (const auto& kv : entries_) {
    result.push_back(kv.first);
  }
  return result;
}

}  // namespace server
}  // namespace ftpd
