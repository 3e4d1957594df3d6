#define FTPD_LOG_COMPONENT "Server.reactor"

#include "ftpd/server/reactor.h"

#include <stdexcept>

#include "ftpd/logging/log_macros.h"

namespace ftpd {
namespace server {

namespace {

const char* actionKindToString(ReactorAction::Kind kind) {
  switch (kind) {
    case ReactorAction::Kind::Register:
      return "register";
    case ReactorAction::Kind::Rearm:
      return "rearm";
    case ReactorAction::Kind::Close:
      return "close";
  }
  return "unknown";
}

}  // namespace

Reactor::Reactor(event::Dispatcher& dispatcher, ConnectionRegistry& registry)
    : dispatcher_(dispatcher), registry_(registry) {}

Reactor::~Reactor() { joinWorkers(); }

void Reactor::enqueue(ReactorAction action) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  queue_.push_back(action);
}

void Reactor::wake() {
  if (!wake_pending_.exchange(true)) {
    dispatcher_.post([this]() { drain(); });
  }
}

void Reactor::submit(ReactorAction action) {
  enqueue(action);
  wake();
}

void Reactor::drain() {
  // Clear first: a wake racing with this pass schedules another one
  wake_pending_.store(false);
  drain_count_.fetch_add(1);

  while (true) {
    std::vector<ReactorAction> batch;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      batch.swap(queue_);
    }
    if (batch.empty()) {
      break;
    }
    for (const auto& action : batch) {
      apply(action);
    }
  }
}

void Reactor::apply(const ReactorAction& action) {
  FTPD_CONN_LOG_DEBUG(action.id, "{} events={:#x}",
                      actionKindToString(action.kind), action.events);

  switch (action.kind) {
    case ReactorAction::Kind::Register:
    case ReactorAction::Kind::Rearm:
      arm(action.id, action.events);
      break;
    case ReactorAction::Kind::Close:
      if (handler_) {
        handler_->onClose(action.id);
      } else {
        registry_.remove(action.id);
      }
      break;
  }
}

void Reactor::arm(ConnectionId id, uint32_t events) {
  auto socket = registry_.withConnection(id, [](Connection& connection) {
    return &connectionSocket(connection);
  });
  if (!socket) {
    // Closed while the action was queued
    return;
  }

  network::IoHandle& handle = **socket;
  try {
    if (!handle.hasFileEvent()) {
      handle.initializeFileEvent(
          dispatcher_,
          [this, id](uint32_t ready) {
            if (handler_) {
              handler_->onReady(id, ready);
            }
          },
          event::FileTriggerType::Level, events);
    } else {
      handle.enableFileEvents(events);
    }
  } catch (const std::runtime_error& e) {
    Error error(ErrorKind::Registration, e.what());
    FTPD_CONN_LOG_ERROR(id, "{}: {}", errorKindToString(error.kind),
                        error.message);
    enqueue(ReactorAction{ReactorAction::Kind::Close, id, 0});
  }
}

void Reactor::spawnWorker(std::function<void()> fn) {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reapFinishedWorkers();

  auto done = std::make_shared<std::atomic<bool>>(false);
  Worker worker;
  worker.done = done;
  worker.thread = std::thread([fn = std::move(fn), done]() {
    fn();
    done->store(true);
  });
  workers_.push_back(std::move(worker));
}

void Reactor::reapFinishedWorkers() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void Reactor::joinWorkers() {
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

size_t Reactor::activeWorkers() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  size_t active = 0;
  for (const auto& worker : workers_) {
    if (!worker.done->load()) {
      ++active;
    }
  }
  return active;
}

}  // namespace server
}  // namespace ftpd
