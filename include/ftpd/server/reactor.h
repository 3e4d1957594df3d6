#ifndef FTPD_SERVER_REACTOR_H
#define FTPD_SERVER_REACTOR_H

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "ftpd/event/event_loop.h"
#include "ftpd/server/connection_registry.h"

namespace ftpd {
namespace server {

// Registration change applied on the dispatcher thread
struct ReactorAction {
  enum class Kind {
    Register,  // First arm of a newly inserted connection
    Rearm,     // Change the interest set; 0 disarms
    Close,     // Tear the connection down
  };

  Kind kind;
  ConnectionId id;
  uint32_t events{0};
};

/**
 * Receives the readiness events and teardown requests the reactor
 * dispatches. Implemented by the connection state machine.
 */
class ConnectionHandler {
 public:
  virtual ~ConnectionHandler() = default;

  virtual void onReady(ConnectionId id, uint32_t events) = 0;

  // Called on the dispatcher thread for every Close action
  virtual void onClose(ConnectionId id) = 0;
};

/**
 * Bridges the connection registry and the dispatcher.
 *
 * Any thread may enqueue() actions; they are applied by drain(), which runs
 * as a dispatcher post callback. wake() posts drain() at most once until it
 * starts running, so any number of wakes between two loop iterations
 * collapse into one. Closing therefore never happens inside a file event
 * callback of the connection being closed.
 */
class Reactor {
 public:
  Reactor(event::Dispatcher& dispatcher, ConnectionRegistry& registry);
  ~Reactor();

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  void setHandler(ConnectionHandler* handler) { handler_ = handler; }

  // Thread-safe
  void enqueue(ReactorAction action);

  // Thread-safe; coalescing
  void wake();

  // Convenience: enqueue followed by wake
  void submit(ReactorAction action);

  // Runs fn on a short-lived worker thread that is joined at shutdown
  void spawnWorker(std::function<void()> fn);

  // Blocks until every worker has returned
  void joinWorkers();

  size_t activeWorkers() const;

  // Number of drain() passes so far
  uint64_t drainCount() const { return drain_count_.load(); }

  event::Dispatcher& dispatcher() { return dispatcher_; }
  ConnectionRegistry& registry() { return registry_; }

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void drain();
  void apply(const ReactorAction& action);
  void arm(ConnectionId id, uint32_t events);
  void reapFinishedWorkers();

  event::Dispatcher& dispatcher_;
  ConnectionRegistry& registry_;
  ConnectionHandler* handler_{nullptr};

  std::mutex queue_mutex_;
  std::vector<ReactorAction> queue_;
  std::atomic<bool> wake_pending_{false};
  std::atomic<uint64_t> drain_count_{0};

  mutable std::mutex workers_mutex_;
  std::list<Worker> workers_;
};

}  // namespace server
}  // namespace ftpd

#endif  // FTPD_SERVER_REACTOR_H
