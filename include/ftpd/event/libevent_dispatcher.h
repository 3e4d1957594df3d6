#ifndef FTPD_EVENT_LIBEVENT_DISPATCHER_H
#define FTPD_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "ftpd/event/event_loop.h"

// Forward declarations for libevent types
struct event_base;
struct event;

namespace ftpd {
namespace event {

// Rename to avoid conflict with struct event
using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * Cross-thread posts are queued under a mutex and signalled through a
 * self-pipe. Only the post that turns the queue non-empty writes to the
 * pipe, so any number of posts between two loop iterations costs a single
 * wake-up.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               FileTriggerType trigger,
                               uint32_t events) override;

  void exit() override;

  void run(RunType type) override;

  // Get the underlying event_base for advanced usage
  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  FileTriggerType trigger,
                  uint32_t events);
    ~FileEventImpl() override;

    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);
    void assignEvents(uint32_t events);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    FileTriggerType trigger_;
    libevent_event* event_;
    uint32_t enabled_events_;
    bool event_added_{false};
  };

  void runPostCallbacks();
  void initializeLibevent();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> thread_id_{};
  std::atomic<bool> exit_requested_{false};

  // Post callback handling
  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};  // Pipe for waking up event loop
  libevent_event* wakeup_event_{nullptr};
};

/**
 * @brief Factory for creating libevent-based dispatchers
 */
class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;

 private:
  static const std::string backend_name_;
};

}  // namespace event
}  // namespace ftpd

#endif  // FTPD_EVENT_LIBEVENT_DISPATCHER_H
