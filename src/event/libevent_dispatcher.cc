#include "ftpd/event/libevent_dispatcher.h"

#include <stdexcept>

#include <unistd.h>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define FTPD_LOG_COMPONENT "Event.dispatcher"
#include "ftpd/logging/log_macros.h"

namespace ftpd {
namespace event {

namespace {

// Convert our event types to libevent flags
short toLibeventEvents(uint32_t events, FileTriggerType trigger) {
  short result = 0;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }

  if (trigger == FileTriggerType::Edge) {
#ifdef EV_ET
    result |= EV_ET;
#endif
  }
  result |= EV_PERSIST;

  return result;
}

// Convert libevent flags to our event types
uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  if (events & EV_TIMEOUT) {
    result |= static_cast<uint32_t>(FileReadyType::Error);
  }
  return result;
}

// Threading support is initialized lazily, once per process
void ensureLibeventThreadingInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { evthread_use_pthreads(); });
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  ensureLibeventThreadingInitialized();

  // thread_id_ is only set once run() is called
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (config) {
#ifdef __linux__
    // Prefer epoll on Linux
    event_config_avoid_method(config, "select");
    event_config_avoid_method(config, "poll");
#endif
    base_ = event_base_new_with_config(config);
    event_config_free(config);
  } else {
    base_ = event_base_new();
  }

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  const char* method = event_base_get_method(base_);
  FTPD_LOG_DEBUG("dispatcher '{}' using libevent backend {}", name_,
                 method ? method : "unknown");

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }

  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[0]));
  evutil_make_socket_nonblocking(static_cast<evutil_socket_t>(wakeup_fd_[1]));
  evutil_make_socket_closeonexec(static_cast<evutil_socket_t>(wakeup_fd_[0]));
  evutil_make_socket_closeonexec(static_cast<evutil_socket_t>(wakeup_fd_[1]));

  wakeup_event_ =
      event_new(base_, static_cast<evutil_socket_t>(wakeup_fd_[0]),
                EV_READ | EV_PERSIST,
                reinterpret_cast<event_callback_fn>(
                    &LibeventDispatcher::postWakeupCallback),
                this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }

  if (event_add(wakeup_event_, nullptr) != 0) {
    throw std::runtime_error("Failed to add wakeup event");
  }
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  // Only the transition from empty to non-empty writes to the pipe. This
  // holds on the dispatcher thread too: a post made while the queue is being
  // drained must still wake the next blocking poll.
  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    // EAGAIN means the pipe already holds unread wake bytes
    (void)rc;
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  std::thread::id id = thread_id_.load();
  if (id == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == id;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), trigger,
                                         events);
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (!isThreadSafe()) {
    // Empty callback just to wake up
    post([]() {});
  } else {
    event_base_loopbreak(base_);
  }
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  int flags = 0;
  switch (type) {
    case RunType::Block:
      break;
    case RunType::NonBlock:
      flags = EVLOOP_NONBLOCK;
      break;
    case RunType::RunUntilExit:
      while (!exit_requested_) {
        if (event_base_loop(base_, EVLOOP_ONCE) < 0) {
          FTPD_LOG_ERROR("dispatcher '{}' event loop failed", name_);
          break;
        }
        runPostCallbacks();
      }
      // An exit() issued before run() is honored; clear it for reuse
      exit_requested_ = false;
      return;
  }

  if (event_base_loop(base_, flags) < 0) {
    FTPD_LOG_ERROR("dispatcher '{}' event loop failed", name_);
  }
  runPostCallbacks();
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  // Drain the pipe
  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }
}

// FileEventImpl implementation
LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher),
      fd_(fd),
      cb_(std::move(cb)),
      trigger_(trigger),
      enabled_events_(0) {
  event_ = event_new(dispatcher_.base(), fd_, 0,
                     reinterpret_cast<event_callback_fn>(
                         &FileEventImpl::eventCallback),
                     this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event");
  }

  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    if (event_added_) {
      event_del(event_);
    }
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  // Edge-triggered events are re-armed even if the mask is unchanged
  if (trigger_ != FileTriggerType::Edge && event_added_ &&
      enabled_events_ == events) {
    return;
  }
  enabled_events_ = events;

  // Only call event_del if the event was previously added
  if (event_added_) {
    event_del(event_);
    event_added_ = false;
  }

  if (events != 0) {
    assignEvents(events);
  }
}

void LibeventDispatcher::FileEventImpl::assignEvents(uint32_t events) {
  short libevent_events = toLibeventEvents(events, trigger_);
  event_assign(event_, dispatcher_.base(), fd_, libevent_events,
               reinterpret_cast<event_callback_fn>(
                   &FileEventImpl::eventCallback),
               this);
  if (event_add(event_, nullptr) != 0) {
    throw std::runtime_error("Failed to add file event");
  }
  event_added_ = true;
}

void LibeventDispatcher::FileEventImpl::eventCallback(int /*fd*/,
                                                      short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);

  uint32_t ready_events = fromLibeventEvents(events);
  if (ready_events != 0) {
    file_event->cb_(ready_events);
  }
}

// LibeventDispatcherFactory implementation
const std::string LibeventDispatcherFactory::backend_name_ = "libevent";

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  return backend_name_;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace ftpd
