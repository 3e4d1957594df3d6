#ifndef FTPD_EVENT_EVENT_LOOP_H
#define FTPD_EVENT_EVENT_LOOP_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ftpd {
namespace event {

class Dispatcher;
class FileEvent;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;

// Callback types
using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;

// File event types (matches epoll semantics)
enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04,
  Error = 0x08
};

// File trigger types
enum class FileTriggerType {
  // Level-triggered events - continuously fire while condition is met
  Level,

  // Edge-triggered events - fire only on state transitions (EPOLLET)
  Edge
};

// Run types for dispatcher
enum class RunType {
  Block,        // Run until no more events
  NonBlock,     // Run one iteration
  RunUntilExit  // Run until exit() is called, blocking for events
};

/**
 * @brief Abstract interface for file events
 *
 * File events monitor file descriptors for read/write/error conditions.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  /**
   * Enable the file event with a new set of event types to monitor.
   * Zero disarms the event without destroying it.
   */
  virtual void setEnabled(uint32_t events) = 0;
};

/**
 * @brief Main event dispatcher interface
 *
 * - Single-threaded event loop per dispatcher
 * - Thread-safe posting from other threads
 * - File events for socket readiness
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  /**
   * Post a callback to be executed in the dispatcher thread.
   * Thread-safe: can be called from any thread.
   */
  virtual void post(PostCb callback) = 0;

  /**
   * Check if the current thread is the dispatcher thread.
   */
  virtual bool isThreadSafe() const = 0;

  /**
   * Create a file event that monitors a file descriptor.
   * Throws std::runtime_error if the backend cannot register the event.
   */
  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  /**
   * Exit the event loop.
   */
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

/**
 * @brief Factory for creating dispatchers
 */
class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

/**
 * @brief Create a libevent-based dispatcher factory
 */
DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace ftpd

#endif  // FTPD_EVENT_EVENT_LOOP_H
