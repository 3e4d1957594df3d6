#ifndef FTPD_SERVER_FTP_SERVER_H
#define FTPD_SERVER_FTP_SERVER_H

#include <atomic>
#include <memory>

#include "ftpd/config/server_config.h"
#include "ftpd/core/result.h"
#include "ftpd/event/event_loop.h"
#include "ftpd/fs/file_system.h"
#include "ftpd/network/io_handle.h"
#include "ftpd/server/connection_registry.h"
#include "ftpd/server/connection_state_machine.h"
#include "ftpd/server/reactor.h"

namespace ftpd {
namespace server {

/**
 * Control listener plus the reactor serving every session on one dispatcher.
 *
 * Usage:
 *   FtpServer server(config);
 *   auto started = server.start();
 *   if (isError(started)) { ... }
 *   std::thread loop([&] { server.run(); });
 *   ...
 *   server.stop();
 *   loop.join();
 */
class FtpServer {
 public:
  explicit FtpServer(const config::ServerConfig& config,
                     fs::FileSystemSharedPtr file_system = nullptr);
  ~FtpServer();

  FtpServer(const FtpServer&) = delete;
  FtpServer& operator=(const FtpServer&) = delete;

  // Binds the control address and registers it with the dispatcher
  VoidResult start();

  // Runs the dispatcher until stop(); tears every connection down on return
  void run();

  // Thread-safe
  void stop();

  bool isRunning() const { return running_.load(); }

  // Bound control port; 0 before start()
  uint16_t listenPort() const { return listen_port_; }

  event::Dispatcher& dispatcher() { return *dispatcher_; }
  ConnectionRegistry& registry() { return registry_; }
  Reactor& reactor() { return *reactor_; }

 private:
  void onAcceptReady();
  void shutdownConnections();

  config::ServerConfig config_;
  fs::FileSystemSharedPtr file_system_;
  event::DispatcherPtr dispatcher_;
  ConnectionRegistry registry_;
  std::unique_ptr<Reactor> reactor_;
  std::unique_ptr<ConnectionStateMachine> state_machine_;
  network::IoHandlePtr listener_;
  uint16_t listen_port_{0};
  std::atomic<bool> running_{false};
};

}  // namespace server
}  // namespace ftpd

#endif  // FTPD_SERVER_FTP_SERVER_H
