#define FTPD_LOG_COMPONENT "Server.main"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

#include <signal.h>

#include "ftpd/config/config_loader.h"
#include "ftpd/logging/log_macros.h"
#include "ftpd/server/ftp_server.h"

namespace {

std::atomic<bool> g_shutdown(false);

void signal_handler(int) { g_shutdown = true; }

}  // namespace

int main(int argc, char* argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);
  // Peer resets are reported through write results instead
  signal(SIGPIPE, SIG_IGN);

  try {
    auto options = ftpd::config::ConfigLoader::parseCommandLine(argc, argv);
    if (options.show_help) {
      std::cout << ftpd::config::ConfigLoader::usage(argv[0]);
      return 0;
    }

    ftpd::config::ConfigLoader loader;
    ftpd::config::ServerConfig config = loader.load(options);
    ftpd::config::applyLoggingConfig(config.logging);

    std::error_code ec;
    if (!std::filesystem::exists(config.root_directory, ec)) {
      std::filesystem::create_directories(config.root_directory, ec);
      if (ec) {
        std::cerr << "Error: cannot create root directory "
                  << config.root_directory << ": " << ec.message()
                  << std::endl;
        return 1;
      }
      FTPD_LOG_INFO("created root directory {}", config.root_directory);
    }

    ftpd::server::FtpServer server(config);
    auto started = server.start();
    if (auto* error = ftpd::get_if<ftpd::Error>(&started)) {
      std::cerr << "Error: " << ftpd::errorKindToString(error->kind) << ": "
                << error->message << std::endl;
      return 1;
    }

    std::thread loop([&server]() { server.run(); });

    while (!g_shutdown) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    FTPD_LOG_INFO("shutting down");
    server.stop();
    loop.join();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
