#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "ftpd/server/ftp_server.h"
#include "../support/temp_directory.h"

namespace ftpd {
namespace test {

// Blocking loopback socket with a receive timeout; -1 on failure
inline int connectLoopback(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }
  struct timeval tv {5, 0};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) !=
      0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

// Listening loopback socket on an ephemeral port
inline int listenLoopback(uint16_t& port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }
  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len = sizeof(addr);
  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) !=
          0 ||
      ::listen(fd, 4) != 0 ||
      ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) !=
          0) {
    ::close(fd);
    return -1;
  }
  port = ntohs(addr.sin_port);
  return fd;
}

// Reads until EOF or timeout
inline std::string readUntilClosed(int fd) {
  std::string data;
  char buffer[4096];
  while (true) {
    ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    data.append(buffer, static_cast<size_t>(n));
  }
  return data;
}

inline bool sendAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n =
        ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

/**
 * Minimal line-oriented FTP client for driving a live server.
 * Every command waits for its reply before the next one is sent.
 */
class FtpTestClient {
 public:
  FtpTestClient() = default;
  ~FtpTestClient() { close(); }

  FtpTestClient(const FtpTestClient&) = delete;
  FtpTestClient& operator=(const FtpTestClient&) = delete;

  bool connect(uint16_t port) {
    fd_ = connectLoopback(port);
    return fd_ >= 0;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }

  bool sendRaw(const std::string& bytes) { return sendAll(fd_, bytes); }

  bool send(const std::string& line) { return sendRaw(line + "\r\n"); }

  // One CRLF-terminated reply line without the terminator; "" on EOF or
  // timeout
  std::string readReply() {
    while (true) {
      size_t end = buffer_.find("\r\n");
      if (end != std::string::npos) {
        std::string line = buffer_.substr(0, end);
        buffer_.erase(0, end + 2);
        return line;
      }
      char chunk[1024];
      ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
      if (n <= 0) {
        return "";
      }
      buffer_.append(chunk, static_cast<size_t>(n));
    }
  }

  std::string command(const std::string& line) {
    if (!send(line)) {
      return "";
    }
    return readReply();
  }

  // True once the server has closed the control connection
  bool waitForClose() {
    char byte;
    while (true) {
      ssize_t n = ::recv(fd_, &byte, 1, 0);
      if (n == 0) {
        return true;
      }
      if (n < 0) {
        return errno == ECONNRESET;
      }
    }
  }

  // Port announced in a "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)." reply
  static int passivePort(const std::string& reply) {
    size_t open = reply.find('(');
    if (open == std::string::npos) {
      return -1;
    }
    unsigned h1, h2, h3, h4, p1, p2;
    if (std::sscanf(reply.c_str() + open, "(%u,%u,%u,%u,%u,%u)", &h1, &h2, &h3,
                    &h4, &p1, &p2) != 6) {
      return -1;
    }
    return static_cast<int>(p1 * 256 + p2);
  }

  static std::string portArgument(uint16_t port) {
    return "127,0,0,1," + std::to_string(port / 256) + "," +
           std::to_string(port % 256);
  }

  // PASV plus connect; returns the data socket or -1
  int enterPassive() {
    std::string reply = command("PASV");
    if (reply.compare(0, 3, "227") != 0) {
      return -1;
    }
    int port = passivePort(reply);
    if (port <= 0) {
      return -1;
    }
    return connectLoopback(static_cast<uint16_t>(port));
  }

 private:
  int fd_{-1};
  std::string buffer_;
};

/**
 * Runs an FtpServer on loopback over a scratch root directory.
 */
class FtpServerTestBase : public ::testing::Test {
 protected:
  void SetUp() override {}

  void TearDown() override { stopServer(); }

  virtual void configure(config::ServerConfig& config) { (void)config; }

  void startServer() {
    config::ServerConfig config;
    config.listen_address = "127.0.0.1";
    config.port = 0;
    config.root_directory = root_.path();
    config.max_connections = 8;
    configure(config);

    server_ = std::make_unique<server::FtpServer>(config);
    auto started = server_->start();
    ASSERT_FALSE(isError(started)) << get<Error>(started).message;
    thread_ = std::thread([this]() { server_->run(); });
  }

  void stopServer() {
    if (!server_) {
      return;
    }
    server_->stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    server_.reset();
  }

  uint16_t port() const { return server_->listenPort(); }

  // Connects and consumes the greeting
  std::unique_ptr<FtpTestClient> connectClient() {
    auto client = std::make_unique<FtpTestClient>();
    if (!client->connect(port())) {
      ADD_FAILURE() << "connect to control port failed";
      return client;
    }
    std::string greeting = client->readReply();
    EXPECT_EQ(greeting.substr(0, 3), "220");
    return client;
  }

  // Number of registered connections whose role matches
  size_t countRole(const std::string& role) {
    size_t count = 0;
    for (auto id : server_->registry().ids()) {
      auto matches =
          server_->registry().withConnection(id, [&](server::Connection& c) {
            return role == server::connectionRoleToString(c);
          });
      if (matches && *matches) {
        ++count;
      }
    }
    return count;
  }

  // linked_data of the only control channel
  optional<server::ConnectionId> linkedData() {
    for (auto id : server_->registry().ids()) {
      auto linked = server_->registry().withConnection(
          id, [](server::Connection& c) -> optional<server::ConnectionId> {
            if (auto* control = get_if<server::ControlChannel>(&c)) {
              return control->linked_data;
            }
            return nullopt;
          });
      if (linked && *linked) {
        return *linked;
      }
    }
    return nullopt;
  }

  bool waitFor(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout =
                   std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (condition()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
  }

  TempDirectory root_;
  std::unique_ptr<server::FtpServer> server_;
  std::thread thread_;
};

}  // namespace test
}  // namespace ftpd
