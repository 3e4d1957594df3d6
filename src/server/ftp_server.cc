#define FTPD_LOG_COMPONENT "Server.listener"

#include "ftpd/server/ftp_server.h"

#include <stdexcept>

#include "ftpd/logging/log_macros.h"
#include "ftpd/network/address.h"
#include "ftpd/network/socket_interface.h"
#include "ftpd/protocol/reply.h"

namespace ftpd {
namespace server {

namespace {

constexpr int kListenBacklog = 128;

}  // namespace

FtpServer::FtpServer(const config::ServerConfig& config,
                     fs::FileSystemSharedPtr file_system)
    : config_(config),
      file_system_(file_system ? std::move(file_system)
                               : std::make_shared<fs::LocalFileSystem>()) {
  dispatcher_ =
      event::createLibeventDispatcherFactory()->createDispatcher("ftpd");
  reactor_ = std::make_unique<Reactor>(*dispatcher_, registry_);
}

FtpServer::~FtpServer() {
  reactor_->joinWorkers();
  shutdownConnections();
}

VoidResult FtpServer::start() {
  auto root = fs::SessionRoot::create(config_.root_directory);
  if (isError(root)) {
    return makeVoidError(get<Error>(root));
  }

  StateMachineOptions options;
  options.max_command_length = config_.max_command_length;
  options.transfer_chunk_size = config_.transfer_chunk_size;
  options.passive_address = config_.passive_address;
  options.per_user_directories = config_.per_user_directories;
  state_machine_ = std::make_unique<ConnectionStateMachine>(
      *reactor_, registry_, file_system_,
      std::move(get<fs::SessionRoot>(root)), options);
  reactor_->setHandler(state_machine_.get());

  auto address = network::Address::parseInternetAddressNoPort(
      config_.listen_address, config_.port);
  if (!address) {
    return makeVoidError(
        Error(ErrorKind::Io,
              "invalid listen address '" + config_.listen_address + "'"));
  }

  auto listening = network::createListeningHandle(address, kListenBacklog);
  if (!listening.ok()) {
    return makeVoidError(Error(ErrorKind::Io,
                               "listen on " + address->asString() + ": " +
                                   listening.error_message(),
                               listening.error_code()));
  }
  listener_ = std::move(*listening);

  auto bound = listener_->localAddress();
  if (bound.ok() && *bound && (*bound)->ip()) {
    listen_port_ = static_cast<uint16_t>((*bound)->ip()->port());
  }

  try {
    listener_->initializeFileEvent(
        *dispatcher_, [this](uint32_t) { onAcceptReady(); },
        event::FileTriggerType::Level,
        static_cast<uint32_t>(event::FileReadyType::Read));
  } catch (const std::runtime_error& e) {
    listener_.reset();
    return makeVoidError(Error(ErrorKind::Registration, e.what()));
  }

  FTPD_LOG_INFO("listening on {}:{} serving {}", config_.listen_address,
                listen_port_, config_.root_directory);
  return makeVoidSuccess();
}

void FtpServer::run() {
  running_ = true;
  dispatcher_->run(event::RunType::RunUntilExit);
  running_ = false;

  reactor_->joinWorkers();
  shutdownConnections();
  listener_.reset();
  FTPD_LOG_INFO("server stopped");
}

void FtpServer::stop() { dispatcher_->exit(); }

void FtpServer::onAcceptReady() {
  while (true) {
    auto accepted = listener_->accept();
    if (!accepted.ok()) {
      if (!accepted.wouldBlock()) {
        FTPD_LOG_ERROR("accept: {}", accepted.error_message());
      }
      return;
    }

    if (registry_.controlChannelCount() >= config_.max_connections) {
      FTPD_LOG_WARNING("connection limit {} reached, refusing client",
                       config_.max_connections);
      std::string refusal =
          protocol::formatReply(protocol::ReplyCode::TooManyUsers);
      network::ConstRawSlice slice{refusal.data(), refusal.size()};
      auto written = (*accepted)->writev(&slice, 1);
      if (!written.ok()) {
        FTPD_LOG_DEBUG("refusal not delivered: {}", written.error_message());
      }
      continue;
    }

    state_machine_->acceptControl(std::move(*accepted));
  }
}

void FtpServer::shutdownConnections() {
  // Handles own their file events, so dropping them here is enough
  for (ConnectionId id : registry_.ids()) {
    registry_.remove(id);
  }
}

}  // namespace server
}  // namespace ftpd
