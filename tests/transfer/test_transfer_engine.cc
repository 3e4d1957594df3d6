#include <gtest/gtest.h>

#include <string>

#include <fcntl.h>
#include <sys/socket.h>

#include "ftpd/network/socket_interface.h"
#include "ftpd/transfer/transfer_engine.h"
#include "../support/temp_directory.h"

namespace ftpd {
namespace transfer {
namespace {

using network::IoHandlePtr;

class TransferEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    network::os_fd_t fds[2];
    ASSERT_TRUE(network::socketInterface()
                    .socketPair(network::SocketType::Stream, fds)
                    .ok());
    server_ = network::socketInterface().ioHandleForFd(fds[0]);
    client_ = network::socketInterface().ioHandleForFd(fds[1]);
  }

  std::string drainClient() {
    std::string received;
    char buffer[4096];
    while (true) {
      network::RawSlice slice{buffer, sizeof(buffer)};
      auto result = client_->readv(sizeof(buffer), &slice, 1);
      if (!result.ok() || *result == 0) {
        break;
      }
      received.append(buffer, *result);
    }
    return received;
  }

  void sendFromClient(const std::string& data) {
    network::ConstRawSlice slice{data.data(), data.size()};
    auto result = client_->writev(&slice, 1);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(*result, data.size());
  }

  fs::FileHandle openFile(const std::string& path, int flags) {
    return fs::FileHandle(::open(path.c_str(), flags | O_CLOEXEC, 0644));
  }

  test::TempDirectory dir_;
  IoHandlePtr server_;
  IoHandlePtr client_;
};

TEST_F(TransferEngineTest, InterestFollowsDirection) {
  EXPECT_EQ(TransferEngine::interestFor(Transfer()), 0u);
  EXPECT_EQ(TransferEngine::interestFor(Transfer(BufferPayload{"x", 0})),
            static_cast<uint32_t>(event::FileReadyType::Write));
  EXPECT_EQ(TransferEngine::interestFor(Transfer(FileStream{})),
            static_cast<uint32_t>(event::FileReadyType::Write));
  EXPECT_EQ(TransferEngine::interestFor(Transfer(FileSink{})),
            static_cast<uint32_t>(event::FileReadyType::Read));
}

TEST_F(TransferEngineTest, BufferPayloadIsSentInChunks) {
  TransferEngine engine(4);
  Transfer transfer = BufferPayload{"0123456789", 0};

  auto first = engine.onWritable(transfer, *server_);
  EXPECT_EQ(first.status, TransferProgress::Status::InProgress);
  EXPECT_EQ(first.bytes, 4u);

  auto second = engine.onWritable(transfer, *server_);
  EXPECT_EQ(second.status, TransferProgress::Status::InProgress);

  auto last = engine.onWritable(transfer, *server_);
  EXPECT_EQ(last.status, TransferProgress::Status::Complete);
  EXPECT_EQ(last.bytes, 2u);

  EXPECT_EQ(drainClient(), "0123456789");
}

TEST_F(TransferEngineTest, EmptyBufferCompletesImmediately) {
  TransferEngine engine(8192);
  Transfer transfer = BufferPayload{"", 0};

  auto progress = engine.onWritable(transfer, *server_);
  EXPECT_EQ(progress.status, TransferProgress::Status::Complete);
  EXPECT_EQ(progress.bytes, 0u);
}

TEST_F(TransferEngineTest, FileStreamSendsWholeFile) {
  std::string content(20000, 'a');
  for (size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<char>('a' + i % 26);
  }
  dir_.writeFile("payload.bin", content);

  TransferEngine engine(8192);
  Transfer transfer =
      FileStream{openFile(dir_.join("payload.bin"), O_RDONLY), 0};

  std::string received;
  TransferProgress progress;
  for (int i = 0; i < 100; ++i) {
    progress = engine.onWritable(transfer, *server_);
    received += drainClient();
    if (progress.status != TransferProgress::Status::InProgress) {
      break;
    }
  }

  EXPECT_EQ(progress.status, TransferProgress::Status::Complete);
  EXPECT_EQ(received, content);
  EXPECT_EQ(get<FileStream>(transfer).offset, content.size());
}

TEST_F(TransferEngineTest, FileStreamWouldBlockKeepsOffset) {
  // Fill the socket buffer so the next write would block
  int small = 4096;
  ::setsockopt(server_->fd(), SOL_SOCKET, SO_SNDBUF, &small, sizeof(small));
  std::string filler(1 << 16, 'f');
  while (true) {
    network::ConstRawSlice slice{filler.data(), filler.size()};
    if (!server_->writev(&slice, 1).ok()) {
      break;
    }
  }

  dir_.writeFile("blocked.txt", "blocked");
  TransferEngine engine(8192);
  Transfer transfer =
      FileStream{openFile(dir_.join("blocked.txt"), O_RDONLY), 0};

  auto progress = engine.onWritable(transfer, *server_);
  EXPECT_EQ(progress.status, TransferProgress::Status::InProgress);
  EXPECT_EQ(progress.bytes, 0u);
  EXPECT_EQ(get<FileStream>(transfer).offset, 0u);
}

TEST_F(TransferEngineTest, FileSinkWritesUntilEof) {
  TransferEngine engine(8192);
  Transfer transfer = FileSink{
      openFile(dir_.join("upload.txt"), O_WRONLY | O_CREAT | O_TRUNC), 0};

  sendFromClient("hello ");
  auto first = engine.onReadable(transfer, *server_);
  EXPECT_EQ(first.status, TransferProgress::Status::InProgress);
  EXPECT_EQ(first.bytes, 6u);

  // Nothing new yet
  auto idle = engine.onReadable(transfer, *server_);
  EXPECT_EQ(idle.status, TransferProgress::Status::InProgress);
  EXPECT_EQ(idle.bytes, 0u);

  sendFromClient("world");
  client_->shutdown(SHUT_WR);
  auto second = engine.onReadable(transfer, *server_);
  EXPECT_EQ(second.bytes, 5u);
  auto done = engine.onReadable(transfer, *server_);
  EXPECT_EQ(done.status, TransferProgress::Status::Complete);

  EXPECT_EQ(get<FileSink>(transfer).bytes_written, 11u);
  get<FileSink>(transfer).file.close();
  EXPECT_EQ(dir_.readFile("upload.txt"), "hello world");
}

TEST_F(TransferEngineTest, WrongDirectionFails) {
  TransferEngine engine(8192);

  Transfer upload = FileSink{};
  auto write_attempt = engine.onWritable(upload, *server_);
  EXPECT_EQ(write_attempt.status, TransferProgress::Status::Failed);
  ASSERT_TRUE(write_attempt.error.has_value());
  EXPECT_EQ(write_attempt.error->kind, ErrorKind::Io);

  Transfer download = BufferPayload{"x", 0};
  auto read_attempt = engine.onReadable(download, *server_);
  EXPECT_EQ(read_attempt.status, TransferProgress::Status::Failed);
}

TEST_F(TransferEngineTest, PeerCloseFailsDownload) {
  client_->close();

  TransferEngine engine(8192);
  Transfer transfer = BufferPayload{"lost", 0};
  auto progress = engine.onWritable(transfer, *server_);
  EXPECT_EQ(progress.status, TransferProgress::Status::Failed);
  ASSERT_TRUE(progress.error.has_value());
  EXPECT_EQ(progress.error->code, EPIPE);
}

}  // namespace
}  // namespace transfer
}  // namespace ftpd
