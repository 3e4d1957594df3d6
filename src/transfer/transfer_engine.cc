#include "ftpd/transfer/transfer_engine.h"

#include <algorithm>

#include <fmt/format.h>

namespace ftpd {
namespace transfer {

namespace {

TransferProgress complete() {
  TransferProgress progress;
  progress.status = TransferProgress::Status::Complete;
  return progress;
}

TransferProgress failed(Error error) {
  TransferProgress progress;
  progress.status = TransferProgress::Status::Failed;
  progress.error = std::move(error);
  return progress;
}

template <typename T>
TransferProgress ioFailure(const char* what, const IoResult<T>& result) {
  return failed(Error(ErrorKind::Io,
                      fmt::format("{}: {}", what, result.error_message()),
                      result.error_code()));
}

}  // namespace

TransferEngine::TransferEngine(size_t chunk_size)
    : chunk_size_(std::max<size_t>(chunk_size, 1)), scratch_(chunk_size_) {}

uint32_t TransferEngine::interestFor(const Transfer& transfer) {
  switch (transfer.index()) {
    case 1:  // BufferPayload
    case 2:  // FileStream
      return static_cast<uint32_t>(event::FileReadyType::Write);
    case 3:  // FileSink
      return static_cast<uint32_t>(event::FileReadyType::Read);
    default:
      return 0;
  }
}

TransferProgress TransferEngine::writeChunk(const void* data,
                                            size_t length,
                                            network::IoHandle& socket) {
  network::ConstRawSlice slice{data, length};
  auto result = socket.writev(&slice, 1);
  if (!result.ok()) {
    if (result.wouldBlock()) {
      return TransferProgress{};
    }
    return ioFailure("data write", result);
  }
  TransferProgress progress;
  progress.bytes = *result;
  return progress;
}

TransferProgress TransferEngine::onWritable(Transfer& transfer,
                                            network::IoHandle& socket) {
  if (auto* payload = get_if<BufferPayload>(&transfer)) {
    if (payload->remaining() == 0) {
      return complete();
    }
    size_t length = std::min(payload->remaining(), chunk_size_);
    auto progress =
        writeChunk(payload->bytes.data() + payload->offset, length, socket);
    payload->offset += progress.bytes;
    if (progress.status == TransferProgress::Status::InProgress &&
        payload->remaining() == 0) {
      progress.status = TransferProgress::Status::Complete;
    }
    return progress;
  }

  if (auto* stream = get_if<FileStream>(&transfer)) {
    auto read = stream->file.readAt(stream->offset, scratch_.data(),
                                    scratch_.size());
    if (!read.ok()) {
      return ioFailure("file read", read);
    }
    if (*read == 0) {
      return complete();
    }
    auto progress = writeChunk(scratch_.data(), *read, socket);
    // Bytes read but not sent are read again on the next event
    stream->offset += progress.bytes;
    return progress;
  }

  return failed(Error(ErrorKind::Io,
                      fmt::format("{} transfer is not writable",
                                  transferKindToString(transfer))));
}

TransferProgress TransferEngine::onReadable(Transfer& transfer,
                                            network::IoHandle& socket) {
  auto* sink = get_if<FileSink>(&transfer);
  if (sink == nullptr) {
    return failed(Error(ErrorKind::Io,
                        fmt::format("{} transfer is not readable",
                                    transferKindToString(transfer))));
  }

  network::RawSlice slice{scratch_.data(), scratch_.size()};
  auto read = socket.readv(scratch_.size(), &slice, 1);
  if (!read.ok()) {
    if (read.wouldBlock()) {
      return TransferProgress{};
    }
    return ioFailure("data read", read);
  }
  if (*read == 0) {
    return complete();
  }

  auto written = sink->file.write(scratch_.data(), *read);
  if (!written.ok()) {
    return ioFailure("file write", written);
  }
  sink->bytes_written += *written;

  TransferProgress progress;
  progress.bytes = *read;
  return progress;
}

}  // namespace transfer
}  // namespace ftpd
