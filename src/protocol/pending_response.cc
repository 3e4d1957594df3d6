#include "ftpd/protocol/pending_response.h"

#include <algorithm>

#include <fmt/format.h>

namespace ftpd {
namespace protocol {

const char* deferredActionKindToString(DeferredAction::Kind kind) {
  switch (kind) {
    case DeferredAction::Kind::StartListing:
      return "StartListing";
    case DeferredAction::Kind::StartDownload:
      return "StartDownload";
    case DeferredAction::Kind::StartUpload:
      return "StartUpload";
    case DeferredAction::Kind::CloseSession:
      return "CloseSession";
  }
  return "Unknown";
}

void PendingResponse::reset(ReplyCode code, const std::string& message) {
  buffer_ = formatReply(code, message);
  offset_ = 0;
  ++generation_;
}

void PendingResponse::reset(ReplyCode code) {
  reset(code, defaultReplyText(code));
}

void PendingResponse::append(ReplyCode code, const std::string& message) {
  if (flushed()) {
    buffer_.clear();
    offset_ = 0;
    ++generation_;
  }
  buffer_ += formatReply(code, message);
}

void PendingResponse::append(ReplyCode code) {
  append(code, defaultReplyText(code));
}

VoidResult PendingResponse::attach(DeferredAction action) {
  if (action_.has_value()) {
    return makeVoidError(Error(
        ErrorKind::Sequence,
        fmt::format("{} already pending",
                    deferredActionKindToString(action_->kind))));
  }
  action_ = std::move(action);
  return makeVoidSuccess();
}

PendingResponse::Unsent PendingResponse::unsent() const {
  Unsent result;
  result.generation = generation_;
  if (offset_ < buffer_.size()) {
    result.bytes = buffer_.substr(offset_);
  }
  return result;
}

void PendingResponse::consume(size_t bytes, uint64_t generation) {
  if (generation != generation_) {
    return;
  }
  offset_ = std::min(buffer_.size(), offset_ + bytes);
}

optional<DeferredAction> PendingResponse::takeActionIfFlushed() {
  if (!flushed() || !action_.has_value()) {
    return nullopt;
  }
  optional<DeferredAction> action = std::move(action_);
  action_.reset();
  return action;
}

}  // namespace protocol
}  // namespace ftpd
