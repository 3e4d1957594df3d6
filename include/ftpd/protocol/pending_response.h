#ifndef FTPD_PROTOCOL_PENDING_RESPONSE_H
#define FTPD_PROTOCOL_PENDING_RESPONSE_H

#include <cstdint>
#include <string>

#include "ftpd/core/compat.h"
#include "ftpd/core/result.h"
#include "ftpd/protocol/reply.h"

namespace ftpd {
namespace protocol {

// Work that may only start once the reply preceding it is on the wire
struct DeferredAction {
  enum class Kind {
    StartListing,
    StartDownload,
    StartUpload,
    CloseSession,
  };

  Kind kind{Kind::CloseSession};
  std::string path;  // Canonical host path; unused for CloseSession
};

const char* deferredActionKindToString(DeferredAction::Kind kind);

/**
 * Outgoing reply bytes of one control channel plus an optional deferred
 * action.
 *
 * The buffer is written outside the connection lock, so the writer takes a
 * snapshot with unsent() and reports progress with consume(). Every reset()
 * bumps the generation; progress reported against an older generation is
 * discarded because the bytes it refers to were replaced.
 */
class PendingResponse {
 public:
  struct Unsent {
    std::string bytes;
    uint64_t generation;
  };

  // Replace any unflushed reply
  void reset(ReplyCode code, const std::string& message);
  void reset(ReplyCode code);

  // Queue a reply behind whatever is still unflushed
  void append(ReplyCode code, const std::string& message);
  void append(ReplyCode code);

  // Fails with a SequenceError when an action is already waiting
  VoidResult attach(DeferredAction action);

  Unsent unsent() const;
  void consume(size_t bytes, uint64_t generation);

  bool flushed() const { return offset_ >= buffer_.size(); }
  bool hasAction() const { return action_.has_value(); }
  const optional<DeferredAction>& action() const { return action_; }

  // Returns the action at most once, and only after everything is sent
  optional<DeferredAction> takeActionIfFlushed();

  uint64_t generation() const { return generation_; }

 private:
  std::string buffer_;
  size_t offset_{0};
  optional<DeferredAction> action_;
  uint64_t generation_{0};
};

}  // namespace protocol
}  // namespace ftpd

#endif  // FTPD_PROTOCOL_PENDING_RESPONSE_H
