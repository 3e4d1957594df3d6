#ifndef FTPD_CORE_RESULT_H
#define FTPD_CORE_RESULT_H

#include <string>
#include <type_traits>
#include <utility>

#include "ftpd/core/compat.h"
#include "ftpd/io_result.h"

namespace ftpd {

// Failure taxonomy of the server core. Parse, Sequence and Path errors are
// answered on the control channel; Io and Registration errors are fatal to
// the connection they happened on.
enum class ErrorKind {
  Parse,
  Sequence,
  Path,
  Io,
  Registration,
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Parse:
      return "ParseError";
    case ErrorKind::Sequence:
      return "SequenceError";
    case ErrorKind::Path:
      return "PathError";
    case ErrorKind::Io:
      return "IoError";
    case ErrorKind::Registration:
      return "RegistrationError";
  }
  return "UnknownError";
}

struct Error {
  ErrorKind kind{ErrorKind::Io};
  std::string message;
  int code{0};  // errno for Io errors, the reply code for Parse errors

  Error() = default;
  Error(ErrorKind k, std::string msg, int c = 0)
      : kind(k), message(std::move(msg)), code(c) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) { return VoidResult(error); }

template <typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(ErrorKind kind, const std::string& message, int code = 0) {
  return Result<T>(Error(kind, message, code));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

// Helper to convert IoResult to Result for connection-level errors
template <typename T>
Result<T> ioResultToResult(IoResult<T>&& io_result) {
  if (io_result.ok()) {
    return Result<T>(std::move(*io_result));
  }
  return makeError<T>(ErrorKind::Io, io_result.error_message(),
                      io_result.error_code());
}

inline VoidResult ioVoidResultToResult(const IoVoidResult& io_result) {
  if (io_result.ok()) {
    return makeVoidSuccess();
  }
  return makeVoidError(
      Error(ErrorKind::Io, io_result.error_message(), io_result.error_code()));
}

}  // namespace ftpd

#endif  // FTPD_CORE_RESULT_H
