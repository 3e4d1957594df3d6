#include <gtest/gtest.h>

#include <cerrno>
#include <string>

#include "ftpd/core/result.h"

namespace ftpd {
namespace {

TEST(ResultTest, SuccessHoldsValue) {
  auto result = makeSuccess(std::string("/pub"));
  ASSERT_FALSE(isError(result));
  EXPECT_EQ(get<std::string>(result), "/pub");
}

TEST(ResultTest, ErrorCarriesKindMessageAndCode) {
  auto result = makeError<int>(ErrorKind::Parse, "unknown verb", 502);
  ASSERT_TRUE(isError(result));

  const auto& error = get<Error>(result);
  EXPECT_EQ(error.kind, ErrorKind::Parse);
  EXPECT_EQ(error.message, "unknown verb");
  EXPECT_EQ(error.code, 502);
}

TEST(ResultTest, VoidResult) {
  EXPECT_FALSE(isError(makeVoidSuccess()));

  auto failed = makeVoidError(Error(ErrorKind::Sequence, "no data channel"));
  ASSERT_TRUE(isError(failed));
  EXPECT_EQ(get<Error>(failed).kind, ErrorKind::Sequence);
  EXPECT_EQ(get<Error>(failed).code, 0);
}

TEST(ResultTest, ErrorKindNames) {
  EXPECT_STREQ(errorKindToString(ErrorKind::Parse), "ParseError");
  EXPECT_STREQ(errorKindToString(ErrorKind::Sequence), "SequenceError");
  EXPECT_STREQ(errorKindToString(ErrorKind::Path), "PathError");
  EXPECT_STREQ(errorKindToString(ErrorKind::Io), "IoError");
  EXPECT_STREQ(errorKindToString(ErrorKind::Registration),
               "RegistrationError");
}

TEST(ResultTest, IoResultConversion) {
  auto ok = ioResultToResult(IoCallResult::success(42));
  ASSERT_FALSE(isError(ok));
  EXPECT_EQ(get<size_t>(ok), 42u);

  auto failed = ioResultToResult(IoCallResult::from_errno(ECONNRESET));
  ASSERT_TRUE(isError(failed));
  EXPECT_EQ(get<Error>(failed).kind, ErrorKind::Io);
  EXPECT_EQ(get<Error>(failed).code, ECONNRESET);

  auto void_failed = ioVoidResultToResult(IoVoidResult::error(EBADF));
  ASSERT_TRUE(isError(void_failed));
  EXPECT_FALSE(get<Error>(void_failed).message.empty());
}

TEST(IoResultTest, WouldBlock) {
  EXPECT_TRUE(IoCallResult::error(EAGAIN).wouldBlock());
  EXPECT_FALSE(IoCallResult::error(EPIPE).wouldBlock());
  EXPECT_FALSE(IoCallResult::success(0).wouldBlock());
  EXPECT_EQ(IoCallResult::success(0).error_code(), 0);
}

}  // namespace
}  // namespace ftpd
