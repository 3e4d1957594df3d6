#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "ftpd/logging/log_formatter.h"
#include "ftpd/logging/log_sink.h"

using namespace ftpd::logging;

class LogSinkTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("ftpd_log_sink_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  LogMessage makeMessage(const std::string& text,
                         LogLevel level = LogLevel::Info) {
    LogMessage msg;
    msg.level = level;
    msg.message = text;
    msg.logger_name = "test";
    return msg;
  }

  static std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::filesystem::path dir_;
};

TEST_F(LogSinkTest, NullSink) {
  NullSink sink;
  sink.log(makeMessage("dropped"));
  sink.flush();
  EXPECT_EQ(sink.type(), SinkType::Null);
  EXPECT_FALSE(sink.supportsRotation());
}

TEST_F(LogSinkTest, ExternalSinkReceivesFormattedRecord) {
  LogLevel seen_level = LogLevel::Off;
  std::string seen_logger;
  std::string seen_text;
  ExternalSink sink([&](LogLevel level, const std::string& logger,
                        const std::string& text) {
    seen_level = level;
    seen_logger = logger;
    seen_text = text;
  });

  sink.log(makeMessage("control connection 7 closed", LogLevel::Warning));

  EXPECT_EQ(seen_level, LogLevel::Warning);
  EXPECT_EQ(seen_logger, "test");
  EXPECT_NE(seen_text.find("control connection 7 closed"), std::string::npos);
  EXPECT_NE(seen_text.find("[WARNING]"), std::string::npos);
  EXPECT_EQ(sink.type(), SinkType::External);
}

TEST_F(LogSinkTest, RotatingFileSinkWrites) {
  RotatingFileSink::Config config;
  config.base_filename = (dir_ / "ftpd.log").string();
  {
    RotatingFileSink sink(config);
    sink.log(makeMessage("first"));
    sink.log(makeMessage("second"));
    EXPECT_TRUE(sink.supportsRotation());
  }

  std::string content = readFile(dir_ / "ftpd.log");
  EXPECT_NE(content.find("first"), std::string::npos);
  EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(LogSinkTest, RotatingFileSinkRotatesBySize) {
  RotatingFileSink::Config config;
  config.base_filename = (dir_ / "ftpd.log").string();
  config.max_file_size = 100;
  config.max_files = 2;
  {
    RotatingFileSink sink(config);
    for (int i = 0; i < 20; ++i) {
      sink.log(makeMessage("line " + std::to_string(i)));
    }
  }

  EXPECT_TRUE(std::filesystem::exists(dir_ / "ftpd.log"));
  EXPECT_TRUE(std::filesystem::exists(dir_ / "ftpd.log.1"));
  EXPECT_FALSE(std::filesystem::exists(dir_ / "ftpd.log.3"));
  EXPECT_NE(readFile(dir_ / "ftpd.log").find("line 19"), std::string::npos);
}

TEST_F(LogSinkTest, SinkFactory) {
  auto stdio = SinkFactory::createStdioSink();
  ASSERT_NE(stdio, nullptr);
  EXPECT_EQ(stdio->type(), SinkType::Stdio);

  auto null_sink = SinkFactory::createNullSink();
  EXPECT_EQ(null_sink->type(), SinkType::Null);

  auto file = SinkFactory::createFileSink((dir_ / "factory.log").string());
  EXPECT_EQ(file->type(), SinkType::File);

  auto external = SinkFactory::createExternalSink(
      [](LogLevel, const std::string&, const std::string&) {});
  EXPECT_EQ(external->type(), SinkType::External);
}

TEST_F(LogSinkTest, JsonFormatter) {
  std::string captured;
  ExternalSink sink([&](LogLevel, const std::string&, const std::string& text) {
    captured = text;
  });
  sink.setFormatter(std::make_unique<JsonFormatter>());

  LogMessage msg = makeMessage("RETR \"a\tb\"", LogLevel::Error);
  msg.connection_id = 12;
  msg.file = "/src/server/reactor.cc";
  msg.line = 113;
  sink.log(msg);

  auto record = nlohmann::json::parse(captured);
  EXPECT_EQ(record["message"], "RETR \"a\tb\"");
  EXPECT_EQ(record["level"], "ERROR");
  EXPECT_EQ(record["logger"], "test");
  EXPECT_EQ(record["connection_id"], 12);
  EXPECT_EQ(record["file"], "reactor.cc");
  EXPECT_EQ(record["line"], 113);

  sink.log(makeMessage("untagged"));
  EXPECT_FALSE(nlohmann::json::parse(captured).contains("connection_id"));
}

TEST_F(LogSinkTest, DefaultFormatterTagsConnection) {
  DefaultFormatter formatter;

  LogMessage tagged = makeMessage("control: closed");
  tagged.connection_id = 7;
  tagged.file = "/src/server/connection_state_machine.cc";
  tagged.line = 1098;
  std::string text = formatter.format(tagged);
  EXPECT_NE(text.find("[INFO] [test] [conn:7] control: closed"),
            std::string::npos);
  EXPECT_NE(text.find("(connection_state_machine.cc:1098)"),
            std::string::npos);

  std::string plain = formatter.format(makeMessage("listening"));
  EXPECT_EQ(plain.find("[conn:"), std::string::npos);
  EXPECT_NE(plain.find("[test] listening"), std::string::npos);
}
