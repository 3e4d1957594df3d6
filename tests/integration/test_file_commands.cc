#include <gtest/gtest.h>

#include <unistd.h>

#include <string>

#include "ftp_test_client.h"

namespace ftpd {
namespace test {
namespace {

const char* const kOkay = "250 Requested file action okay, completed.";
const char* const kUnavailable =
    "550 Requested action not taken. File unavailable.";

class FileCommandTest : public FtpServerTestBase {
 protected:
  void SetUp() override {
    root_.makeDirectory("pub");
    root_.writeFile("pub/readme.txt", "read me\n");
    startServer();
    client_ = connectClient();
  }

  // Runs a RETR over a fresh passive connection and returns the bytes
  std::string download(const std::string& path) {
    int data = client_->enterPassive();
    EXPECT_GE(data, 0);
    std::string reply = client_->command("RETR " + path);
    EXPECT_EQ(reply.substr(0, 3), "150") << reply;
    std::string bytes = readUntilClosed(data);
    ::close(data);
    EXPECT_EQ(client_->readReply().substr(0, 3), "226");
    return bytes;
  }

  void upload(const std::string& path, const std::string& bytes) {
    int data = client_->enterPassive();
    ASSERT_GE(data, 0);
    std::string reply = client_->command("STOR " + path);
    ASSERT_EQ(reply.substr(0, 3), "150") << reply;
    ASSERT_TRUE(sendAll(data, bytes));
    ::close(data);
    EXPECT_EQ(client_->readReply().substr(0, 3), "226");
  }

  std::string listing(const std::string& argument) {
    int data = client_->enterPassive();
    EXPECT_GE(data, 0);
    std::string command = argument.empty() ? "LIST" : "LIST " + argument;
    EXPECT_EQ(client_->command(command).substr(0, 3), "150");
    std::string bytes = readUntilClosed(data);
    ::close(data);
    EXPECT_EQ(client_->readReply().substr(0, 3), "226");
    return bytes;
  }

  std::unique_ptr<FtpTestClient> client_;
};

TEST_F(FileCommandTest, UploadThenDownload) {
  std::string content;
  for (int i = 0; i < 5000; ++i) {
    content += "line " + std::to_string(i) + "\n";
  }
  upload("pub/upload.txt", content);
  EXPECT_EQ(root_.readFile("pub/upload.txt"), content);
  EXPECT_EQ(download("pub/upload.txt"), content);
}

TEST_F(FileCommandTest, UploadReplacesExistingFile) {
  upload("pub/readme.txt", "short");
  EXPECT_EQ(root_.readFile("pub/readme.txt"), "short");
}

TEST_F(FileCommandTest, EmptyUpload) {
  upload("empty.bin", "");
  EXPECT_TRUE(root_.exists("empty.bin"));
  EXPECT_EQ(root_.readFile("empty.bin"), "");
}

TEST_F(FileCommandTest, DownloadRelativeToWorkingDirectory) {
  EXPECT_EQ(client_->command("CWD pub"), kOkay);
  EXPECT_EQ(download("readme.txt"), "read me\n");
  EXPECT_EQ(download("/pub/readme.txt"), "read me\n");
}

TEST_F(FileCommandTest, MissingFileFailsBeforePreliminaryReply) {
  int data = client_->enterPassive();
  ASSERT_GE(data, 0);
  EXPECT_EQ(client_->command("RETR nothing.txt"), kUnavailable);
  EXPECT_EQ(client_->command("RETR pub"), kUnavailable);
  EXPECT_EQ(client_->command("STOR pub"), kUnavailable);

  // The data connection is still usable
  EXPECT_EQ(client_->command("RETR pub/readme.txt").substr(0, 3), "150");
  EXPECT_EQ(readUntilClosed(data), "read me\n");
  ::close(data);
  EXPECT_EQ(client_->readReply().substr(0, 3), "226");
}

TEST_F(FileCommandTest, PathsCannotEscapeRoot) {
  int data = client_->enterPassive();
  ASSERT_GE(data, 0);
  EXPECT_EQ(client_->command("RETR ../../../etc/passwd"), kUnavailable);
  EXPECT_EQ(client_->command("STOR ../escape.txt"), kUnavailable);
  EXPECT_EQ(client_->command("CWD /.."), kUnavailable);
  EXPECT_EQ(client_->command("MKD ../outside"), kUnavailable);
  ::close(data);
}

TEST_F(FileCommandTest, SymlinkOutsideRootIsRejected) {
  TempDirectory outside;
  outside.writeFile("secret.txt", "secret");
  ASSERT_EQ(::symlink(outside.join("secret.txt").c_str(),
                      root_.join("link.txt").c_str()),
            0);

  int data = client_->enterPassive();
  ASSERT_GE(data, 0);
  EXPECT_EQ(client_->command("RETR link.txt"), kUnavailable);
  ::close(data);
}

TEST_F(FileCommandTest, ListDirectory) {
  std::string text = listing("");
  EXPECT_NE(text.find(" pub\r\n"), std::string::npos);
  EXPECT_EQ(text.substr(0, 1), "d");

  std::string sub = listing("pub");
  EXPECT_NE(sub.find(" readme.txt\r\n"), std::string::npos);
  EXPECT_EQ(sub.substr(0, 1), "-");

  // ls-style flags list the working directory
  EXPECT_NE(listing("-la").find(" pub\r\n"), std::string::npos);
}

TEST_F(FileCommandTest, ListMissingDirectory) {
  int data = client_->enterPassive();
  ASSERT_GE(data, 0);
  EXPECT_EQ(client_->command("LIST nowhere"), kUnavailable);
  ::close(data);
}

TEST_F(FileCommandTest, WorkingDirectory) {
  EXPECT_EQ(client_->command("CWD pub"), kOkay);
  EXPECT_EQ(client_->command("PWD"), "257 \"/pub\"");
  EXPECT_EQ(client_->command("CWD missing"), kUnavailable);
  EXPECT_EQ(client_->command("PWD"), "257 \"/pub\"");
  EXPECT_EQ(client_->command("CWD readme.txt"), kUnavailable);
  EXPECT_EQ(client_->command("CWD .."), kOkay);
  EXPECT_EQ(client_->command("PWD"), "257 \"/\"");
  EXPECT_EQ(client_->command("CWD /pub"), kOkay);
  EXPECT_EQ(client_->command("CWD /"), kOkay);
}

TEST_F(FileCommandTest, MakeAndRemoveDirectory) {
  EXPECT_EQ(client_->command("MKD incoming"),
            "257 'incoming' directory created.");
  EXPECT_TRUE(root_.exists("incoming"));
  EXPECT_EQ(client_->command("MKD incoming"), kUnavailable);

  EXPECT_EQ(client_->command("RMD incoming"), kOkay);
  EXPECT_FALSE(root_.exists("incoming"));
  EXPECT_EQ(client_->command("RMD incoming"), kUnavailable);
  EXPECT_EQ(client_->command("RMD pub/readme.txt"), kUnavailable);
  EXPECT_EQ(client_->command("RMD /"), kUnavailable);
}

TEST_F(FileCommandTest, RemoveDirectoryWithContents) {
  EXPECT_EQ(client_->command("RMD pub"), kOkay);
  EXPECT_FALSE(root_.exists("pub"));
}

TEST_F(FileCommandTest, DeleteFile) {
  EXPECT_EQ(client_->command("DELE pub/readme.txt"), kOkay);
  EXPECT_FALSE(root_.exists("pub/readme.txt"));
  EXPECT_EQ(client_->command("DELE pub/readme.txt"), kUnavailable);
  EXPECT_EQ(client_->command("DELE pub"), kUnavailable);
}

TEST_F(FileCommandTest, Rename) {
  EXPECT_EQ(client_->command("RNFR pub/readme.txt"),
            "350 Requested file action pending further information.");
  EXPECT_EQ(client_->command("RNTO pub/renamed.txt"), kOkay);
  EXPECT_FALSE(root_.exists("pub/readme.txt"));
  EXPECT_EQ(root_.readFile("pub/renamed.txt"), "read me\n");
}

TEST_F(FileCommandTest, RenameSequenceErrors) {
  EXPECT_EQ(client_->command("RNTO x.txt"), "503 Bad sequence of commands.");
  EXPECT_EQ(client_->command("RNFR missing.txt"), kUnavailable);
  EXPECT_EQ(client_->command("RNTO x.txt"), "503 Bad sequence of commands.");

  // Any other command in between cancels the pending rename
  EXPECT_EQ(client_->command("RNFR pub/readme.txt").substr(0, 3), "350");
  EXPECT_EQ(client_->command("NOOP"), "200 Command okay.");
  EXPECT_EQ(client_->command("RNTO x.txt"), "503 Bad sequence of commands.");
  EXPECT_TRUE(root_.exists("pub/readme.txt"));
}

}  // namespace
}  // namespace test
}  // namespace ftpd
