#include <gtest/gtest.h>

#include <ctime>

#include <sys/stat.h>

#include "ftpd/fs/file_system.h"
#include "../support/temp_directory.h"

namespace ftpd {
namespace fs {
namespace {

class LocalFileSystemTest : public ::testing::Test {
 protected:
  test::TempDirectory dir_;
  LocalFileSystem fs_;
};

TEST_F(LocalFileSystemTest, OpenAndReadAt) {
  dir_.writeFile("data.txt", "0123456789");

  auto opened = fs_.open(dir_.join("data.txt"));
  ASSERT_FALSE(isError(opened));
  auto& file = get<FileHandle>(opened);
  EXPECT_TRUE(file.isOpen());

  char buffer[4];
  auto read = file.readAt(6, buffer, sizeof(buffer));
  ASSERT_TRUE(read.ok());
  EXPECT_EQ(std::string(buffer, *read), "6789");

  auto eof = file.readAt(10, buffer, sizeof(buffer));
  ASSERT_TRUE(eof.ok());
  EXPECT_EQ(*eof, 0u);
}

TEST_F(LocalFileSystemTest, OpenRejectsMissingAndDirectories) {
  auto missing = fs_.open(dir_.join("missing.txt"));
  ASSERT_TRUE(isError(missing));
  EXPECT_EQ(get<Error>(missing).kind, ErrorKind::Io);
  EXPECT_EQ(get<Error>(missing).code, ENOENT);

  dir_.makeDirectory("sub");
  auto directory = fs_.open(dir_.join("sub"));
  ASSERT_TRUE(isError(directory));
  EXPECT_EQ(get<Error>(directory).code, EISDIR);
}

TEST_F(LocalFileSystemTest, CreateTruncates) {
  dir_.writeFile("out.txt", "old content that is long");

  auto created = fs_.create(dir_.join("out.txt"));
  ASSERT_FALSE(isError(created));
  auto written = get<FileHandle>(created).write("new", 3);
  ASSERT_TRUE(written.ok());
  EXPECT_EQ(*written, 3u);
  get<FileHandle>(created).close();

  EXPECT_EQ(dir_.readFile("out.txt"), "new");
}

TEST_F(LocalFileSystemTest, FileHandleMoveTransfersOwnership) {
  dir_.writeFile("a.txt", "a");
  auto opened = fs_.open(dir_.join("a.txt"));
  ASSERT_FALSE(isError(opened));

  FileHandle first = std::move(get<FileHandle>(opened));
  EXPECT_TRUE(first.isOpen());
  FileHandle second(std::move(first));
  EXPECT_FALSE(first.isOpen());
  EXPECT_TRUE(second.isOpen());
}

TEST_F(LocalFileSystemTest, ListIsSortedByName) {
  dir_.writeFile("b.txt", "bb");
  dir_.writeFile("a.txt", "a");
  dir_.makeDirectory("c");

  auto listed = fs_.list(dir_.path());
  ASSERT_FALSE(isError(listed));
  const auto& entries = get<std::vector<DirEntry>>(listed);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].name, "a.txt");
  EXPECT_EQ(entries[0].size, 1u);
  EXPECT_FALSE(entries[0].is_directory);
  EXPECT_EQ(entries[1].name, "b.txt");
  EXPECT_EQ(entries[2].name, "c");
  EXPECT_TRUE(entries[2].is_directory);
}

TEST_F(LocalFileSystemTest, ListOfFileListsItself) {
  dir_.writeFile("single.txt", "12345");

  auto listed = fs_.list(dir_.join("single.txt"));
  ASSERT_FALSE(isError(listed));
  const auto& entries = get<std::vector<DirEntry>>(listed);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].name, "single.txt");
  EXPECT_EQ(entries[0].size, 5u);
}

TEST_F(LocalFileSystemTest, ListOfMissingPathFails) {
  EXPECT_TRUE(isError(fs_.list(dir_.join("missing"))));
}

TEST_F(LocalFileSystemTest, DirectoryLifecycle) {
  EXPECT_FALSE(isError(fs_.makeDirectory(dir_.join("made"))));
  EXPECT_TRUE(fs_.isDirectory(dir_.join("made")));

  // Already exists
  auto again = fs_.makeDirectory(dir_.join("made"));
  ASSERT_TRUE(isError(again));
  EXPECT_EQ(get<Error>(again).code, EEXIST);

  dir_.writeFile("made/inner.txt", "x");
  dir_.makeDirectory("made/nested");
  EXPECT_FALSE(isError(fs_.removeDirectory(dir_.join("made"))));
  EXPECT_FALSE(fs_.exists(dir_.join("made")));
}

TEST_F(LocalFileSystemTest, RemoveDirectoryRejectsFiles) {
  dir_.writeFile("plain.txt", "x");
  EXPECT_TRUE(isError(fs_.removeDirectory(dir_.join("plain.txt"))));
  EXPECT_TRUE(dir_.exists("plain.txt"));
}

TEST_F(LocalFileSystemTest, RemoveFile) {
  dir_.writeFile("gone.txt", "x");
  EXPECT_FALSE(isError(fs_.removeFile(dir_.join("gone.txt"))));
  EXPECT_FALSE(dir_.exists("gone.txt"));

  EXPECT_TRUE(isError(fs_.removeFile(dir_.join("gone.txt"))));

  dir_.makeDirectory("keep");
  EXPECT_TRUE(isError(fs_.removeFile(dir_.join("keep"))));
  EXPECT_TRUE(dir_.exists("keep"));
}

TEST_F(LocalFileSystemTest, Rename) {
  dir_.writeFile("from.txt", "payload");
  EXPECT_FALSE(isError(fs_.rename(dir_.join("from.txt"), dir_.join("to.txt"))));
  EXPECT_FALSE(dir_.exists("from.txt"));
  EXPECT_EQ(dir_.readFile("to.txt"), "payload");

  EXPECT_TRUE(
      isError(fs_.rename(dir_.join("from.txt"), dir_.join("again.txt"))));
}

TEST(ListingTest, FormatsLongListingLine) {
  DirEntry entry;
  entry.name = "notes.txt";
  entry.mode = S_IFREG | 0644;
  entry.size = 1234;
  entry.nlink = 1;
  entry.owner = "ftp";
  entry.group = "users";
  entry.mtime = std::time(nullptr);

  std::string line = formatListingLine(entry);
  EXPECT_EQ(line.substr(0, 10), "-rw-r--r--");
  EXPECT_NE(line.find(" 1 ftp users     1234 "), std::string::npos);
  EXPECT_EQ(line.substr(line.size() - 11), "notes.txt\r\n");
}

TEST(ListingTest, DirectoryAndSymlinkTypeChars) {
  DirEntry dir;
  dir.name = "sub";
  dir.is_directory = true;
  dir.mode = S_IFDIR | 0755;
  EXPECT_EQ(formatListingLine(dir).substr(0, 10), "drwxr-xr-x");

  DirEntry link;
  link.name = "link";
  link.is_symlink = true;
  link.mode = S_IFLNK | 0777;
  EXPECT_EQ(formatListingLine(link).substr(0, 10), "lrwxrwxrwx");
}

TEST(ListingTest, ListingConcatenatesLines) {
  DirEntry a;
  a.name = "a";
  DirEntry b;
  b.name = "b";
  std::string listing = formatListing({a, b});
  EXPECT_EQ(listing, formatListingLine(a) + formatListingLine(b));
  EXPECT_TRUE(formatListing({}).empty());
}

}  // namespace
}  // namespace fs
}  // namespace ftpd
