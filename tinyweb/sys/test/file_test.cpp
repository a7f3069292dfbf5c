#include "tinyweb/file.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <string>
#include <string_view>

namespace tinyweb {

namespace {

std::string WriteTempFile(std::string_view name, std::string_view content) {
  std::string path = ::testing::TempDir() + std::string(name);
  std::ofstream ofs(path, std::ios::binary);
  ofs << content;
  return path;
}

}  // namespace

TEST(File, MissingFileIsFalsy) {
  File file("/nonexistent/path/to/nothing.html");
  EXPECT_FALSE(file);
}

TEST(File, DirectoryIsFalsy) {
  File file(::testing::TempDir());
  EXPECT_FALSE(file);
}

TEST(File, SizeContentTypeAndReadAt) {
  const auto path = WriteTempFile("tinyweb_file_test.css", "body { color: red; }");
  File file(path);
  ASSERT_TRUE(file);
  EXPECT_EQ(file.size(), 20U);
  EXPECT_EQ(file.detectedContentType(), "text/css");

  std::array<char, 8> buf;
  EXPECT_EQ(file.readAt(buf, 0), 8U);
  EXPECT_EQ(std::string_view(buf.data(), 8), "body { c");
  EXPECT_EQ(file.readAt(buf, 16), 4U);
  EXPECT_EQ(std::string_view(buf.data(), 4), "d; }");
  EXPECT_EQ(file.readAt(buf, 20), 0U);
  std::remove(path.c_str());
}

}  // namespace tinyweb
