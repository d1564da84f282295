// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/StringUtils.h"
#include "base/Utils.h"

using std::string;
using std::vector;

TEST(StringUtilsTest, ChangeCase) {
  string lowercase = "lowercase";
  EXPECT_EQ(lowercase, FIO::StringUtils::ToLower("LOWerCase"));

  string uppercase = "UPPERCASE";
  EXPECT_EQ(uppercase, FIO::StringUtils::ToUpper("UpperCase"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "    hello world    ";
  string notrailing = "    hello world";
  string noleading = "hello world    ";
  string noboth = "hello world";
  char ch = ' ';

  EXPECT_EQ(notrailing, FIO::StringUtils::RTrim(raw, ch));
  EXPECT_EQ(noleading, FIO::StringUtils::LTrim(raw, ch));
  EXPECT_EQ(noboth, FIO::StringUtils::Trim(raw, ch));
}

TEST(StringUtilsTest, Split) {
  using FIO::StringUtils::Split;
  vector<string> tokens = Split("MINIO_PROD_:mcp,MINIO_DEV_:mcd", ',');
  ASSERT_EQ(2u, tokens.size());
  EXPECT_EQ("MINIO_PROD_:mcp", tokens[0]);
  EXPECT_EQ("MINIO_DEV_:mcd", tokens[1]);

  tokens = Split("a,,b,", ',');
  ASSERT_EQ(4u, tokens.size());
  EXPECT_TRUE(tokens[1].empty());
  EXPECT_TRUE(tokens[3].empty());

  EXPECT_EQ(1u, Split("", ',').size());
}

TEST(StringUtilsTest, PrefixSuffix) {
  using FIO::StringUtils::EndsWith;
  using FIO::StringUtils::StartsWith;
  EXPECT_TRUE(StartsWith("https://a", "https"));
  EXPECT_FALSE(StartsWith("http", "https"));
  EXPECT_TRUE(EndsWith("file.fileio-part", ".fileio-part"));
  EXPECT_FALSE(EndsWith("part", ".fileio-part"));
}

TEST(StringUtilsTest, ParseBool) {
  using FIO::StringUtils::ParseBool;
  EXPECT_EQ(std::make_pair(true, true), ParseBool("TRUE"));
  EXPECT_EQ(std::make_pair(true, true), ParseBool(" on "));
  EXPECT_EQ(std::make_pair(true, false), ParseBool("0"));
  EXPECT_EQ(std::make_pair(true, false), ParseBool("no"));
  EXPECT_FALSE(ParseBool("maybe").first);
}

TEST(StringUtilsTest, ParseSize) {
  using FIO::StringUtils::ParseSize;
  EXPECT_EQ(4096u, ParseSize("4096").second);
  EXPECT_EQ(64u * 1024, ParseSize("64KB").second);
  EXPECT_EQ(64u * 1024, ParseSize("64k").second);
  EXPECT_EQ(8u * 1024 * 1024, ParseSize("8M").second);
  EXPECT_EQ(1024u * 1024 * 1024, ParseSize("1 GB").second);
  EXPECT_TRUE(ParseSize("50MB").first);

  EXPECT_FALSE(ParseSize("").first);
  EXPECT_FALSE(ParseSize("MB").first);
  EXPECT_FALSE(ParseSize("10TB").first);
  EXPECT_FALSE(ParseSize("-1").first);
}

TEST(StringUtilsTest, UriEncode) {
  using FIO::StringUtils::UriEncode;
  EXPECT_EQ("abc-_.~XYZ019", UriEncode("abc-_.~XYZ019", false));
  EXPECT_EQ("a%20b%2Fc", UriEncode("a b/c", false));
  EXPECT_EQ("a%20b/c", UriEncode("a b/c", true));
  EXPECT_EQ("%2B%3D%26", UriEncode("+=&", true));
}

TEST(StringUtilsTest, HexEncode) {
  const unsigned char data[] = {0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ("000fabff", FIO::StringUtils::HexEncode(data, sizeof(data)));
}

TEST(UtilsTest, PathHelpers) {
  using FIO::Utils::AppendPathDelim;
  using FIO::Utils::GetDirName;
  using FIO::Utils::JoinPath;
  EXPECT_EQ("/tmp/", AppendPathDelim("/tmp"));
  EXPECT_EQ("/tmp/", AppendPathDelim("/tmp/"));
  EXPECT_EQ("/mnt/share/a/b.txt", JoinPath("/mnt/share", "a/b.txt"));
  EXPECT_EQ("/mnt/share/a", JoinPath("/mnt/share/", "/a"));
  EXPECT_EQ("a", JoinPath("", "a"));
  EXPECT_EQ("/tmp/dir/", GetDirName("/tmp/dir/file"));
  EXPECT_EQ("/", GetDirName("/"));
  EXPECT_EQ("/", GetDirName("/file"));
  EXPECT_EQ("./", GetDirName("file"));
  EXPECT_EQ("/tmp/", GetDirName("/tmp/dir/"));
  EXPECT_TRUE(FIO::Utils::HasParentReference("a/../b"));
  EXPECT_TRUE(FIO::Utils::HasParentReference(".."));
  EXPECT_FALSE(FIO::Utils::HasParentReference("a/..b/c"));
  EXPECT_EQ("/tmp/a.txt.7-1.fileio-part",
            FIO::Utils::MakePartialPath("/tmp/a.txt", "7-1"));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
