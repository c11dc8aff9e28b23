#include "../Utilities.h"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace hc {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, AbcProducesKnownHash) {
  EXPECT_EQ(sha256("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, BinaryInputIsHashedWhole) {
  std::string withNull("a\0b", 3);
  EXPECT_NE(sha256(withNull), sha256("a"));
  EXPECT_EQ(sha256(withNull).size(), 64u);
}

TEST(Sha256Test, OutputIsLowercaseHex) {
  std::string hash = sha256("test");
  EXPECT_EQ(hash.size(), 64u);
  for (char c : hash) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexEncodeTest, EncodesBytes) {
  EXPECT_EQ(hexEncode(""), "");
  EXPECT_EQ(hexEncode(std::string("\x00\x0f\xff", 3)), "000fff");
  EXPECT_EQ(hexEncode("AB"), "4142");
}

TEST(TimeTest, CurrentTimeIsPlausible) {
  // 2020-01-01T00:00:00Z
  EXPECT_GT(getCurrentTime(), 1577836800);
}

TEST(TimeTest, FormatTimestampLocalHasDate) {
  std::string formatted = formatTimestampLocal(getCurrentTime());
  EXPECT_GE(formatted.size(), 19u);
  EXPECT_EQ(formatted[4], '-');
  EXPECT_EQ(formatted[7], '-');
}

class LoadJsonFileTest : public ::testing::Test {
protected:
  void TearDown() override { std::remove(path_.c_str()); }

  void writeFile(const std::string &content) {
    std::ofstream out(path_);
    out << content;
  }

  std::string path_ = "hashchain_utilities_test.json";
};

TEST_F(LoadJsonFileTest, ParsesDocument) {
  writeFile(R"({"difficulty": 3, "miningReward": 12.5})");
  auto result = loadJsonFile(path_);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value()["difficulty"].get<int>(), 3);
  EXPECT_DOUBLE_EQ(result.value()["miningReward"].get<double>(), 12.5);
}

TEST_F(LoadJsonFileTest, MissingFileIsError) {
  auto result = loadJsonFile("no_such_hashchain_config.json");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST_F(LoadJsonFileTest, MalformedJsonIsError) {
  writeFile("{ difficulty: ");
  auto result = loadJsonFile(path_);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
}

} // namespace utl
} // namespace hc
