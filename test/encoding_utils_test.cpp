#include <gtest/gtest.h>

#include <coderunner/utils/encoding_utils.hpp>

#include <set>

using coderunner::utils::EncodingUtils;

TEST(EncodingUtils, Base64KnownVectors) {
  EXPECT_EQ(EncodingUtils::ToBase64(""), "");
  EXPECT_EQ(EncodingUtils::ToBase64("f"), "Zg==");
  EXPECT_EQ(EncodingUtils::ToBase64("fo"), "Zm8=");
  EXPECT_EQ(EncodingUtils::ToBase64("foo"), "Zm9v");
  EXPECT_EQ(EncodingUtils::ToBase64("foobar"), "Zm9vYmFy");
}

TEST(EncodingUtils, Base64DecodeTrimsPadding) {
  EXPECT_EQ(EncodingUtils::FromBase64("Zg=="), "f");
  EXPECT_EQ(EncodingUtils::FromBase64("Zm8="), "fo");
  EXPECT_EQ(EncodingUtils::FromBase64("Zm9vYmFy"), "foobar");
  EXPECT_EQ(EncodingUtils::FromBase64(""), "");
}

TEST(EncodingUtils, Base64IsBinarySafe) {
  std::string bytes;
  for (int i = 0; i < 256; ++i) bytes.push_back(static_cast<char>(i));
  auto encoded = EncodingUtils::ToBase64(bytes);
  EXPECT_EQ(encoded.size(), EncodingUtils::Base64Length(bytes.size()));
  EXPECT_EQ(EncodingUtils::FromBase64(encoded), bytes);
}

TEST(EncodingUtils, Base64RejectsMalformedInput) {
  EXPECT_FALSE(EncodingUtils::FromBase64("abc"));
  EXPECT_FALSE(EncodingUtils::FromBase64("ab!d"));
  EXPECT_FALSE(EncodingUtils::FromBase64("a=bc"));
  EXPECT_FALSE(EncodingUtils::FromBase64("Zg==Zg=="));
  EXPECT_FALSE(EncodingUtils::FromBase64("Zm9v\n"));
}

TEST(EncodingUtils, RandomHexTokens) {
  std::set<std::string> seen;
  for (int i = 0; i < 50; ++i) {
    auto token = EncodingUtils::RandomHex(32);
    EXPECT_EQ(token.size(), 64u);
    EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
    seen.insert(token);
  }
  EXPECT_EQ(seen.size(), 50u);
}

TEST(EncodingUtils, ToHex) {
  EXPECT_EQ(EncodingUtils::ToHex(std::string("\x00\x0f\xff", 3)), "000fff");
}
