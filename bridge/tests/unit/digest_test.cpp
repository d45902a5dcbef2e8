#include <fstream>

#include <gtest/gtest.h>

#include "bridge/digest.hpp"

TEST(DigestTest, Sha256KnownVectors) {
  EXPECT_EQ(bridge::Sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(bridge::Sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestTest, DigestFileMatchesInMemoryHash) {
  auto path = std::filesystem::temp_directory_path() / ("bridge_digest_" + bridge::RandomHex(6));
  {
    std::ofstream out(path, std::ios::binary);
    out << "hello resource";
  }
  auto digest = bridge::DigestFile(path);
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(digest->size_bytes, 14u);
  EXPECT_EQ(digest->sha256, bridge::Sha256Hex("hello resource"));
  std::filesystem::remove(path);
  EXPECT_FALSE(bridge::DigestFile(path).has_value());
}

TEST(DigestTest, Base64EncodesAndDecodes) {
  EXPECT_EQ(bridge::Base64Encode("hello"), "aGVsbG8=");
  EXPECT_EQ(bridge::Base64Encode(""), "");
  auto decoded = bridge::Base64Decode("aGVsbG8=");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, "hello");
}

TEST(DigestTest, Base64DecodeToleratesWhitespaceAndMissingPadding) {
  auto decoded = bridge::Base64Decode("aGVs\nbG8");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, "hello");
}

TEST(DigestTest, Base64DecodeRejectsGarbage) { EXPECT_FALSE(bridge::Base64Decode("@@@@").has_value()); }

TEST(DigestTest, IdentifiersAreRandomAndWellFormed) {
  auto a = bridge::NewUuid();
  auto b = bridge::NewUuid();
  EXPECT_EQ(a.size(), 36u);
  EXPECT_NE(a, b);
  EXPECT_EQ(bridge::RandomHex(16).size(), 32u);
  EXPECT_TRUE(bridge::IsSha256Hex(bridge::Sha256Hex("x")));
  EXPECT_FALSE(bridge::IsSha256Hex("xyz"));
}
