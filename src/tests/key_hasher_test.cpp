#include <gtest/gtest.h>
#include <set>
#include <string>
#include "utils/key_hasher.hpp"

using namespace webimg::utils;

TEST(KeyHasherTest, KnownDigest) {
  // SHA-256("abc")
  EXPECT_EQ(KeyHasher::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(KeyHasher::sha256_hex("").size(), 64u);
}

TEST(KeyHasherTest, StableAcrossCalls) {
  const std::string key = "https://example.com/images/photo.png?size=large";
  const std::string first = KeyHasher::filename_for_key(key);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(KeyHasher::filename_for_key(key), first);
  }
  // Value fixed by the digest, so it survives process restarts
  EXPECT_EQ(first, KeyHasher::sha256_hex(key) + ".png");
}

TEST(KeyHasherTest, DistinctKeysDistinctNames) {
  std::set<std::string> names;
  for (int i = 0; i < 1000; ++i) {
    names.insert(KeyHasher::filename_for_key("https://example.com/img/" + std::to_string(i) + ".jpg"));
  }
  EXPECT_EQ(names.size(), 1000u);
}

TEST(KeyHasherTest, ExtensionFromUrlPath) {
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com/a/b/photo.JPG"), "JPG");
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com/a/photo.webp?v=2#top"), "webp");
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com/a/photo"), "");
  // Dots in the host are not an extension
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com"), "");
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com/"), "");
  // Query strings never contribute
  EXPECT_EQ(KeyHasher::extension_for_key("https://example.com/img?file=a.png"), "");
}

TEST(KeyHasherTest, ExtensionFromPlainKey) {
  EXPECT_EQ(KeyHasher::extension_for_key("avatar.gif"), "gif");
  EXPECT_EQ(KeyHasher::extension_for_key("folder/avatar.tiff"), "tiff");
  EXPECT_EQ(KeyHasher::extension_for_key(".hidden"), "");
  EXPECT_EQ(KeyHasher::extension_for_key("trailing."), "");
}

TEST(KeyHasherTest, UnsafeExtensionsDropped) {
  EXPECT_EQ(KeyHasher::extension_for_key("file.a-b"), "");
  EXPECT_EQ(KeyHasher::extension_for_key("file.p ng"), "");
  EXPECT_EQ(KeyHasher::extension_for_key("file." + std::string(17, 'x')), "");
  EXPECT_EQ(KeyHasher::extension_for_key("file." + std::string(16, 'x')), std::string(16, 'x'));

  const std::string name = KeyHasher::filename_for_key("https://example.com/x.p%2Fng");
  EXPECT_EQ(name.find('/'), std::string::npos);
  EXPECT_EQ(name, KeyHasher::legacy_filename_for_key("https://example.com/x.p%2Fng"));
}

TEST(KeyHasherTest, LegacyNameHasNoExtension) {
  const std::string key = "https://example.com/photo.png";
  EXPECT_EQ(KeyHasher::legacy_filename_for_key(key), KeyHasher::sha256_hex(key));
  EXPECT_EQ(KeyHasher::filename_for_key(key), KeyHasher::legacy_filename_for_key(key) + ".png");
}
