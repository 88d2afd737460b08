#include <gtest/gtest.h>

#include "TempDir.hpp"
#include "core/storage/LocalFSBackend.hpp"

using namespace recstore;

TEST(LocalFSBackend, InitCreatesNestedRoot) {
  TempDir tmp;
  LocalFSBackend fs((tmp.path() / "a" / "videos").string());
  fs.init();
  EXPECT_TRUE(std::filesystem::is_directory(tmp.path() / "a" / "videos"));
}

TEST(LocalFSBackend, AppendChunkAccumulatesInOrder) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());

  EXPECT_EQ(fs.appendChunk("s1", "abc"), 3u);
  EXPECT_EQ(fs.appendChunk("s1", ""), 3u);
  EXPECT_EQ(fs.appendChunk("s1", "defg"), 7u);

  EXPECT_EQ(tmp.read("s1.webm.partial"), "abcdefg");
  EXPECT_FALSE(tmp.exists("s1.webm"));
}

TEST(LocalFSBackend, AppendKeepsBinaryBytes) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());
  const std::string blob("\x1a\x45\xdf\xa3\x00\xff\r\n", 8);
  EXPECT_EQ(fs.appendChunk("bin", blob), 8u);
  EXPECT_EQ(tmp.read("bin.webm.partial"), blob);
}

TEST(LocalFSBackend, SnapshotOverwrites) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());

  EXPECT_EQ(fs.putSnapshot("s1", "first-image-longer"), "s1.jpg");
  EXPECT_EQ(fs.putSnapshot("s1", "second"), "s1.jpg");
  EXPECT_EQ(tmp.read("s1.jpg"), "second");
}

TEST(LocalFSBackend, PromoteRenamesPartial) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());
  fs.appendChunk("s1", "xyz");

  fs.promotePartial("s1");
  EXPECT_FALSE(fs.exists("s1", ArtifactKind::PartialVideo));
  EXPECT_TRUE(fs.exists("s1", ArtifactKind::Video));
  EXPECT_EQ(tmp.read("s1.webm"), "xyz");
}

TEST(LocalFSBackend, PromoteWithoutPartialThrows) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());
  EXPECT_THROW(fs.promotePartial("nobody"), std::runtime_error);
}

TEST(LocalFSBackend, AppendIntoMissingRootThrows) {
  TempDir tmp;
  LocalFSBackend fs((tmp.path() / "does-not-exist").string());
  EXPECT_THROW(fs.appendChunk("s1", "abc"), std::runtime_error);
}

TEST(LocalFSBackend, ResolveOnlyExistingPlainNames) {
  TempDir tmp;
  LocalFSBackend fs(tmp.str());
  tmp.write("a.webm", "1");
  std::filesystem::create_directories(tmp.path() / "sub");

  ASSERT_TRUE(fs.resolve("a.webm").has_value());
  EXPECT_EQ(*fs.resolve("a.webm"), (tmp.path() / "a.webm").string());
  EXPECT_FALSE(fs.resolve("b.webm").has_value());
  EXPECT_FALSE(fs.resolve("sub").has_value());
  EXPECT_FALSE(fs.resolve("..").has_value());
  EXPECT_FALSE(fs.resolve("../a.webm").has_value());
}
