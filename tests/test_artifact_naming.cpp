#include <gtest/gtest.h>

#include "core/storage/ArtifactNaming.hpp"

using namespace recstore;

TEST(ArtifactNaming, NamesEachKind) {
  EXPECT_EQ(artifactName("abc", ArtifactKind::PartialVideo), "abc.webm.partial");
  EXPECT_EQ(artifactName("abc", ArtifactKind::Video), "abc.webm");
  EXPECT_EQ(artifactName("abc", ArtifactKind::Transcoded), "abc.mp4");
  EXPECT_EQ(artifactName("abc", ArtifactKind::Snapshot), "abc.jpg");
}

TEST(ArtifactNaming, ClassifyPrefersPartialOverWebm) {
  EXPECT_EQ(classify("s1.webm.partial"), ArtifactKind::PartialVideo);
  EXPECT_EQ(classify("s1.webm"), ArtifactKind::Video);
  EXPECT_EQ(classify("s1.mp4"), ArtifactKind::Transcoded);
  EXPECT_EQ(classify("s1.jpg"), ArtifactKind::Snapshot);
  EXPECT_FALSE(classify("notes.txt").has_value());
  EXPECT_FALSE(classify(".webm").has_value());
}

TEST(ArtifactNaming, RejectsNamesThatLeaveTheDirectory) {
  EXPECT_TRUE(isSafeName("f47ac10b-58cc-4372-a567-0e02b2c3d479"));
  EXPECT_TRUE(isSafeName("clip.webm"));
  EXPECT_FALSE(isSafeName(""));
  EXPECT_FALSE(isSafeName("."));
  EXPECT_FALSE(isSafeName(".."));
  EXPECT_FALSE(isSafeName("../etc/passwd"));
  EXPECT_FALSE(isSafeName("a\\b"));
  EXPECT_FALSE(isSafeName(std::string("a\0b", 3)));
}

TEST(ArtifactNaming, ContentTypes) {
  EXPECT_EQ(contentTypeFor("x.webm"), "video/webm");
  EXPECT_EQ(contentTypeFor("x.mp4"), "video/mp4");
  EXPECT_EQ(contentTypeFor("x.jpg"), "image/jpeg");
  EXPECT_EQ(contentTypeFor("x.webm.partial"), "application/octet-stream");
  EXPECT_EQ(contentTypeFor("x.bin"), "application/octet-stream");
}
