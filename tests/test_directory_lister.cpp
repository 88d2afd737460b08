#include <gtest/gtest.h>

#include "TempDir.hpp"
#include "core/storage/DirectoryLister.hpp"

using namespace recstore;

TEST(DirectoryLister, MissingDirectoryIsEmpty) {
  TempDir tmp;
  DirectoryLister lister((tmp.path() / "nope").string());
  EXPECT_TRUE(lister.listVideos().empty());
  EXPECT_FALSE(lister.latestVideo().has_value());
  EXPECT_FALSE(lister.latestSnapshot().has_value());
}

TEST(DirectoryLister, ListsOnlyFinishedVideosNewestFirst) {
  TempDir tmp;
  tmp.write("old.webm", "1");
  tmp.write("mid.mp4", "22");
  tmp.write("new.webm", "333");
  tmp.write("live.webm.partial", "4444");
  tmp.write("s.jpg", "5");
  tmp.write("notes.txt", "6");
  tmp.age("old.webm", 300);
  tmp.age("mid.mp4", 200);
  tmp.age("new.webm", 100);

  DirectoryLister lister(tmp.str());
  auto vids = lister.listVideos();
  ASSERT_EQ(vids.size(), 3u);
  EXPECT_EQ(vids[0].filename, "new.webm");
  EXPECT_EQ(vids[1].filename, "mid.mp4");
  EXPECT_EQ(vids[2].filename, "old.webm");

  EXPECT_EQ(vids[0].bytes, 3u);
  EXPECT_EQ(vids[0].url, "/video/new.webm");
  EXPECT_EQ(vids[1].kind, ArtifactKind::Transcoded);
  EXPECT_EQ(vids[0].modified.size(), 20u);
  EXPECT_EQ(vids[0].modified.back(), 'Z');

  for (size_t i = 1; i < vids.size(); ++i)
    EXPECT_GT(vids[i - 1].modified_ns, vids[i].modified_ns);
}

TEST(DirectoryLister, LatestPrefersTranscodedCounterpart) {
  TempDir tmp;
  tmp.write("older.webm", "1");
  tmp.write("s1.mp4", "22");
  tmp.write("s1.webm", "333");
  tmp.age("older.webm", 300);
  tmp.age("s1.mp4", 200);
  tmp.age("s1.webm", 100); // raw is newer than its mp4

  DirectoryLister lister(tmp.str());
  auto latest = lister.latestVideo();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->filename, "s1.mp4");
}

TEST(DirectoryLister, LatestFallsBackToNewestRawWhenNothingTranscoded) {
  TempDir tmp;
  tmp.write("a.webm", "1");
  tmp.write("b.webm", "22");
  tmp.age("a.webm", 300);
  tmp.age("b.webm", 10);

  DirectoryLister lister(tmp.str());
  auto latest = lister.latestVideo();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->filename, "b.webm");
}

TEST(DirectoryLister, AnyMp4BeatsNewerRawRecording) {
  TempDir tmp;
  tmp.write("a.webm", "1");
  tmp.write("a.mp4", "22");
  tmp.write("b.webm", "333");
  tmp.age("a.webm", 300);
  tmp.age("a.mp4", 200);
  tmp.age("b.webm", 10);

  DirectoryLister lister(tmp.str());
  auto latest = lister.latestVideo();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->filename, "a.mp4");
}

TEST(DirectoryLister, NewestOfSeveralMp4Wins) {
  TempDir tmp;
  tmp.write("old.mp4", "1");
  tmp.write("new.mp4", "22");
  tmp.age("old.mp4", 300);
  tmp.age("new.mp4", 100);

  DirectoryLister lister(tmp.str());
  auto latest = lister.latestVideo();
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->filename, "new.mp4");
}

TEST(DirectoryLister, LatestSnapshotByMtime) {
  TempDir tmp;
  tmp.write("a.jpg", "A");
  tmp.write("b.jpg", "B");
  tmp.age("a.jpg", 5);
  tmp.age("b.jpg", 50);

  DirectoryLister lister(tmp.str());
  auto snap = lister.latestSnapshot();
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->filename, "a.jpg");
}
