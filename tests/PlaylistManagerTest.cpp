#include <memory>
#include <flex/player/Playlist/PlaylistManager.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "mocks/MockDirectoryLister.hpp"

using flex::player::playlist::MockDirectoryLister;
using flex::player::playlist::PlaylistManager;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

class PlaylistManagerTest : public ::testing::Test {
protected:
  PlaylistManagerTest()
      : lister_(std::make_shared<::testing::NiceMock<MockDirectoryLister>>()) {}

  void expectListing(const QString &directory, const QStringList &files) {
    EXPECT_CALL(*lister_, listAudioFiles(directory, _))
        .WillRepeatedly(DoAll(SetArgReferee<1>(files), Return(true)));
  }

  std::shared_ptr<::testing::NiceMock<MockDirectoryLister>> lister_;
};

} // namespace

TEST_F(PlaylistManagerTest, SequentialNavigationWrapsAround) {
  // Unsorted on purpose, the manager sorts the listing
  expectListing("/music", {"/music/c.mp3", "/music/a.mp3", "/music/b.mp3"});
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");
  ASSERT_EQ(playlist.count(), 3);
  EXPECT_EQ(playlist.currentIndex(), 0);
  EXPECT_EQ(playlist.currentFolder(), "/music");

  EXPECT_EQ(playlist.next(false), "/music/b.mp3");
  EXPECT_EQ(playlist.next(false), "/music/c.mp3");
  EXPECT_EQ(playlist.next(false), "/music/a.mp3");
}

TEST_F(PlaylistManagerTest, PreviousWrapsToLastTrack) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3", "/music/c.mp3"});
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");

  EXPECT_EQ(playlist.previous(false), "/music/c.mp3");
  EXPECT_EQ(playlist.previous(false), "/music/b.mp3");
  EXPECT_EQ(playlist.currentIndex(), 1);
}

TEST_F(PlaylistManagerTest, ShuffleNeverRepeatsCurrentTrack) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3", "/music/c.mp3",
                           "/music/d.mp3"});
  PlaylistManager playlist(lister_, true, 1234u);
  playlist.buildFromFolder("/music/b.mp3");

  QString current = "/music/b.mp3";
  for (int i = 0; i < 1000; ++i) {
    const QString picked = playlist.next(true);
    ASSERT_NE(picked, current) << "iteration " << i;
    ASSERT_TRUE(playlist.tracks().contains(picked));
    current = picked;
  }
}

TEST_F(PlaylistManagerTest, ShuffleWithTwoTracksAlternates) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3"});
  PlaylistManager playlist(lister_, true, 7u);
  playlist.buildFromFolder("/music/a.mp3");

  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(playlist.next(true), "/music/b.mp3");
    EXPECT_EQ(playlist.previous(true), "/music/a.mp3");
  }
}

TEST_F(PlaylistManagerTest, ShuffleOnSingleTrackReturnsSameTrack) {
  expectListing("/music", {"/music/only.mp3"});
  PlaylistManager playlist(lister_);
  playlist.buildFromFolder("/music/only.mp3");

  EXPECT_EQ(playlist.next(true), "/music/only.mp3");
  EXPECT_EQ(playlist.previous(true), "/music/only.mp3");
}

TEST_F(PlaylistManagerTest, SameFolderSkipsRescan) {
  EXPECT_CALL(*lister_, listAudioFiles(QString("/music"), _))
      .Times(1)
      .WillOnce(DoAll(SetArgReferee<1>(QStringList{"/music/a.mp3",
                                                   "/music/b.mp3",
                                                   "/music/c.mp3"}),
                      Return(true)));
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");
  playlist.buildFromFolder("/music/c.mp3");

  EXPECT_EQ(playlist.currentIndex(), 2);
}

TEST_F(PlaylistManagerTest, UnknownFileInSameFolderTriggersRescan) {
  EXPECT_CALL(*lister_, listAudioFiles(QString("/music"), _))
      .WillOnce(DoAll(SetArgReferee<1>(QStringList{"/music/a.mp3"}),
                      Return(true)))
      .WillOnce(DoAll(SetArgReferee<1>(QStringList{"/music/a.mp3",
                                                   "/music/new.mp3"}),
                      Return(true)));
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");
  playlist.buildFromFolder("/music/new.mp3");

  EXPECT_EQ(playlist.count(), 2);
  EXPECT_EQ(playlist.currentIndex(), 1);
}

TEST_F(PlaylistManagerTest, FileMissingFromListingStartsAtZero) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3"});
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/ghost.mp3");

  EXPECT_EQ(playlist.currentIndex(), 0);
  EXPECT_EQ(playlist.count(), 2);
}

TEST_F(PlaylistManagerTest, FolderChangeRebuildsPlaylist) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3"});
  expectListing("/other", {"/other/x.mp3", "/other/y.mp3", "/other/z.mp3"});
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/b.mp3");
  playlist.buildFromFolder("/other/y.mp3");

  EXPECT_EQ(playlist.currentFolder(), "/other");
  EXPECT_EQ(playlist.count(), 3);
  EXPECT_EQ(playlist.currentIndex(), 1);
}

TEST_F(PlaylistManagerTest, EmptyListingYieldsSingleEntry) {
  expectListing("/music", {});
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");

  EXPECT_EQ(playlist.tracks(), QStringList{"/music/a.mp3"});
  EXPECT_EQ(playlist.currentIndex(), 0);
  EXPECT_EQ(playlist.next(false), "/music/a.mp3");
}

TEST_F(PlaylistManagerTest, ListingFailureYieldsSingleEntry) {
  EXPECT_CALL(*lister_, listAudioFiles(QString("/music"), _))
      .WillOnce(Return(false));
  PlaylistManager playlist(lister_);

  playlist.buildFromFolder("/music/a.mp3");

  EXPECT_EQ(playlist.tracks(), QStringList{"/music/a.mp3"});
}

TEST_F(PlaylistManagerTest, EmptyPlaylistReturnsEmptyPath) {
  PlaylistManager playlist(lister_);

  EXPECT_TRUE(playlist.next(false).isEmpty());
  EXPECT_TRUE(playlist.previous(true).isEmpty());
  EXPECT_EQ(playlist.currentIndex(), -1);
}

TEST_F(PlaylistManagerTest, ToggleShuffleKeepsIndex) {
  expectListing("/music", {"/music/a.mp3", "/music/b.mp3", "/music/c.mp3"});
  PlaylistManager playlist(lister_);
  playlist.buildFromFolder("/music/b.mp3");

  EXPECT_FALSE(playlist.shuffleEnabled());
  EXPECT_TRUE(playlist.toggleShuffle());
  EXPECT_TRUE(playlist.shuffleEnabled());
  EXPECT_EQ(playlist.currentIndex(), 1);
  EXPECT_FALSE(playlist.toggleShuffle());
  EXPECT_EQ(playlist.currentIndex(), 1);
}
