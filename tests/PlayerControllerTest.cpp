#include <memory>
#include <vector>
#include <QObject>
#include <QString>
#include <flex/player/Control/PlayerController.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "EngineTestSupport.hpp"
#include "mocks/MockAudioDecoder.hpp"
#include "mocks/MockAudioOutput.hpp"
#include "mocks/MockConfiguration.hpp"
#include "mocks/MockDirectoryLister.hpp"

using flex::player::analysis::SpectrumAnalyzer;
using flex::player::configuration::AnalyzerSettings;
using flex::player::configuration::MockConfiguration;
using flex::player::control::PlayerController;
using flex::player::decoder::MockAudioDecoder;
using flex::player::output::MockAudioOutput;
using flex::player::output::RenderCallback;
using flex::player::playback::PlaybackEngine;
using flex::player::playback::PlaybackStatus;
using flex::player::playlist::MockDirectoryLister;
using flex::player::playlist::PlaylistManager;
using flex::player::test::makeConstant;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::SetArgReferee;

namespace {

constexpr uint32_t cTrackFrames = 100;

class PlayerControllerTest : public ::testing::Test {
protected:
  PlayerControllerTest()
      : configuration_(std::make_shared<NiceMock<MockConfiguration>>()),
        decoder_(std::make_shared<NiceMock<MockAudioDecoder>>()),
        output_(std::make_shared<NiceMock<MockAudioOutput>>()),
        lister_(std::make_shared<NiceMock<MockDirectoryLister>>()),
        analyzer_(AnalyzerSettings{}), playlist_(lister_) {
    ON_CALL(*configuration_, getChunkFrames()).WillByDefault(Return(2048));
    ON_CALL(*configuration_, getDefaultVolume()).WillByDefault(Return(100));
    ON_CALL(*configuration_, autoAdvance()).WillByDefault(Return(true));
    ON_CALL(*output_, open(_, _, _))
        .WillByDefault(DoAll(SaveArg<1>(&callback_), SaveArg<2>(&userData_),
                             Return(true)));
    ON_CALL(*output_, start()).WillByDefault(Return(true));
    ON_CALL(*lister_, listAudioFiles(QString("/music"), _))
        .WillByDefault(DoAll(SetArgReferee<1>(QStringList{"/music/a.mp3",
                                                          "/music/b.mp3",
                                                          "/music/c.mp3"}),
                             Return(true)));
    ON_CALL(*decoder_, decode(_, _))
        .WillByDefault(DoAll(
            SetArgReferee<1>(makeConstant(cTrackFrames, 2, 2, 1000)),
            Return(true)));
  }

  void createController() {
    engine_ = std::make_unique<PlaybackEngine>(configuration_, decoder_,
                                               output_, analyzer_, playlist_);
    controller_ = std::make_unique<PlayerController>(configuration_, *engine_,
                                                     playlist_);

    QObject::connect(controller_.get(), &PlayerController::trackChanged,
                     [this](const QString &filePath, const QString &title) {
                       changedTracks_.push_back(filePath);
                       titles_.push_back(title);
                     });
    QObject::connect(controller_.get(), &PlayerController::playbackStopped,
                     [this]() { ++stoppedCount_; });
    QObject::connect(controller_.get(), &PlayerController::playbackError,
                     [this](const QString &) { ++errorCount_; });
  }

  void playToEnd() {
    std::vector<uint8_t> buffer(2048 * 2 * 2);
    callback_(buffer.data(), 2048, userData_);
  }

  std::shared_ptr<NiceMock<MockConfiguration>> configuration_;
  std::shared_ptr<NiceMock<MockAudioDecoder>> decoder_;
  std::shared_ptr<NiceMock<MockAudioOutput>> output_;
  std::shared_ptr<NiceMock<MockDirectoryLister>> lister_;
  SpectrumAnalyzer analyzer_;
  PlaylistManager playlist_;
  std::unique_ptr<PlaybackEngine> engine_;
  std::unique_ptr<PlayerController> controller_;

  RenderCallback callback_ = nullptr;
  void *userData_ = nullptr;
  std::vector<QString> changedTracks_;
  std::vector<QString> titles_;
  int stoppedCount_ = 0;
  int errorCount_ = 0;
};

} // namespace

TEST_F(PlayerControllerTest, PlayEmitsTrackChanged) {
  createController();

  ASSERT_TRUE(controller_->play("/music/a.mp3"));

  ASSERT_EQ(changedTracks_.size(), 1u);
  EXPECT_EQ(changedTracks_[0], "/music/a.mp3");
  // No readable tags, the title falls back to the file name
  EXPECT_EQ(titles_[0], "a");
  EXPECT_EQ(playlist_.currentIndex(), 0);
}

TEST_F(PlayerControllerTest, AutoAdvanceLoadsNextTrack) {
  createController();
  ASSERT_TRUE(controller_->play("/music/a.mp3"));

  playToEnd();
  controller_->tick();

  ASSERT_EQ(changedTracks_.size(), 2u);
  EXPECT_EQ(changedTracks_[1], "/music/b.mp3");
  EXPECT_EQ(engine_->getCurrentFile(), "/music/b.mp3");
  EXPECT_TRUE(engine_->isPlaying());
  EXPECT_EQ(stoppedCount_, 0);

  // Nothing pending, further ticks do nothing
  controller_->tick();
  EXPECT_EQ(changedTracks_.size(), 2u);
}

TEST_F(PlayerControllerTest, AutoAdvanceWrapsAroundFolder) {
  createController();
  ASSERT_TRUE(controller_->play("/music/c.mp3"));

  playToEnd();
  controller_->tick();

  EXPECT_EQ(engine_->getCurrentFile(), "/music/a.mp3");
}

TEST_F(PlayerControllerTest, AutoAdvanceDisabledStopsAfterTrack) {
  ON_CALL(*configuration_, autoAdvance()).WillByDefault(Return(false));
  createController();
  EXPECT_FALSE(controller_->autoAdvance());
  ASSERT_TRUE(controller_->play("/music/a.mp3"));

  EXPECT_CALL(*decoder_, decode(_, _)).Times(0);
  playToEnd();
  controller_->tick();

  EXPECT_EQ(stoppedCount_, 1);
  EXPECT_EQ(changedTracks_.size(), 1u);
  EXPECT_EQ(engine_->getCurrentFile(), "/music/a.mp3");
  EXPECT_EQ(engine_->getStatus(), PlaybackStatus::FINISHED);
}

TEST_F(PlayerControllerTest, ToggleAutoAdvanceAtRuntime) {
  createController();
  EXPECT_TRUE(controller_->autoAdvance());
  EXPECT_FALSE(controller_->toggleAutoAdvance());
  EXPECT_FALSE(controller_->autoAdvance());
  controller_->setAutoAdvance(true);
  EXPECT_TRUE(controller_->autoAdvance());
}

TEST_F(PlayerControllerTest, FailedNextLoadStopsPlayback) {
  createController();
  ASSERT_TRUE(controller_->play("/music/a.mp3"));
  ON_CALL(*decoder_, decode("/music/b.mp3", _)).WillByDefault(Return(false));

  playToEnd();
  controller_->tick();

  EXPECT_EQ(errorCount_, 1);
  EXPECT_EQ(stoppedCount_, 1);
  EXPECT_FALSE(engine_->isPlaying());
  EXPECT_EQ(engine_->getStatus(), PlaybackStatus::STOPPED);
}

TEST_F(PlayerControllerTest, NextAndPreviousFollowPlaylist) {
  createController();
  ASSERT_TRUE(controller_->play("/music/b.mp3"));

  EXPECT_TRUE(controller_->nextTrack());
  EXPECT_EQ(engine_->getCurrentFile(), "/music/c.mp3");
  EXPECT_TRUE(controller_->previousTrack());
  EXPECT_EQ(engine_->getCurrentFile(), "/music/b.mp3");
  EXPECT_TRUE(controller_->previousTrack());
  EXPECT_EQ(engine_->getCurrentFile(), "/music/a.mp3");
}

TEST_F(PlayerControllerTest, NextWithoutPlaylistDoesNothing) {
  createController();
  EXPECT_FALSE(controller_->nextTrack());
  EXPECT_FALSE(controller_->previousTrack());
  EXPECT_TRUE(changedTracks_.empty());
}

TEST_F(PlayerControllerTest, ShuffleNextPicksAnotherTrack) {
  createController();
  ASSERT_TRUE(controller_->play("/music/a.mp3"));
  EXPECT_TRUE(controller_->toggleShuffle());
  EXPECT_TRUE(controller_->shuffle());

  for (int i = 0; i < 20; ++i) {
    const std::string before = engine_->getCurrentFile();
    ASSERT_TRUE(controller_->nextTrack());
    EXPECT_NE(engine_->getCurrentFile(), before);
  }
}

TEST_F(PlayerControllerTest, VolumeStepsAreClamped) {
  createController();

  EXPECT_EQ(controller_->adjustVolume(PlayerController::cVolumeStep), 105);
  EXPECT_EQ(controller_->adjustVolume(-PlayerController::cVolumeStep), 100);
  EXPECT_EQ(controller_->adjustVolume(500), 200);
  EXPECT_EQ(controller_->adjustVolume(-1000), 0);
  EXPECT_EQ(controller_->volume(), 0);
}

TEST_F(PlayerControllerTest, TogglePlayPausePausesAndRestarts) {
  createController();
  ASSERT_TRUE(controller_->play("/music/a.mp3"));

  controller_->togglePlayPause();
  EXPECT_TRUE(engine_->isPaused());
  controller_->togglePlayPause();
  EXPECT_FALSE(engine_->isPaused());

  controller_->stop();
  EXPECT_EQ(stoppedCount_, 1);
  EXPECT_FALSE(engine_->isPlaying());

  controller_->togglePlayPause();
  EXPECT_TRUE(engine_->isPlaying());
  EXPECT_EQ(engine_->getCurrentFile(), "/music/a.mp3");
}

TEST_F(PlayerControllerTest, StopDiscardsPendingAdvance) {
  createController();
  ASSERT_TRUE(controller_->play("/music/a.mp3"));

  playToEnd();
  controller_->stop();
  controller_->tick();

  EXPECT_EQ(changedTracks_.size(), 1u);
  EXPECT_FALSE(engine_->isPlaying());
}

TEST_F(PlayerControllerTest, FailedSkipKeepsPlaylistOnCurrentTrack) {
  createController();
  ASSERT_TRUE(controller_->play("/music/b.mp3"));
  ASSERT_EQ(playlist_.currentIndex(), 1);
  ON_CALL(*decoder_, decode("/music/c.mp3", _)).WillByDefault(Return(false));
  ON_CALL(*decoder_, decode("/music/a.mp3", _)).WillByDefault(Return(false));

  EXPECT_FALSE(controller_->nextTrack());
  EXPECT_EQ(errorCount_, 1);
  EXPECT_EQ(engine_->getCurrentFile(), "/music/b.mp3");
  EXPECT_TRUE(engine_->isPlaying());
  EXPECT_EQ(playlist_.currentIndex(), 1);

  EXPECT_FALSE(controller_->previousTrack());
  EXPECT_EQ(errorCount_, 2);
  EXPECT_EQ(playlist_.currentIndex(), 1);

  // Skipping again starts from the playing track, not the failed one
  ON_CALL(*decoder_, decode("/music/c.mp3", _))
      .WillByDefault(DoAll(
          SetArgReferee<1>(makeConstant(cTrackFrames, 2, 2, 1000)),
          Return(true)));
  EXPECT_TRUE(controller_->nextTrack());
  EXPECT_EQ(engine_->getCurrentFile(), "/music/c.mp3");
  EXPECT_EQ(playlist_.currentIndex(), 2);
}
