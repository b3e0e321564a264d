/*
 *  PlayerController - non real-time playback control loop
 *  Auto-advance on track completion, next/previous, volume steps, shuffle
 */

#pragma once

#include <atomic>
#include <QObject>
#include <QString>
#include <QTimer>
#include <flex/player/Configuration/IConfiguration.hpp>
#include <flex/player/Playback/PlaybackEngine.hpp>
#include <flex/player/Playlist/PlaylistManager.hpp>

namespace flex
{
    namespace player
    {
        namespace control
        {

            class PlayerController : public QObject
            {
                Q_OBJECT

            public:
                PlayerController(configuration::IConfiguration::Pointer configuration,
                                 playback::PlaybackEngine &engine,
                                 playlist::PlaylistManager &playlist,
                                 QObject *parent = nullptr);
                ~PlayerController() override;

                bool autoAdvance() const;
                bool shuffle() const;
                int volume() const;

                // Drive tick() from a QTimer on the owning thread
                void startPolling(int intervalMs = cPollIntervalMs);
                void stopPolling();

                static constexpr int cVolumeStep = 5;
                static constexpr int cPollIntervalMs = 50;

            public slots:
                bool play(const QString &filePath);
                bool nextTrack();
                bool previousTrack();
                void togglePlayPause();
                void stop();
                int adjustVolume(int delta);
                bool toggleShuffle();
                bool toggleAutoAdvance();
                void setAutoAdvance(bool enabled);
                void tick();

            signals:
                void trackChanged(const QString &filePath, const QString &title);
                void playbackStopped();
                void playbackError(const QString &error);

            private:
                bool load(const QString &filePath);
                bool loadFromPlaylist(const QString &filePath);

                configuration::IConfiguration::Pointer configuration_;
                playback::PlaybackEngine &engine_;
                playlist::PlaylistManager &playlist_;
                QTimer *pollTimer_;
                std::atomic<bool> advanceRequested_;
                bool autoAdvance_;
            };

        } // namespace control
    } // namespace player
} // namespace flex
