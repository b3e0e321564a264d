/*
 *  PlayerController - non real-time playback control loop
 *  Auto-advance on track completion, next/previous, volume steps, shuffle
 */

#include <utility>
#include <flex/player/Control/PlayerController.hpp>
#include <flex/player/Decoder/MetadataReader.hpp>
#include <flex/player/Common/Log.hpp>

namespace flex
{
    namespace player
    {
        namespace control
        {

            PlayerController::PlayerController(configuration::IConfiguration::Pointer configuration,
                                               playback::PlaybackEngine &engine,
                                               playlist::PlaylistManager &playlist,
                                               QObject *parent)
                : QObject(parent), configuration_(std::move(configuration)), engine_(engine), playlist_(playlist), pollTimer_(new QTimer(this)), advanceRequested_(false), autoAdvance_(configuration_->autoAdvance())
            {
                // Runs inside pollTrackFinished() on this thread, only records the request
                engine_.setTrackFinishedHandler([this]()
                                                { advanceRequested_ = true; });

                connect(pollTimer_, &QTimer::timeout, this, &PlayerController::tick);

                FLEX_LOG(info) << "[PlayerController] Initialized (auto-advance " << (autoAdvance_ ? "on" : "off")
                               << ", shuffle " << (playlist_.shuffleEnabled() ? "on" : "off") << ")";
            }

            PlayerController::~PlayerController()
            {
                pollTimer_->stop();
                engine_.setTrackFinishedHandler(nullptr);
            }

            bool PlayerController::autoAdvance() const { return autoAdvance_; }
            bool PlayerController::shuffle() const { return playlist_.shuffleEnabled(); }
            int PlayerController::volume() const { return engine_.getVolume(); }

            void PlayerController::startPolling(int intervalMs)
            {
                pollTimer_->start(intervalMs);
            }

            void PlayerController::stopPolling()
            {
                pollTimer_->stop();
            }

            bool PlayerController::load(const QString &filePath)
            {
                if (!engine_.loadAndPlay(filePath.toStdString()))
                {
                    emit playbackError("Failed to play: " + filePath);
                    return false;
                }

                auto metadata = decoder::MetadataReader::read(filePath);
                FLEX_LOG(info) << "[PlayerController] Now playing: "
                               << (metadata.artist.isEmpty() ? std::string() : metadata.artist.toStdString() + " - ")
                               << metadata.title.toStdString();

                emit trackChanged(filePath, metadata.title);
                return true;
            }

            bool PlayerController::loadFromPlaylist(const QString &filePath)
            {
                if (load(filePath))
                    return true;

                // The playlist already moved on, point it back at what the engine still holds
                const std::string current = engine_.getCurrentFile();
                if (!current.empty())
                    playlist_.buildFromFolder(QString::fromStdString(current));
                return false;
            }

            bool PlayerController::play(const QString &filePath)
            {
                return load(filePath);
            }

            bool PlayerController::nextTrack()
            {
                QString next = playlist_.next(playlist_.shuffleEnabled());
                if (next.isEmpty())
                    return false;
                return loadFromPlaylist(next);
            }

            bool PlayerController::previousTrack()
            {
                QString previous = playlist_.previous(playlist_.shuffleEnabled());
                if (previous.isEmpty())
                    return false;
                return loadFromPlaylist(previous);
            }

            void PlayerController::togglePlayPause()
            {
                if (engine_.isPlaying())
                {
                    engine_.togglePause();
                    return;
                }

                // Finished or stopped: restart the last track
                const std::string current = engine_.getCurrentFile();
                if (!current.empty())
                    load(QString::fromStdString(current));
            }

            void PlayerController::stop()
            {
                engine_.stop();
                advanceRequested_ = false;
                emit playbackStopped();
            }

            int PlayerController::adjustVolume(int delta)
            {
                engine_.setVolume(engine_.getVolume() + delta);
                FLEX_LOG(debug) << "[PlayerController] Volume " << engine_.getVolume() << "%";
                return engine_.getVolume();
            }

            bool PlayerController::toggleShuffle()
            {
                return playlist_.toggleShuffle();
            }

            bool PlayerController::toggleAutoAdvance()
            {
                setAutoAdvance(!autoAdvance_);
                return autoAdvance_;
            }

            void PlayerController::setAutoAdvance(bool enabled)
            {
                autoAdvance_ = enabled;
                FLEX_LOG(info) << "[PlayerController] Auto-advance " << (autoAdvance_ ? "on" : "off");
            }

            void PlayerController::tick()
            {
                engine_.pollTrackFinished();

                if (!advanceRequested_.exchange(false))
                    return;

                if (!autoAdvance_)
                {
                    FLEX_LOG(info) << "[PlayerController] Track finished, auto-advance off";
                    emit playbackStopped();
                    return;
                }

                QString next = playlist_.next(playlist_.shuffleEnabled());
                if (next.isEmpty() || !loadFromPlaylist(next))
                {
                    FLEX_LOG(warning) << "[PlayerController] No playable next track, stopping";
                    engine_.stop();
                    emit playbackStopped();
                }
            }

        } // namespace control
    } // namespace player
} // namespace flex
