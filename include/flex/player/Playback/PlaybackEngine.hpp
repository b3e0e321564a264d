/*
 *  PlaybackEngine - in-memory track playback driven by the output device callback
 *  Decodes the whole file up front, applies volume, feeds the spectrum analyzer
 */

#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <flex/player/Analysis/SpectrumAnalyzer.hpp>
#include <flex/player/Configuration/IConfiguration.hpp>
#include <flex/player/Decoder/IAudioDecoder.hpp>
#include <flex/player/Output/IAudioOutput.hpp>
#include <flex/player/Playback/Track.hpp>
#include <flex/player/Playlist/PlaylistManager.hpp>

namespace flex
{
    namespace player
    {
        namespace playback
        {

            enum class PlaybackStatus
            {
                IDLE,
                LOADING,
                PLAYING,
                PAUSED,
                FINISHED,
                STOPPED
            };

            const char *toString(PlaybackStatus status);

            struct PlaybackState
            {
                bool isPlaying = false;
                bool isPaused = false;
                int volume = 0;
                uint64_t playheadFrames = 0;
                double durationSeconds = 0.0;
                PlaybackStatus status = PlaybackStatus::IDLE;
            };

            class PlaybackEngine
            {
            public:
                PlaybackEngine(configuration::IConfiguration::Pointer configuration,
                               decoder::IAudioDecoder::Pointer decoder,
                               output::IAudioOutput::Pointer output,
                               analysis::SpectrumAnalyzer &analyzer,
                               playlist::PlaylistManager &playlist);
                ~PlaybackEngine();

                PlaybackEngine(const PlaybackEngine &) = delete;
                PlaybackEngine &operator=(const PlaybackEngine &) = delete;

                /**
                 * @brief Decode filePath, replace the current track and start output
                 *
                 * On any failure the previous track, position and playlist are kept and
                 * the previous stream is reopened if it was running. The engine only
                 * ends up IDLE when that reopen fails as well.
                 */
                bool loadAndPlay(const std::string &filePath);
                void stop();
                void pause();
                void resume();
                void togglePause();

                void setVolume(int percent);
                int getVolume() const;

                double getPosition() const;
                bool isPlaying() const;
                bool isPaused() const;
                PlaybackState getState() const;
                PlaybackStatus getStatus() const;
                uint64_t getPlayheadFrames() const;
                uint64_t getTotalFrames() const;
                double getDuration() const;
                std::string getCurrentFile() const;
                uint32_t getSampleRate() const;
                uint32_t getOutputWidth() const;

                void setTrackFinishedHandler(std::function<void()> handler);

                /**
                 * @brief Consume the end-of-track notification raised by the output callback
                 *
                 * Releases the finished stream and invokes the handler once per finished
                 * track. A failed output device counts as a finished track.
                 * @return true if a track finished since the last call
                 */
                bool pollTrackFinished();

                /**
                 * @brief Fill one device buffer. Runs on the audio thread.
                 * @return cRenderContinue or cRenderComplete
                 */
                int render(void *buffer, uint32_t frames);

                static constexpr int cRenderContinue = 0;
                static constexpr int cRenderComplete = 1;
                static constexpr int cMinVolume = 0;
                static constexpr int cMaxVolume = 200;

            private:
                static int renderCallback(void *buffer, uint32_t frames, void *userData);
                void doStop();
                void prepareBuffers();
                bool openStream(uint64_t playhead, bool paused);
                void releaseStream();
                void finishFromCallback();

                configuration::IConfiguration::Pointer configuration_;
                decoder::IAudioDecoder::Pointer decoder_;
                output::IAudioOutput::Pointer output_;
                analysis::SpectrumAnalyzer &analyzer_;
                playlist::PlaylistManager &playlist_;

                // Replaced only while no stream is open, read by the audio thread otherwise
                Track track_;
                size_t frameBytes_;
                uint32_t chunkFrames_;
                std::vector<float> scaled_;
                std::vector<float> mono_;

                std::atomic<bool> playing_;
                std::atomic<bool> paused_;
                std::atomic<bool> stopRequested_;
                std::atomic<bool> trackFinished_;
                std::atomic<int> volume_;
                std::atomic<uint64_t> playhead_;
                std::atomic<PlaybackStatus> status_;

                bool streamOpen_;
                std::function<void()> trackFinishedHandler_;
                mutable std::mutex mutex_;
            };

        } // namespace playback
    } // namespace player
} // namespace flex
