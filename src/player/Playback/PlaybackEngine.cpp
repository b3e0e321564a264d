/*
 *  PlaybackEngine - in-memory track playback driven by the output device callback
 *  Decodes the whole file up front, applies volume, feeds the spectrum analyzer
 */

#include <algorithm>
#include <cstring>
#include <exception>
#include <utility>
#include <QString>
#include <flex/player/Playback/PlaybackEngine.hpp>
#include <flex/player/Codec/SampleFormatCodec.hpp>
#include <flex/player/Common/Log.hpp>

namespace flex
{
    namespace player
    {
        namespace playback
        {

            const char *toString(PlaybackStatus status)
            {
                switch (status)
                {
                case PlaybackStatus::IDLE:
                    return "idle";
                case PlaybackStatus::LOADING:
                    return "loading";
                case PlaybackStatus::PLAYING:
                    return "playing";
                case PlaybackStatus::PAUSED:
                    return "paused";
                case PlaybackStatus::FINISHED:
                    return "finished";
                case PlaybackStatus::STOPPED:
                    return "stopped";
                }
                return "unknown";
            }

            PlaybackEngine::PlaybackEngine(configuration::IConfiguration::Pointer configuration,
                                           decoder::IAudioDecoder::Pointer decoder,
                                           output::IAudioOutput::Pointer output,
                                           analysis::SpectrumAnalyzer &analyzer,
                                           playlist::PlaylistManager &playlist)
                : configuration_(std::move(configuration)), decoder_(std::move(decoder)), output_(std::move(output)), analyzer_(analyzer), playlist_(playlist), frameBytes_(0), chunkFrames_(configuration_->getChunkFrames()), playing_(false), paused_(false), stopRequested_(false), trackFinished_(false), volume_(std::clamp<int>(configuration_->getDefaultVolume(), cMinVolume, cMaxVolume)), playhead_(0), status_(PlaybackStatus::IDLE), streamOpen_(false)
            {
                if (chunkFrames_ == 0)
                    chunkFrames_ = 2048;

                FLEX_LOG(info) << "[PlaybackEngine] Initialized (chunk " << chunkFrames_ << " frames, volume " << volume_.load() << "%)";
            }

            PlaybackEngine::~PlaybackEngine()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                doStop();
            }

            // ========== Control ==========
            bool PlaybackEngine::loadAndPlay(const std::string &filePath)
            {
                std::lock_guard<std::mutex> lock(mutex_);

                FLEX_LOG(info) << "[PlaybackEngine] Loading: " << filePath;

                decoder::DecodedAudio audio;
                std::vector<float> samples;
                try
                {
                    if (!decoder_->decode(filePath, audio))
                    {
                        FLEX_LOG(error) << "[PlaybackEngine] Failed to decode: " << filePath;
                        return false;
                    }

                    if (audio.channels == 0 || audio.sampleRate == 0)
                    {
                        FLEX_LOG(error) << "[PlaybackEngine] Decoder returned an invalid format for: " << filePath;
                        return false;
                    }

                    samples = codec::SampleFormatCodec::bytesToFloat(audio.pcm, audio.sampleWidth);
                }
                catch (const std::exception &e)
                {
                    FLEX_LOG(error) << "[PlaybackEngine] Failed to load " << filePath << ": " << e.what();
                    return false;
                }

                const uint32_t sourceWidth = static_cast<uint32_t>(codec::SampleFormatCodec::resolveWidth(audio.sampleWidth));

                Track track;
                track.path = filePath;
                track.channels = audio.channels;
                track.sampleRate = audio.sampleRate;
                track.sourceWidth = sourceWidth;
                track.outputWidth = codec::SampleFormatCodec::outputWidth(sourceWidth);
                track.totalFrames = samples.size() / audio.channels;
                track.duration = audio.durationSeconds > 0.0
                                     ? audio.durationSeconds
                                     : static_cast<double>(track.totalFrames) / audio.sampleRate;
                track.samples = std::move(samples);

                const bool wasPlaying = playing_;
                const bool wasPaused = paused_;
                const bool wasFinished = trackFinished_;
                const uint64_t previousPlayhead = playhead_;
                const PlaybackStatus previousStatus = status_;

                doStop();
                status_ = PlaybackStatus::LOADING;

                // From here on `track` holds the previous track until the new stream runs
                std::swap(track_, track);
                this->prepareBuffers();

                if (!this->openStream(0, false))
                {
                    FLEX_LOG(error) << "[PlaybackEngine] Failed to open output for: " << filePath;

                    std::swap(track_, track);
                    this->prepareBuffers();
                    playhead_ = previousPlayhead;
                    trackFinished_ = wasFinished;
                    status_ = previousStatus;

                    if (wasPlaying && !this->openStream(previousPlayhead, wasPaused))
                    {
                        FLEX_LOG(error) << "[PlaybackEngine] Could not resume: " << track_.path;
                        playhead_ = 0;
                        status_ = PlaybackStatus::IDLE;
                    }
                    return false;
                }

                playlist_.buildFromFolder(QString::fromStdString(filePath));

                FLEX_LOG(info) << "[PlaybackEngine] Playing: " << filePath
                               << " (" << track_.sampleRate << "Hz"
                               << ", " << track_.channels << " channels"
                               << ", " << (track_.sourceWidth * 8) << "-bit source"
                               << ", " << (track_.outputWidth * 8) << "-bit output"
                               << ", " << track_.duration << "s)";
                return true;
            }

            void PlaybackEngine::prepareBuffers()
            {
                frameBytes_ = static_cast<size_t>(track_.channels) * track_.outputWidth;
                scaled_.assign(static_cast<size_t>(chunkFrames_) * track_.channels, 0.0f);
                mono_.assign(chunkFrames_, 0.0f);
            }

            bool PlaybackEngine::openStream(uint64_t playhead, bool paused)
            {
                playhead_ = playhead;
                trackFinished_ = false;
                stopRequested_ = false;
                paused_ = paused;
                playing_ = true;

                output::OutputFormat format;
                format.sampleWidth = track_.outputWidth;
                format.channels = track_.channels;
                format.sampleRate = track_.sampleRate;
                format.bufferFrames = chunkFrames_;

                if (!output_->open(format, &PlaybackEngine::renderCallback, this))
                {
                    playing_ = false;
                    paused_ = false;
                    output_->close();
                    return false;
                }

                streamOpen_ = true;
                status_ = paused ? PlaybackStatus::PAUSED : PlaybackStatus::PLAYING;

                if (!output_->start())
                {
                    FLEX_LOG(error) << "[PlaybackEngine] Failed to start output stream";
                    playing_ = false;
                    paused_ = false;
                    releaseStream();
                    return false;
                }

                return true;
            }

            void PlaybackEngine::stop()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                doStop();
            }

            void PlaybackEngine::doStop()
            {
                stopRequested_ = true;
                releaseStream();

                playing_ = false;
                paused_ = false;
                trackFinished_ = false;
                playhead_ = 0;
                analyzer_.reset();

                if (status_ != PlaybackStatus::IDLE)
                    status_ = PlaybackStatus::STOPPED;
            }

            void PlaybackEngine::releaseStream()
            {
                if (!streamOpen_)
                    return;

                output_->stop();
                output_->close();
                streamOpen_ = false;
            }

            void PlaybackEngine::pause()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!playing_ || paused_)
                    return;

                paused_ = true;
                status_ = PlaybackStatus::PAUSED;

                // The last buffer may have been rendered in between
                if (!playing_.load(std::memory_order_acquire))
                {
                    paused_ = false;
                    status_ = PlaybackStatus::FINISHED;
                    return;
                }
                FLEX_LOG(debug) << "[PlaybackEngine] Paused at frame " << playhead_.load();
            }

            void PlaybackEngine::resume()
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!playing_ || !paused_)
                    return;

                paused_ = false;
                status_ = PlaybackStatus::PLAYING;
                FLEX_LOG(debug) << "[PlaybackEngine] Resumed at frame " << playhead_.load();
            }

            void PlaybackEngine::togglePause()
            {
                if (paused_)
                    this->resume();
                else
                    this->pause();
            }

            void PlaybackEngine::setVolume(int percent)
            {
                volume_ = std::clamp(percent, cMinVolume, cMaxVolume);
            }

            int PlaybackEngine::getVolume() const { return volume_; }

            // ========== State ==========
            double PlaybackEngine::getPosition() const
            {
                const uint32_t rate = getSampleRate();
                if ((!playing_ && !paused_) || rate == 0)
                    return 0.0;

                return static_cast<double>(playhead_.load()) / rate;
            }

            bool PlaybackEngine::isPlaying() const { return playing_; }
            bool PlaybackEngine::isPaused() const { return paused_; }
            PlaybackStatus PlaybackEngine::getStatus() const { return status_; }
            uint64_t PlaybackEngine::getPlayheadFrames() const { return playhead_; }

            PlaybackState PlaybackEngine::getState() const
            {
                PlaybackState state;
                state.isPlaying = playing_;
                state.isPaused = paused_;
                state.volume = volume_;
                state.playheadFrames = playhead_;
                state.durationSeconds = getDuration();
                state.status = status_;
                return state;
            }

            uint64_t PlaybackEngine::getTotalFrames() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return track_.totalFrames;
            }

            double PlaybackEngine::getDuration() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return track_.duration;
            }

            std::string PlaybackEngine::getCurrentFile() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return track_.path;
            }

            uint32_t PlaybackEngine::getSampleRate() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return track_.sampleRate;
            }

            uint32_t PlaybackEngine::getOutputWidth() const
            {
                std::lock_guard<std::mutex> lock(mutex_);
                return track_.outputWidth;
            }

            // ========== Track completion ==========
            void PlaybackEngine::setTrackFinishedHandler(std::function<void()> handler)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                trackFinishedHandler_ = std::move(handler);
            }

            bool PlaybackEngine::pollTrackFinished()
            {
                std::function<void()> handler;
                {
                    std::lock_guard<std::mutex> lock(mutex_);

                    bool finished = trackFinished_.exchange(false);
                    if (!finished && streamOpen_ && output_->hasFailed())
                    {
                        FLEX_LOG(error) << "[PlaybackEngine] Output device failed, ending track: " << track_.path;
                        playing_ = false;
                        paused_ = false;
                        status_ = PlaybackStatus::FINISHED;
                        finished = true;
                    }

                    if (!finished)
                        return false;

                    paused_ = false;
                    releaseStream();
                    handler = trackFinishedHandler_;
                    FLEX_LOG(info) << "[PlaybackEngine] Finished: " << track_.path;
                }

                if (handler)
                    handler();
                return true;
            }

            // ========== Real-time path ==========
            int PlaybackEngine::renderCallback(void *buffer, uint32_t frames, void *userData)
            {
                return static_cast<PlaybackEngine *>(userData)->render(buffer, frames);
            }

            void PlaybackEngine::finishFromCallback()
            {
                playing_.store(false, std::memory_order_release);
                paused_.store(false, std::memory_order_release);
                status_.store(PlaybackStatus::FINISHED, std::memory_order_release);
                trackFinished_.store(true, std::memory_order_release);
            }

            int PlaybackEngine::render(void *buffer, uint32_t frames)
            {
                uint8_t *out = static_cast<uint8_t *>(buffer);
                const size_t requestedBytes = static_cast<size_t>(frames) * frameBytes_;

                if (stopRequested_.load(std::memory_order_acquire) || !playing_.load(std::memory_order_acquire))
                {
                    std::memset(out, 0, requestedBytes);
                    return cRenderComplete;
                }

                if (paused_.load(std::memory_order_acquire))
                {
                    std::memset(out, 0, requestedBytes);
                    return cRenderContinue;
                }

                const uint64_t totalFrames = track_.totalFrames;
                uint64_t playhead = playhead_.load(std::memory_order_relaxed);
                if (playhead >= totalFrames)
                {
                    finishFromCallback();
                    std::memset(out, 0, requestedBytes);
                    return cRenderComplete;
                }

                const uint32_t channels = track_.channels;
                const float gain = static_cast<float>(volume_.load(std::memory_order_relaxed)) / 100.0f;

                uint32_t written = 0;
                while (written < frames && playhead < totalFrames)
                {
                    const uint32_t block = static_cast<uint32_t>(std::min<uint64_t>(
                        std::min<uint32_t>(frames - written, chunkFrames_), totalFrames - playhead));
                    const size_t count = static_cast<size_t>(block) * channels;
                    const float *source = track_.samples.data() + playhead * channels;

                    for (size_t i = 0; i < count; ++i)
                        scaled_[i] = source[i] * gain;

                    codec::SampleFormatCodec::floatToBytes(scaled_.data(), count, track_.sourceWidth,
                                                           out + static_cast<size_t>(written) * frameBytes_);

                    for (uint32_t frame = 0; frame < block; ++frame)
                    {
                        float sum = 0.0f;
                        for (uint32_t channel = 0; channel < channels; ++channel)
                            sum += scaled_[static_cast<size_t>(frame) * channels + channel];
                        mono_[frame] = sum / static_cast<float>(channels);
                    }
                    analyzer_.queue().push(mono_.data(), block);

                    playhead += block;
                    written += block;
                    playhead_.store(playhead, std::memory_order_release);
                }

                if (written < frames)
                {
                    std::memset(out + static_cast<size_t>(written) * frameBytes_, 0,
                                static_cast<size_t>(frames - written) * frameBytes_);
                }

                if (playhead >= totalFrames)
                {
                    finishFromCallback();
                    return cRenderComplete;
                }

                return cRenderContinue;
            }

        } // namespace playback
    } // namespace player
} // namespace flex
