/*
 *  FFmpegAudioDecoder - decodes a complete file to interleaved PCM
 *  Supports whatever the linked FFmpeg build can demux (MP3, FLAC, WAV, OGG, M4A ...)
 */

#include <flex/player/Decoder/FFmpegAudioDecoder.hpp>
#include <flex/player/Common/Log.hpp>
#include <utility>

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace flex
{
    namespace player
    {
        namespace decoder
        {

            bool FFmpegAudioDecoder::decode(const std::string &filePath, DecodedAudio &audio)
            {
                AVFormatContext *formatCtx = nullptr;
                AVCodecContext *codecCtx = nullptr;
                SwrContext *swrCtx = nullptr;
                AVFrame *frame = nullptr;
                AVPacket *packet = nullptr;

                auto cleanup = [&]()
                {
                    if (packet)
                        av_packet_free(&packet);
                    if (frame)
                        av_frame_free(&frame);
                    if (swrCtx)
                        swr_free(&swrCtx);
                    if (codecCtx)
                        avcodec_free_context(&codecCtx);
                    if (formatCtx)
                        avformat_close_input(&formatCtx);
                };

                if (avformat_open_input(&formatCtx, filePath.c_str(), nullptr, nullptr) < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to open: " << filePath;
                    cleanup();
                    return false;
                }

                if (avformat_find_stream_info(formatCtx, nullptr) < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to find stream info: " << filePath;
                    cleanup();
                    return false;
                }

                int audioStreamIdx = -1;
                for (unsigned int i = 0; i < formatCtx->nb_streams; i++)
                {
                    if (formatCtx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO)
                    {
                        audioStreamIdx = static_cast<int>(i);
                        break;
                    }
                }

                if (audioStreamIdx < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] No audio stream found: " << filePath;
                    cleanup();
                    return false;
                }

                AVStream *audioStream = formatCtx->streams[audioStreamIdx];

                const AVCodec *codec = avcodec_find_decoder(audioStream->codecpar->codec_id);
                if (!codec)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Unsupported codec: " << filePath;
                    cleanup();
                    return false;
                }

                codecCtx = avcodec_alloc_context3(codec);
                if (!codecCtx || avcodec_parameters_to_context(codecCtx, audioStream->codecpar) < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to set up codec context";
                    cleanup();
                    return false;
                }

                if (avcodec_open2(codecCtx, codec, nullptr) < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to open codec";
                    cleanup();
                    return false;
                }

                // Keep the source resolution: 16-bit for lossy/low-res material, 24-bit packed
                // for 24-bit sources, 32-bit for anything deeper.
                AVSampleFormat swrOutFmt = AV_SAMPLE_FMT_S16;
                uint32_t sampleWidth = 2;
                const int rawBits = codecCtx->bits_per_raw_sample;
                if (rawBits > 24)
                {
                    swrOutFmt = AV_SAMPLE_FMT_S32;
                    sampleWidth = 4;
                }
                else if (rawBits > 16)
                {
                    swrOutFmt = AV_SAMPLE_FMT_S32;
                    sampleWidth = 3;
                }

#if LIBAVUTIL_VERSION_MAJOR >= 57
                const int channels = codecCtx->ch_layout.nb_channels;
                AVChannelLayout outLayout;
                av_channel_layout_default(&outLayout, channels);
                int swrRet = swr_alloc_set_opts2(&swrCtx,
                                                 &outLayout, swrOutFmt, codecCtx->sample_rate,
                                                 &codecCtx->ch_layout, codecCtx->sample_fmt, codecCtx->sample_rate,
                                                 0, nullptr);
                av_channel_layout_uninit(&outLayout);
                if (swrRet < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to allocate resampler";
                    cleanup();
                    return false;
                }
#else
                const int channels = codecCtx->channels;
                swrCtx = swr_alloc();
                if (!swrCtx)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to allocate resampler";
                    cleanup();
                    return false;
                }
                int64_t channelLayout = codecCtx->channel_layout ? codecCtx->channel_layout : av_get_default_channel_layout(channels);
                av_opt_set_int(swrCtx, "in_channel_layout", channelLayout, 0);
                av_opt_set_int(swrCtx, "in_sample_rate", codecCtx->sample_rate, 0);
                av_opt_set_sample_fmt(swrCtx, "in_sample_fmt", codecCtx->sample_fmt, 0);
                av_opt_set_int(swrCtx, "out_channel_layout", av_get_default_channel_layout(channels), 0);
                av_opt_set_int(swrCtx, "out_sample_rate", codecCtx->sample_rate, 0);
                av_opt_set_sample_fmt(swrCtx, "out_sample_fmt", swrOutFmt, 0);
#endif

                if (channels <= 0 || codecCtx->sample_rate <= 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Invalid stream format: " << channels
                                    << " channels, " << codecCtx->sample_rate << "Hz";
                    cleanup();
                    return false;
                }

                if (swr_init(swrCtx) < 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Failed to init resampler";
                    cleanup();
                    return false;
                }

                DecodedAudio decoded;
                decoded.channels = static_cast<uint32_t>(channels);
                decoded.sampleRate = static_cast<uint32_t>(codecCtx->sample_rate);
                decoded.sampleWidth = sampleWidth;

                if (formatCtx->duration > 0)
                {
                    const double expectedSeconds = static_cast<double>(formatCtx->duration) / AV_TIME_BASE;
                    decoded.pcm.reserve(static_cast<size_t>(expectedSeconds * decoded.sampleRate) * channels * sampleWidth);
                }

                // swresample has no packed 24-bit format: convert to S32 and keep the top 3 bytes.
                auto appendSamples = [&decoded, sampleWidth](const uint8_t *data, size_t sampleCount)
                {
                    if (sampleWidth == 3)
                    {
                        for (size_t i = 0; i < sampleCount; ++i)
                        {
                            const uint8_t *sample = data + i * 4;
                            decoded.pcm.insert(decoded.pcm.end(), sample + 1, sample + 4);
                        }
                    }
                    else
                    {
                        decoded.pcm.insert(decoded.pcm.end(), data, data + sampleCount * sampleWidth);
                    }
                };

                auto convert = [&](const uint8_t **input, int inSamples) -> bool
                {
                    const int outSamples = swr_get_out_samples(swrCtx, inSamples);
                    if (outSamples <= 0)
                        return true;

                    uint8_t *outBuf = nullptr;
                    if (av_samples_alloc(&outBuf, nullptr, channels, outSamples, swrOutFmt, 0) < 0)
                        return false;

                    const int converted = swr_convert(swrCtx, &outBuf, outSamples, input, inSamples);
                    if (converted > 0)
                        appendSamples(outBuf, static_cast<size_t>(converted) * channels);

                    av_freep(&outBuf);
                    return converted >= 0;
                };

                auto drainDecoder = [&]() -> bool
                {
                    while (avcodec_receive_frame(codecCtx, frame) >= 0)
                    {
                        const bool ok = convert(const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
                        av_frame_unref(frame);
                        if (!ok)
                            return false;
                    }
                    return true;
                };

                frame = av_frame_alloc();
                packet = av_packet_alloc();
                if (!frame || !packet)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Out of memory";
                    cleanup();
                    return false;
                }

                bool ok = true;
                while (ok && av_read_frame(formatCtx, packet) >= 0)
                {
                    if (packet->stream_index != audioStreamIdx)
                    {
                        av_packet_unref(packet);
                        continue;
                    }

                    const int sendRet = avcodec_send_packet(codecCtx, packet);
                    av_packet_unref(packet);

                    // Corrupt packets are skipped
                    if (sendRet < 0)
                        continue;

                    ok = drainDecoder();
                }

                if (ok)
                {
                    const int flushRet = avcodec_send_packet(codecCtx, nullptr);
                    if (flushRet < 0 && flushRet != AVERROR_EOF)
                        FLEX_LOG(warning) << "[FFmpegAudioDecoder] Decoder flush failed: " << flushRet;
                    ok = drainDecoder() && convert(nullptr, 0);
                }

                if (!ok)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] Conversion failed: " << filePath;
                    cleanup();
                    return false;
                }

                const size_t frameBytes = static_cast<size_t>(channels) * sampleWidth;
                const size_t totalFrames = decoded.pcm.size() / frameBytes;
                if (totalFrames == 0)
                {
                    FLEX_LOG(error) << "[FFmpegAudioDecoder] No audio decoded from: " << filePath;
                    cleanup();
                    return false;
                }

                decoded.durationSeconds = static_cast<double>(totalFrames) / decoded.sampleRate;

                FLEX_LOG(info) << "[FFmpegAudioDecoder] Decoded: " << filePath
                               << " (" << decoded.sampleRate << "Hz"
                               << ", " << channels << " channels"
                               << ", " << (sampleWidth * 8) << "-bit"
                               << ", codec: " << codec->name
                               << ", " << decoded.durationSeconds << "s)";

                cleanup();
                audio = std::move(decoded);
                return true;
            }

        } // namespace decoder
    } // namespace player
} // namespace flex
