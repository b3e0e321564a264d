/*
 *  FFmpegAudioDecoder - decodes a complete file to interleaved PCM
 *  Supports whatever the linked FFmpeg build can demux (MP3, FLAC, WAV, OGG, M4A ...)
 */

#pragma once

#include <flex/player/Decoder/IAudioDecoder.hpp>

namespace flex
{
    namespace player
    {
        namespace decoder
        {

            class FFmpegAudioDecoder : public IAudioDecoder
            {
            public:
                FFmpegAudioDecoder() = default;

                bool decode(const std::string &filePath, DecodedAudio &audio) override;
            };

        } // namespace decoder
    } // namespace player
} // namespace flex
