/*
 *  Track - a fully decoded track held in memory for playback
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flex
{
    namespace player
    {
        namespace playback
        {

            struct Track
            {
                std::string path;
                uint32_t channels = 0;
                uint32_t sampleRate = 0;
                uint32_t sourceWidth = 0; // bytes per sample as decoded
                uint32_t outputWidth = 0; // bytes per sample sent to the device
                uint64_t totalFrames = 0;
                double duration = 0.0; // seconds
                std::vector<float> samples; // interleaved, frames * channels, source scale
            };

        } // namespace playback
    } // namespace player
} // namespace flex
