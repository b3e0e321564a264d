/*
*  This file is part of flexplayer project.
*  Copyright (C) 2025 flexplayer contributors
*
*  flexplayer is free software: you can redistribute it and/or modify
*  it under the terms of the GNU General Public License as published by
*  the Free Software Foundation; either version 3 of the License, or
*  (at your option) any later version.

*  flexplayer is distributed in the hope that it will be useful,
*  but WITHOUT ANY WARRANTY; without even the implied warranty of
*  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*  GNU General Public License for more details.
*
*  You should have received a copy of the GNU General Public License
*  along with flexplayer. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace flex
{
  namespace player
  {
    namespace codec
    {

      enum class SampleWidth : uint32_t
      {
        INT8 = 1,
        INT16 = 2,
        INT24 = 3,
        INT32 = 4
      };

      /**
       * @brief Conversion between interleaved little-endian PCM and float samples
       *
       * Float samples keep the integer scale of the source width (an int16 sample
       * of -1200 becomes -1200.0f). 24-bit audio is never written back as 3-byte
       * PCM: it is emitted as 32-bit samples with the value in the top 24 bits.
       */
      class SampleFormatCodec
      {
      public:
        /**
         * @brief Map a byte width to a supported width
         * @return The matching width, INT16 for anything unrecognized
         */
        static SampleWidth resolveWidth(uint32_t bytes);

        /**
         * @brief Byte width the output device must be opened with for a source width
         */
        static uint32_t outputWidth(uint32_t sourceBytes);

        static int32_t decodeInt24(const uint8_t *sample);

        static std::vector<float> bytesToFloat(const uint8_t *data, size_t size,
                                               uint32_t width);
        static std::vector<float> bytesToFloat(const std::vector<uint8_t> &data,
                                               uint32_t width);

        /**
         * @brief Encode samples into a caller-owned buffer, no allocation
         * @param output Must hold count * outputWidth(width) bytes
         * @return Number of bytes written
         */
        static size_t floatToBytes(const float *samples, size_t count, uint32_t width,
                                   uint8_t *output);
        static std::vector<uint8_t> floatToBytes(const std::vector<float> &samples,
                                                 uint32_t width);
      };

    } // namespace codec
  } // namespace player
} // namespace flex
