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

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace flex
{
  namespace player
  {
    namespace decoder
    {

      /**
       * @brief Whole-track interleaved PCM as produced by a decoder
       */
      struct DecodedAudio
      {
        uint32_t channels = 0;
        uint32_t sampleRate = 0;
        uint32_t sampleWidth = 0; // bytes per sample: 1, 2, 3 or 4
        double durationSeconds = 0.0;
        std::vector<uint8_t> pcm;
      };

      class IAudioDecoder
      {
      public:
        typedef std::shared_ptr<IAudioDecoder> Pointer;

        virtual ~IAudioDecoder() = default;

        /**
         * @brief Decode a complete file into memory
         * @return false if the file could not be opened or decoded
         */
        virtual bool decode(const std::string &filePath, DecodedAudio &audio) = 0;
      };

    } // namespace decoder
  } // namespace player
} // namespace flex
