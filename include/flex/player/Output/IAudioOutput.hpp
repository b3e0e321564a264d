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

namespace flex
{
  namespace player
  {
    namespace output
    {

      /**
       * @brief Fills an interleaved output buffer of the negotiated format
       * @return 0 to keep the stream running, non-zero once the last buffer was rendered
       */
      typedef int (*RenderCallback)(void *buffer, uint32_t frames, void *userData);

      struct OutputFormat
      {
        uint32_t sampleWidth = 2; // bytes per sample: 1, 2 or 4
        uint32_t channels = 2;
        uint32_t sampleRate = 44100;
        uint32_t bufferFrames = 2048;
      };

      class IAudioOutput
      {
      public:
        typedef std::shared_ptr<IAudioOutput> Pointer;

        virtual ~IAudioOutput() = default;

        virtual bool open(const OutputFormat &format, RenderCallback callback, void *userData) = 0;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual void close() = 0;
        virtual bool hasFailed() const = 0;
      };

    } // namespace output
  } // namespace player
} // namespace flex
