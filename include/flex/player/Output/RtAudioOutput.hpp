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

#if __has_include(<rtaudio/RtAudio.h>)
#include <rtaudio/RtAudio.h>
#elif __has_include(<RtAudio.h>)
#include <RtAudio.h>
#endif

#include <atomic>
#include <mutex>
#include <string>
#include <flex/player/Output/IAudioOutput.hpp>

namespace flex
{
  namespace player
  {
    namespace output
    {

      class RtAudioOutput : public IAudioOutput
      {
      public:
        /**
         * @brief Construct RtAudioOutput
         * @param deviceName Output device to use, empty or unknown selects the default device
         */
        explicit RtAudioOutput(const std::string &deviceName = std::string());
        ~RtAudioOutput() override;

        bool open(const OutputFormat &format, RenderCallback callback, void *userData) override;
        bool start() override;
        void stop() override;
        void close() override;
        bool hasFailed() const override;

      private:
        void doStop();
        uint32_t findDeviceByName(const std::string &name);
        static int audioBufferReadHandler(void *outputBuffer, void *inputBuffer,
                                          unsigned int nBufferFrames,
                                          double streamTime,
                                          RtAudioStreamStatus status, void *userData);

        uint32_t deviceId_;
        OutputFormat format_;
        RenderCallback callback_ = nullptr;
        void *userData_ = nullptr;
        std::unique_ptr<RtAudio> dac_;
        std::mutex mutex_; // Only for non-RT operations (open/close/start/stop)
        std::atomic<bool> failed_{false};
      };

    } // namespace output
  } // namespace player
} // namespace flex
