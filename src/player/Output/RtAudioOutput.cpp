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


#include <algorithm>
#include <cstring>
#include <flex/player/Common/Log.hpp>
#include <flex/player/Output/RtAudioOutput.hpp>

#if defined(RTAUDIO_VERSION_MAJOR) && (RTAUDIO_VERSION_MAJOR >= 6)
#define FLEX_RTAUDIO_V6 1
#endif

namespace flex
{
  namespace player
  {
    namespace output
    {

      namespace
      {
        bool toRtAudioFormat(uint32_t sampleWidth, RtAudioFormat &format)
        {
          switch (sampleWidth)
          {
          case 1:
            format = RTAUDIO_SINT8;
            return true;
          case 2:
            format = RTAUDIO_SINT16;
            return true;
          case 4:
            format = RTAUDIO_SINT32;
            return true;
          default:
            return false;
          }
        }
      } // namespace

      RtAudioOutput::RtAudioOutput(const std::string &deviceName)
          : deviceId_(0)
      {
        std::vector<RtAudio::Api> apis;
        RtAudio::getCompiledApi(apis);

        RtAudio::Api api = RtAudio::UNSPECIFIED;
        if (std::find(apis.begin(), apis.end(), RtAudio::LINUX_ALSA) != apis.end())
        {
          FLEX_LOG(info) << "[RtAudioOutput] Using ALSA backend";
          api = RtAudio::LINUX_ALSA;
        }
        else if (std::find(apis.begin(), apis.end(), RtAudio::LINUX_PULSE) != apis.end())
        {
          FLEX_LOG(info) << "[RtAudioOutput] Using PulseAudio backend";
          api = RtAudio::LINUX_PULSE;
        }
        else
        {
          FLEX_LOG(info) << "[RtAudioOutput] Using default audio backend";
        }

#if defined(FLEX_RTAUDIO_V6)
        // Device loss and stream errors arrive here from the audio thread.
        dac_ = std::make_unique<RtAudio>(api, [this](RtAudioErrorType type, const std::string &errorText)
                                         {
                                           if (type == RTAUDIO_WARNING)
                                           {
                                             FLEX_LOG(warning) << "[RtAudioOutput] " << errorText;
                                             return;
                                           }
                                           FLEX_LOG(error) << "[RtAudioOutput] Stream error, code="
                                                           << static_cast<int>(type) << " msg=" << errorText;
                                           failed_.store(true, std::memory_order_release);
                                         });
#else
        dac_ = std::make_unique<RtAudio>(api);
#endif

        if (!deviceName.empty())
          deviceId_ = this->findDeviceByName(deviceName);
      }

      uint32_t RtAudioOutput::findDeviceByName(const std::string &name)
      {
#if defined(FLEX_RTAUDIO_V6)
        // Device IDs are opaque since RtAudio 6
        const std::vector<unsigned int> ids = dac_->getDeviceIds();
#else
        std::vector<unsigned int> ids;
        for (unsigned int i = 0; i < dac_->getDeviceCount(); i++)
          ids.push_back(i);
#endif

        for (unsigned int id : ids)
        {
#if defined(FLEX_RTAUDIO_V6)
          const RtAudio::DeviceInfo info = dac_->getDeviceInfo(id);
#else
          RtAudio::DeviceInfo info;
          try
          {
            info = dac_->getDeviceInfo(id);
          }
          catch (const RtAudioError &e)
          {
            FLEX_LOG(warning) << "[RtAudioOutput] Skipping device " << id << ": " << e.what();
            continue;
          }
#endif
          if (info.outputChannels > 0 && info.name == name)
          {
            FLEX_LOG(info) << "[RtAudioOutput] Output device " << name << " has ID " << id;
            return id;
          }
        }

        FLEX_LOG(warning) << "[RtAudioOutput] Output device not found: " << name << ", using default";
        return 0;
      }

      RtAudioOutput::~RtAudioOutput()
      {
        this->close();
      }

      bool RtAudioOutput::open(const OutputFormat &format, RenderCallback callback, void *userData)
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);

        if (dac_->isStreamOpen())
        {
          FLEX_LOG(warning) << "[RtAudioOutput] Stream already open, closing it first";
          this->doStop();
          dac_->closeStream();
        }

        RtAudioFormat rtFormat;
        if (!toRtAudioFormat(format.sampleWidth, rtFormat))
        {
          FLEX_LOG(error) << "[RtAudioOutput] Unsupported sample width: " << format.sampleWidth;
          return false;
        }

        if (dac_->getDeviceCount() <= 0)
        {
          FLEX_LOG(error) << "[RtAudioOutput] No output devices found.";
          return false;
        }

        RtAudio::StreamParameters parameters;
        // Use specified device ID, fall back to default if 0
        uint32_t selectedDevice = deviceId_ != 0 ? deviceId_ : dac_->getDefaultOutputDevice();
        parameters.deviceId = selectedDevice;
        parameters.nChannels = format.channels;
        parameters.firstChannel = 0;

        FLEX_LOG(info) << "[RtAudioOutput] Using device ID: " << selectedDevice;

        RtAudio::StreamOptions streamOptions;
        streamOptions.flags = RTAUDIO_SCHEDULE_REALTIME; // Try RT scheduling, fallback is fine
        streamOptions.numberOfBuffers = 4;

        unsigned int bufferFrames = format.bufferFrames;
        callback_ = callback;
        userData_ = userData;
        failed_.store(false, std::memory_order_release);

#if defined(FLEX_RTAUDIO_V6)
        RtAudioErrorType err = dac_->openStream(
            &parameters, /*input*/ nullptr, rtFormat, format.sampleRate,
            &bufferFrames, &RtAudioOutput::audioBufferReadHandler,
            static_cast<void *>(this), &streamOptions);

        if (err != RTAUDIO_NO_ERROR)
        {
          FLEX_LOG(error) << "[RtAudioOutput] openStream failed, code="
                          << static_cast<int>(err)
                          << " msg=" << dac_->getErrorText();
          callback_ = nullptr;
          userData_ = nullptr;
          return false;
        }
#else
        try
        {
          dac_->openStream(&parameters, /*input*/ nullptr, rtFormat,
                           format.sampleRate, &bufferFrames,
                           &RtAudioOutput::audioBufferReadHandler,
                           static_cast<void *>(this), &streamOptions);
        }
        catch (const RtAudioError &e)
        {
          // Older RtAudio throws exceptions.
          FLEX_LOG(error) << "[RtAudioOutput] Failed to open audio output, what: "
                          << e.what();
          callback_ = nullptr;
          userData_ = nullptr;
          return false;
        }
#endif

        format_ = format;
        format_.bufferFrames = bufferFrames;

        FLEX_LOG(info) << "[RtAudioOutput] Opened " << format_.sampleRate << "Hz, "
                       << format_.channels << " channels, " << (format_.sampleWidth * 8)
                       << "-bit, " << format_.bufferFrames << " frames per buffer";
        return true;
      }

      bool RtAudioOutput::start()
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);

        if (!dac_->isStreamOpen())
        {
          FLEX_LOG(error) << "[RtAudioOutput] start() without an open stream";
          return false;
        }

        if (dac_->isStreamRunning())
        {
          return true;
        }

#if defined(FLEX_RTAUDIO_V6)
        RtAudioErrorType err = dac_->startStream();
        if (err != RTAUDIO_NO_ERROR)
        {
          FLEX_LOG(error) << "[RtAudioOutput] startStream failed, code="
                          << static_cast<int>(err)
                          << " msg=" << dac_->getErrorText();
          return false;
        }
#else
        try
        {
          dac_->startStream();
        }
        catch (const RtAudioError &e)
        {
          FLEX_LOG(error) << "[RtAudioOutput] Failed to start audio output, what: " << e.what();
          return false;
        }
#endif
        return true;
      }

      void RtAudioOutput::stop()
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);
        this->doStop();
      }

      void RtAudioOutput::close()
      {
        std::lock_guard<decltype(mutex_)> lock(mutex_);

        this->doStop();

        if (dac_ && dac_->isStreamOpen())
        {
          dac_->closeStream();
        }

        callback_ = nullptr;
        userData_ = nullptr;
      }

      bool RtAudioOutput::hasFailed() const
      {
        return failed_.load(std::memory_order_acquire);
      }

      void RtAudioOutput::doStop()
      {
        if (dac_ && dac_->isStreamOpen() && dac_->isStreamRunning())
        {
#if defined(FLEX_RTAUDIO_V6)
          RtAudioErrorType err = dac_->stopStream();
          if (err != RTAUDIO_NO_ERROR)
          {
            FLEX_LOG(error) << "[RtAudioOutput] stopStream failed, code="
                            << static_cast<int>(err)
                            << " msg=" << dac_->getErrorText();
          }
#else
          try
          {
            dac_->stopStream();
          }
          catch (const RtAudioError &e)
          {
            FLEX_LOG(error) << "[RtAudioOutput] Failed to stop audio output, what: "
                            << e.what();
          }
#endif
        }
      }

      int RtAudioOutput::audioBufferReadHandler(void *outputBuffer, void *inputBuffer,
                                                unsigned int nBufferFrames,
                                                double streamTime,
                                                RtAudioStreamStatus status,
                                                void *userData)
      {
        (void)inputBuffer;
        (void)streamTime;
        (void)status;

        RtAudioOutput *self = static_cast<RtAudioOutput *>(userData);
        if (!outputBuffer)
        {
          return 0;
        }

        if (!self || !self->callback_)
        {
          // Nothing to render: fill with silence and let RtAudio drain the stream
          if (self)
          {
            memset(outputBuffer, 0, static_cast<size_t>(nBufferFrames) * self->format_.channels * self->format_.sampleWidth);
          }
          return 1;
        }

        return self->callback_(outputBuffer, nBufferFrames, self->userData_);
      }

    } // namespace output
  } // namespace player
} // namespace flex
