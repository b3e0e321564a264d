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
#include <flex/player/Configuration/AnalyzerSettings.hpp>

namespace flex::player::configuration {

class IConfiguration {
public:
  typedef std::shared_ptr<IConfiguration> Pointer;

  virtual ~IConfiguration() = default;

  virtual void load() = 0;
  virtual void reset() = 0;
  virtual void save() = 0;

  virtual uint32_t getChunkFrames() const = 0;
  virtual void setChunkFrames(uint32_t value) = 0;
  virtual int32_t getDefaultVolume() const = 0;
  virtual void setDefaultVolume(int32_t value) = 0;
  virtual bool shuffle() const = 0;
  virtual void shuffle(bool value) = 0;
  virtual bool autoAdvance() const = 0;
  virtual void autoAdvance(bool value) = 0;
  virtual std::string getMusicPath() const = 0;
  virtual void setMusicPath(const std::string &value) = 0;

  virtual std::string getAudioOutputDeviceName() const = 0;
  virtual void setAudioOutputDeviceName(const std::string &value) = 0;

  virtual std::vector<std::string> getAudioExtensions() const = 0;
  virtual void setAudioExtensions(const std::vector<std::string> &value) = 0;

  virtual AnalyzerSettings getAnalyzerSettings() const = 0;
  virtual void setAnalyzerSettings(const AnalyzerSettings &value) = 0;
};

} // namespace flex::player::configuration
