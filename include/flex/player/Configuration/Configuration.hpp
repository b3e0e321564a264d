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

#include <boost/property_tree/ptree.hpp>
#include <flex/player/Configuration/IConfiguration.hpp>

namespace flex::player::configuration {

class Configuration : public IConfiguration {
public:
  explicit Configuration(std::string fileName = cConfigFileName);

  void load() override;
  void reset() override;
  void save() override;

  uint32_t getChunkFrames() const override;
  void setChunkFrames(uint32_t value) override;
  int32_t getDefaultVolume() const override;
  void setDefaultVolume(int32_t value) override;
  bool shuffle() const override;
  void shuffle(bool value) override;
  bool autoAdvance() const override;
  void autoAdvance(bool value) override;
  std::string getMusicPath() const override;
  void setMusicPath(const std::string &value) override;

  std::string getAudioOutputDeviceName() const override;
  void setAudioOutputDeviceName(const std::string &value) override;

  std::vector<std::string> getAudioExtensions() const override;
  void setAudioExtensions(const std::vector<std::string> &value) override;

  AnalyzerSettings getAnalyzerSettings() const override;
  void setAnalyzerSettings(const AnalyzerSettings &value) override;

  static const std::string cConfigFileName;

private:
  void readAnalyzerSettings(const boost::property_tree::ptree &iniConfig);
  void writeAnalyzerSettings(boost::property_tree::ptree &iniConfig) const;
  static std::vector<std::string> parseExtensions(const std::string &value);

  std::string fileName_;
  uint32_t chunkFrames_;
  int32_t defaultVolume_;
  bool shuffle_;
  bool autoAdvance_;
  std::string musicPath_;
  std::string audioOutputDeviceName_;
  std::vector<std::string> audioExtensions_;
  AnalyzerSettings analyzerSettings_;

  static const std::string cPlaybackChunkFramesKey;
  static const std::string cPlaybackDefaultVolumeKey;
  static const std::string cPlaybackShuffleKey;
  static const std::string cPlaybackAutoAdvanceKey;
  static const std::string cPlaybackMusicPathKey;

  static const std::string cAudioOutputDeviceNameKey;

  static const std::string cPlaylistExtensionsKey;

  static const std::string cAnalyzerFFTSizeKey;
  static const std::string cAnalyzerSmoothingKey;
  static const std::string cAnalyzerReleaseFactorKey;
  static const std::string cAnalyzerBaselineKey;
  static const std::string cAnalyzerNoiseThresholdKey;
  static const std::string cAnalyzerSilenceFloorKey;
  static const std::string cAnalyzerBassBoostKey;
  static const std::string cAnalyzerBeatThresholdKey;
  static const std::string cAnalyzerBeatBoostKey;
  static const std::string cAnalyzerQueueTimeoutMsKey;
};

} // namespace flex::player::configuration
