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
#include <boost/algorithm/string.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <flex/player/Common/Log.hpp>
#include <flex/player/Configuration/Configuration.hpp>

namespace flex::player::configuration {

const std::string Configuration::cConfigFileName = "flexplayer.ini";

const std::string Configuration::cPlaybackChunkFramesKey =
    "Playback.ChunkFrames";
const std::string Configuration::cPlaybackDefaultVolumeKey =
    "Playback.DefaultVolume";
const std::string Configuration::cPlaybackShuffleKey = "Playback.Shuffle";
const std::string Configuration::cPlaybackAutoAdvanceKey =
    "Playback.AutoAdvance";
const std::string Configuration::cPlaybackMusicPathKey = "Playback.MusicPath";

const std::string Configuration::cAudioOutputDeviceNameKey =
    "Audio.OutputDeviceName";

const std::string Configuration::cPlaylistExtensionsKey =
    "Playlist.Extensions";

const std::string Configuration::cAnalyzerFFTSizeKey = "Analyzer.FFTSize";
const std::string Configuration::cAnalyzerSmoothingKey = "Analyzer.Smoothing";
const std::string Configuration::cAnalyzerReleaseFactorKey =
    "Analyzer.ReleaseFactor";
const std::string Configuration::cAnalyzerBaselineKey = "Analyzer.Baseline";
const std::string Configuration::cAnalyzerNoiseThresholdKey =
    "Analyzer.NoiseThreshold";
const std::string Configuration::cAnalyzerSilenceFloorKey =
    "Analyzer.SilenceFloor";
const std::string Configuration::cAnalyzerBassBoostKey = "Analyzer.BassBoost";
const std::string Configuration::cAnalyzerBeatThresholdKey =
    "Analyzer.BeatThreshold";
const std::string Configuration::cAnalyzerBeatBoostKey = "Analyzer.BeatBoost";
const std::string Configuration::cAnalyzerQueueTimeoutMsKey =
    "Analyzer.QueueTimeoutMs";

namespace {

constexpr uint32_t cMinChunkFrames = 64;
constexpr uint32_t cMaxChunkFrames = 16384;
constexpr uint32_t cMinFFTSize = 128;
constexpr uint32_t cMaxFFTSize = 16384;
constexpr int32_t cMaxVolume = 200;
const std::string cDefaultExtensions = "mp3,wav,flac,ogg,m4a";

} // namespace

Configuration::Configuration(std::string fileName)
    : fileName_(std::move(fileName)) {
  this->load();
}

void Configuration::load() {
  this->reset();

  boost::property_tree::ptree iniConfig;

  try {
    boost::property_tree::ini_parser::read_ini(fileName_, iniConfig);
  } catch (const std::exception &e) {
    FLEX_LOG(warning) << "[Configuration] Failed to load " << fileName_
                      << ", using defaults: " << e.what();
    return;
  }

  chunkFrames_ = std::clamp(
      iniConfig.get<uint32_t>(cPlaybackChunkFramesKey, chunkFrames_),
      cMinChunkFrames, cMaxChunkFrames);
  defaultVolume_ = std::clamp(
      iniConfig.get<int32_t>(cPlaybackDefaultVolumeKey, defaultVolume_), 0,
      cMaxVolume);
  shuffle_ = iniConfig.get<bool>(cPlaybackShuffleKey, shuffle_);
  autoAdvance_ = iniConfig.get<bool>(cPlaybackAutoAdvanceKey, autoAdvance_);
  musicPath_ = iniConfig.get<std::string>(cPlaybackMusicPathKey, musicPath_);

  audioOutputDeviceName_ = iniConfig.get<std::string>(
      cAudioOutputDeviceNameKey, audioOutputDeviceName_);

  auto extensions = parseExtensions(
      iniConfig.get<std::string>(cPlaylistExtensionsKey, cDefaultExtensions));
  if (!extensions.empty()) {
    audioExtensions_ = std::move(extensions);
  }

  this->readAnalyzerSettings(iniConfig);

  FLEX_LOG(info) << "[Configuration] Loaded " << fileName_
                 << " (chunk frames: " << chunkFrames_
                 << ", fft size: " << analyzerSettings_.fftSize << ")";
}

void Configuration::reset() {
  chunkFrames_ = 2048;
  defaultVolume_ = 50;
  shuffle_ = false;
  autoAdvance_ = true;
  musicPath_ = "Downloaded Audio";
  audioOutputDeviceName_ = "";
  audioExtensions_ = parseExtensions(cDefaultExtensions);
  analyzerSettings_ = AnalyzerSettings();
}

void Configuration::save() {
  boost::property_tree::ptree iniConfig;

  iniConfig.put<uint32_t>(cPlaybackChunkFramesKey, chunkFrames_);
  iniConfig.put<int32_t>(cPlaybackDefaultVolumeKey, defaultVolume_);
  iniConfig.put<bool>(cPlaybackShuffleKey, shuffle_);
  iniConfig.put<bool>(cPlaybackAutoAdvanceKey, autoAdvance_);
  iniConfig.put<std::string>(cPlaybackMusicPathKey, musicPath_);
  iniConfig.put<std::string>(cAudioOutputDeviceNameKey,
                             audioOutputDeviceName_);
  iniConfig.put<std::string>(cPlaylistExtensionsKey,
                             boost::algorithm::join(audioExtensions_, ","));
  this->writeAnalyzerSettings(iniConfig);

  try {
    boost::property_tree::ini_parser::write_ini(fileName_, iniConfig);
  } catch (const std::exception &e) {
    FLEX_LOG(error) << "[Configuration] Failed to save " << fileName_ << ": "
                    << e.what();
  }
}

void Configuration::readAnalyzerSettings(
    const boost::property_tree::ptree &iniConfig) {
  AnalyzerSettings settings;

  settings.fftSize =
      std::clamp(iniConfig.get<uint32_t>(cAnalyzerFFTSizeKey, settings.fftSize),
                 cMinFFTSize, cMaxFFTSize);
  settings.smoothing = std::clamp(
      iniConfig.get<float>(cAnalyzerSmoothingKey, settings.smoothing), 0.0f,
      1.0f);
  settings.releaseFactor = std::clamp(
      iniConfig.get<float>(cAnalyzerReleaseFactorKey, settings.releaseFactor),
      0.0f, 1.0f);
  settings.baseline = std::max(
      iniConfig.get<float>(cAnalyzerBaselineKey, settings.baseline), 0.0f);
  settings.noiseThreshold =
      std::max(iniConfig.get<float>(cAnalyzerNoiseThresholdKey,
                                    settings.noiseThreshold),
               0.0f);
  settings.silenceFloor = std::max(
      iniConfig.get<float>(cAnalyzerSilenceFloorKey, settings.silenceFloor),
      0.0f);
  settings.bassBoost = std::max(
      iniConfig.get<float>(cAnalyzerBassBoostKey, settings.bassBoost), 0.0f);
  settings.beatThreshold =
      iniConfig.get<float>(cAnalyzerBeatThresholdKey, settings.beatThreshold);
  settings.beatBoost = std::max(
      iniConfig.get<float>(cAnalyzerBeatBoostKey, settings.beatBoost), 0.0f);
  settings.queueTimeoutMs = std::max<uint32_t>(
      iniConfig.get<uint32_t>(cAnalyzerQueueTimeoutMsKey,
                              settings.queueTimeoutMs),
      1);

  analyzerSettings_ = settings;
}

void Configuration::writeAnalyzerSettings(
    boost::property_tree::ptree &iniConfig) const {
  iniConfig.put<uint32_t>(cAnalyzerFFTSizeKey, analyzerSettings_.fftSize);
  iniConfig.put<float>(cAnalyzerSmoothingKey, analyzerSettings_.smoothing);
  iniConfig.put<float>(cAnalyzerReleaseFactorKey,
                       analyzerSettings_.releaseFactor);
  iniConfig.put<float>(cAnalyzerBaselineKey, analyzerSettings_.baseline);
  iniConfig.put<float>(cAnalyzerNoiseThresholdKey,
                       analyzerSettings_.noiseThreshold);
  iniConfig.put<float>(cAnalyzerSilenceFloorKey,
                       analyzerSettings_.silenceFloor);
  iniConfig.put<float>(cAnalyzerBassBoostKey, analyzerSettings_.bassBoost);
  iniConfig.put<float>(cAnalyzerBeatThresholdKey,
                       analyzerSettings_.beatThreshold);
  iniConfig.put<float>(cAnalyzerBeatBoostKey, analyzerSettings_.beatBoost);
  iniConfig.put<uint32_t>(cAnalyzerQueueTimeoutMsKey,
                          analyzerSettings_.queueTimeoutMs);
}

std::vector<std::string>
Configuration::parseExtensions(const std::string &value) {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, value, boost::algorithm::is_any_of(",;"));

  std::vector<std::string> extensions;
  for (auto &part : parts) {
    boost::algorithm::trim(part);
    boost::algorithm::to_lower(part);
    if (!part.empty() && part.front() == '.') {
      part.erase(0, 1);
    }
    if (!part.empty() &&
        std::find(extensions.begin(), extensions.end(), part) ==
            extensions.end()) {
      extensions.push_back(part);
    }
  }
  return extensions;
}

uint32_t Configuration::getChunkFrames() const { return chunkFrames_; }

void Configuration::setChunkFrames(uint32_t value) {
  chunkFrames_ = std::clamp(value, cMinChunkFrames, cMaxChunkFrames);
}

int32_t Configuration::getDefaultVolume() const { return defaultVolume_; }

void Configuration::setDefaultVolume(int32_t value) {
  defaultVolume_ = std::clamp(value, 0, cMaxVolume);
}

bool Configuration::shuffle() const { return shuffle_; }

void Configuration::shuffle(bool value) { shuffle_ = value; }

bool Configuration::autoAdvance() const { return autoAdvance_; }

void Configuration::autoAdvance(bool value) { autoAdvance_ = value; }

std::string Configuration::getMusicPath() const { return musicPath_; }

void Configuration::setMusicPath(const std::string &value) {
  musicPath_ = value;
}

std::string Configuration::getAudioOutputDeviceName() const {
  return audioOutputDeviceName_;
}

void Configuration::setAudioOutputDeviceName(const std::string &value) {
  audioOutputDeviceName_ = value;
}

std::vector<std::string> Configuration::getAudioExtensions() const {
  return audioExtensions_;
}

void Configuration::setAudioExtensions(const std::vector<std::string> &value) {
  audioExtensions_ = value;
}

AnalyzerSettings Configuration::getAnalyzerSettings() const {
  return analyzerSettings_;
}

void Configuration::setAnalyzerSettings(const AnalyzerSettings &value) {
  analyzerSettings_ = value;
}

} // namespace flex::player::configuration
