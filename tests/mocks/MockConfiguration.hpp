#pragma once

#include <flex/player/Configuration/IConfiguration.hpp>
#include <gmock/gmock.h>

namespace flex::player::configuration {

class MockConfiguration : public IConfiguration {
public:
  // Core methods
  MOCK_METHOD(void, load, (), (override));
  MOCK_METHOD(void, reset, (), (override));
  MOCK_METHOD(void, save, (), (override));

  // Playback settings
  MOCK_METHOD(uint32_t, getChunkFrames, (), (const, override));
  MOCK_METHOD(void, setChunkFrames, (uint32_t value), (override));
  MOCK_METHOD(int32_t, getDefaultVolume, (), (const, override));
  MOCK_METHOD(void, setDefaultVolume, (int32_t value), (override));
  MOCK_METHOD(bool, shuffle, (), (const, override));
  MOCK_METHOD(void, shuffle, (bool value), (override));
  MOCK_METHOD(bool, autoAdvance, (), (const, override));
  MOCK_METHOD(void, autoAdvance, (bool value), (override));
  MOCK_METHOD(std::string, getMusicPath, (), (const, override));
  MOCK_METHOD(void, setMusicPath, (const std::string &value), (override));

  // Audio device settings
  MOCK_METHOD(std::string, getAudioOutputDeviceName, (), (const, override));
  MOCK_METHOD(void, setAudioOutputDeviceName, (const std::string &value),
              (override));

  // Playlist settings
  MOCK_METHOD(std::vector<std::string>, getAudioExtensions, (),
              (const, override));
  MOCK_METHOD(void, setAudioExtensions,
              (const std::vector<std::string> &value), (override));

  // Analyzer settings
  MOCK_METHOD(AnalyzerSettings, getAnalyzerSettings, (), (const, override));
  MOCK_METHOD(void, setAnalyzerSettings, (const AnalyzerSettings &value),
              (override));
};

} // namespace flex::player::configuration
