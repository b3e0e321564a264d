#pragma once

#include <flex/player/Playlist/IDirectoryLister.hpp>
#include <gmock/gmock.h>

namespace flex::player::playlist {

class MockDirectoryLister : public IDirectoryLister {
public:
  MOCK_METHOD(bool, listAudioFiles,
              (const QString &directory, QStringList &files),
              (const, override));
};

} // namespace flex::player::playlist
