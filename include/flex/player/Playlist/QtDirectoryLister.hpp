/*
 *  QtDirectoryLister - QDir based directory listing with audio extension filtering
 */

#pragma once

#include <string>
#include <vector>
#include <flex/player/Playlist/IDirectoryLister.hpp>

namespace flex
{
    namespace player
    {
        namespace playlist
        {

            class QtDirectoryLister : public IDirectoryLister
            {
            public:
                explicit QtDirectoryLister(const std::vector<std::string> &extensions);

                bool listAudioFiles(const QString &directory, QStringList &files) const override;
                bool isAudioFile(const QString &fileName) const;

            private:
                QStringList audioExtensions_;
            };

        } // namespace playlist
    } // namespace player
} // namespace flex
