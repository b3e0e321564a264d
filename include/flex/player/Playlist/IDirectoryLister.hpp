/*
 *  IDirectoryLister - lists playable audio files in a directory
 */

#pragma once

#include <memory>
#include <QString>
#include <QStringList>

namespace flex
{
    namespace player
    {
        namespace playlist
        {

            class IDirectoryLister
            {
            public:
                typedef std::shared_ptr<IDirectoryLister> Pointer;

                virtual ~IDirectoryLister() = default;

                // Absolute paths of audio files directly inside directory (no recursion).
                // Returns false when the directory cannot be read.
                virtual bool listAudioFiles(const QString &directory, QStringList &files) const = 0;
            };

        } // namespace playlist
    } // namespace player
} // namespace flex
