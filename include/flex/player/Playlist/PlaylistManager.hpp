/*
 *  PlaylistManager - folder based playlist with sequential and shuffle navigation
 *  The playlist is the sorted set of audio files next to the last loaded track
 */

#pragma once

#include <random>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <flex/player/Playlist/IDirectoryLister.hpp>

namespace flex
{
    namespace player
    {
        namespace playlist
        {

            class PlaylistManager
            {
            public:
                explicit PlaylistManager(IDirectoryLister::Pointer lister, bool shuffle = false);
                PlaylistManager(IDirectoryLister::Pointer lister, bool shuffle, std::mt19937::result_type seed);

                /**
                 * @brief Derive the playlist from the folder containing filePath and point at it
                 *
                 * The folder is only rescanned when it differs from the current one or when
                 * filePath is not part of the cached listing.
                 */
                void buildFromFolder(const QString &filePath);

                // Both return an empty string when there is no playlist
                QString next(bool shuffleEnabled);
                QString previous(bool shuffleEnabled);

                bool toggleShuffle();
                bool shuffleEnabled() const;

                QStringList tracks() const;
                int currentIndex() const;
                QString currentFolder() const;
                int count() const;

            private:
                void rescan(const QString &folder, const QString &filePath);
                int randomOtherIndex();

                IDirectoryLister::Pointer lister_;
                mutable QMutex mutex_;
                QStringList tracks_;
                QString folder_;
                int currentIndex_;
                bool shuffle_;
                std::mt19937 random_;
            };

        } // namespace playlist
    } // namespace player
} // namespace flex
