/*
 *  PlaylistManager - folder based playlist with sequential and shuffle navigation
 */

#include <QFileInfo>
#include <QMutexLocker>
#include <utility>
#include <flex/player/Playlist/PlaylistManager.hpp>
#include <flex/player/Common/Log.hpp>

namespace flex
{
    namespace player
    {
        namespace playlist
        {

            PlaylistManager::PlaylistManager(IDirectoryLister::Pointer lister, bool shuffle)
                : PlaylistManager(std::move(lister), shuffle, std::random_device{}())
            {
            }

            PlaylistManager::PlaylistManager(IDirectoryLister::Pointer lister, bool shuffle, std::mt19937::result_type seed)
                : lister_(std::move(lister)), currentIndex_(-1), shuffle_(shuffle), random_(seed)
            {
            }

            void PlaylistManager::buildFromFolder(const QString &filePath)
            {
                QMutexLocker locker(&mutex_);

                QFileInfo info(filePath);
                const QString absolutePath = info.absoluteFilePath();
                const QString folder = info.absolutePath();

                if (folder == folder_ && !tracks_.isEmpty())
                {
                    int index = tracks_.indexOf(absolutePath);
                    if (index >= 0)
                    {
                        currentIndex_ = index;
                        return;
                    }
                }

                rescan(folder, absolutePath);
            }

            void PlaylistManager::rescan(const QString &folder, const QString &filePath)
            {
                QStringList files;
                if (!lister_->listAudioFiles(folder, files) || files.isEmpty())
                {
                    FLEX_LOG(warning) << "[Playlist] No audio files listed in " << folder.toStdString()
                                      << ", playing single track";
                    tracks_ = QStringList{filePath};
                    folder_ = folder;
                    currentIndex_ = 0;
                    return;
                }

                files.sort();
                tracks_ = files;
                folder_ = folder;

                currentIndex_ = tracks_.indexOf(filePath);
                if (currentIndex_ < 0)
                    currentIndex_ = 0;

                FLEX_LOG(info) << "[Playlist] Loaded " << tracks_.size() << " tracks from " << folder_.toStdString()
                               << ", current index " << currentIndex_;
            }

            int PlaylistManager::randomOtherIndex()
            {
                const int n = tracks_.size();
                if (n < 2)
                    return currentIndex_;

                std::uniform_int_distribution<int> distribution(0, n - 2);
                int pick = distribution(random_);
                if (pick >= currentIndex_)
                    ++pick;
                return pick;
            }

            QString PlaylistManager::next(bool shuffleEnabled)
            {
                QMutexLocker locker(&mutex_);

                if (tracks_.isEmpty())
                    return QString();

                const int n = tracks_.size();
                currentIndex_ = shuffleEnabled ? randomOtherIndex() : (currentIndex_ + 1) % n;
                return tracks_.at(currentIndex_);
            }

            QString PlaylistManager::previous(bool shuffleEnabled)
            {
                QMutexLocker locker(&mutex_);

                if (tracks_.isEmpty())
                    return QString();

                const int n = tracks_.size();
                currentIndex_ = shuffleEnabled ? randomOtherIndex() : (currentIndex_ - 1 + n) % n;
                return tracks_.at(currentIndex_);
            }

            bool PlaylistManager::toggleShuffle()
            {
                QMutexLocker locker(&mutex_);
                shuffle_ = !shuffle_;
                FLEX_LOG(info) << "[Playlist] Shuffle " << (shuffle_ ? "on" : "off");
                return shuffle_;
            }

            bool PlaylistManager::shuffleEnabled() const
            {
                QMutexLocker locker(&mutex_);
                return shuffle_;
            }

            QStringList PlaylistManager::tracks() const
            {
                QMutexLocker locker(&mutex_);
                return tracks_;
            }

            int PlaylistManager::currentIndex() const
            {
                QMutexLocker locker(&mutex_);
                return currentIndex_;
            }

            QString PlaylistManager::currentFolder() const
            {
                QMutexLocker locker(&mutex_);
                return folder_;
            }

            int PlaylistManager::count() const
            {
                QMutexLocker locker(&mutex_);
                return tracks_.size();
            }

        } // namespace playlist
    } // namespace player
} // namespace flex
