/*
 *  QtDirectoryLister - QDir based directory listing with audio extension filtering
 */

#include <QDir>
#include <QFileInfo>
#include <flex/player/Playlist/QtDirectoryLister.hpp>
#include <flex/player/Common/Log.hpp>

namespace flex
{
    namespace player
    {
        namespace playlist
        {

            QtDirectoryLister::QtDirectoryLister(const std::vector<std::string> &extensions)
            {
                for (const auto &extension : extensions)
                {
                    QString ext = QString::fromStdString(extension).trimmed().toLower();
                    if (ext.startsWith('.'))
                        ext = ext.mid(1);
                    if (!ext.isEmpty() && !audioExtensions_.contains(ext))
                        audioExtensions_ << ext;
                }
            }

            bool QtDirectoryLister::listAudioFiles(const QString &directory, QStringList &files) const
            {
                files.clear();

                QDir dir(directory);
                if (!dir.exists() || !dir.isReadable())
                {
                    FLEX_LOG(warning) << "[DirectoryLister] Cannot read directory: " << directory.toStdString();
                    return false;
                }

                const auto entries = dir.entryList(QDir::Files, QDir::Name);
                for (const auto &f : entries)
                {
                    if (isAudioFile(f))
                        files << dir.absoluteFilePath(f);
                }

                FLEX_LOG(debug) << "[DirectoryLister] " << files.size() << " audio files in " << directory.toStdString();
                return true;
            }

            bool QtDirectoryLister::isAudioFile(const QString &fileName) const
            {
                QString ext = QFileInfo(fileName).suffix().toLower();
                return audioExtensions_.contains(ext);
            }

        } // namespace playlist
    } // namespace player
} // namespace flex
