/*
 *  MetadataReader - TagLib based track tags (title, artist, album)
 */

#include <QFileInfo>
#include <flex/player/Decoder/MetadataReader.hpp>

#include <taglib/fileref.h>
#include <taglib/tag.h>

namespace flex
{
    namespace player
    {
        namespace decoder
        {

            TrackMetadata MetadataReader::read(const QString &filePath)
            {
                TrackMetadata metadata;
                metadata.title = QFileInfo(filePath).completeBaseName();

                TagLib::FileRef file(filePath.toUtf8().constData());
                if (!file.isNull() && file.tag())
                {
                    TagLib::Tag *tag = file.tag();
                    QString title = QString::fromStdWString(tag->title().toWString());
                    if (!title.isEmpty())
                        metadata.title = title;
                    metadata.album = QString::fromStdWString(tag->album().toWString());
                    metadata.artist = QString::fromStdWString(tag->artist().toWString());

                    if (file.audioProperties())
                        metadata.durationMs = file.audioProperties()->lengthInMilliseconds();
                }

                return metadata;
            }

        } // namespace decoder
    } // namespace player
} // namespace flex
