/*
 *  MetadataReader - TagLib based track tags (title, artist, album)
 */

#pragma once

#include <QString>

namespace flex
{
    namespace player
    {
        namespace decoder
        {

            struct TrackMetadata
            {
                QString title;
                QString artist;
                QString album;
                int durationMs = 0;
            };

            class MetadataReader
            {
            public:
                // Title falls back to the file's base name when the file has no usable tag
                static TrackMetadata read(const QString &filePath);
            };

        } // namespace decoder
    } // namespace player
} // namespace flex
