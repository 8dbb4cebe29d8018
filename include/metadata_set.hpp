//
//  metadata_set.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>

namespace flacforge {

/**
 * @brief Caller-facing tag set written to / read from the vorbis-comment block.
 *
 * Strings are UTF-8. Numeric fields <= 0 mean "not set".
 */
struct Metadata {
    std::string title;         ///< TITLE
    std::string artist;        ///< ARTIST
    std::string album;         ///< ALBUM
    std::string album_artist;  ///< ALBUMARTIST
    std::string date;          ///< DATE (free-form)
    int track_number = 0;      ///< TRACKNUMBER, combined with total_tracks as "N/M"
    int total_tracks = 0;
    int disc_number = 0;       ///< DISCNUMBER
    std::string isrc;          ///< ISRC
    std::string description;   ///< DESCRIPTION
    std::string lyrics;        ///< LYRICS and UNSYNCEDLYRICS
};

/// Bit depth and sample rate as stored in STREAMINFO.
struct AudioQuality {
    int bit_depth = 0;
    int sample_rate = 0;
};

inline bool operator==(const Metadata &a, const Metadata &b) {
    return a.title == b.title && a.artist == b.artist && a.album == b.album &&
           a.album_artist == b.album_artist && a.date == b.date &&
           a.track_number == b.track_number && a.total_tracks == b.total_tracks &&
           a.disc_number == b.disc_number && a.isrc == b.isrc &&
           a.description == b.description && a.lyrics == b.lyrics;
}

inline bool operator!=(const Metadata &a, const Metadata &b) { return !(a == b); }

}  // namespace flacforge
