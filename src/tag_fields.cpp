//
//  tag_fields.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tag_fields.hpp"

#include <cctype>
#include <climits>

#include "logging.hpp"

namespace flacforge {

std::string format_track_number(int track, int total) {
    if (track <= 0) {
        return {};
    }
    if (total > 0) {
        return std::to_string(track) + "/" + std::to_string(total);
    }
    return std::to_string(track);
}

int parse_leading_int(const std::string &text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
    }
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    long long value = 0;
    bool any = false;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        any = true;
        value = value * 10 + (text[i] - '0');
        if (value > INT_MAX) {
            value = INT_MAX;
        }
        ++i;
    }
    if (!any) {
        return 0;
    }
    return static_cast<int>(negative ? -value : value);
}

void apply_metadata(VorbisComment &comment, const Metadata &meta) {
    using namespace tag_keys;
    comment.set(kTitle, meta.title);
    comment.set(kArtist, meta.artist);
    comment.set(kAlbum, meta.album);
    comment.set(kAlbumArtist, meta.album_artist);
    comment.set(kDate, meta.date);

    if (meta.track_number > 0) {
        comment.set(kTrackNumber, format_track_number(meta.track_number, meta.total_tracks));
    }
    if (meta.disc_number > 0) {
        comment.set(kDiscNumber, std::to_string(meta.disc_number));
    }
    if (!meta.isrc.empty()) {
        comment.set(kIsrc, meta.isrc);
    }
    if (!meta.description.empty()) {
        comment.set(kDescription, meta.description);
    }
    if (!meta.lyrics.empty()) {
        comment.set(kLyrics, meta.lyrics);
        comment.set(kUnsyncedLyrics, meta.lyrics);
    }
    FF_LOG("debug", "applied metadata, comment entries=" << comment.comments().size());
}

Metadata extract_metadata(const VorbisComment &comment) {
    using namespace tag_keys;
    Metadata m;
    m.title = comment.get(kTitle);
    m.artist = comment.get(kArtist);
    m.album = comment.get(kAlbum);
    m.album_artist = comment.get(kAlbumArtist);
    m.date = comment.get(kDate);
    m.isrc = comment.get(kIsrc);
    m.description = comment.get(kDescription);

    m.lyrics = comment.get(kLyrics);
    if (m.lyrics.empty()) {
        m.lyrics = comment.get(kUnsyncedLyrics);
    }

    const std::string track = comment.get(kTrackNumber);
    if (!track.empty()) {
        m.track_number = parse_leading_int(track);
        const auto slash = track.find('/');
        if (slash != std::string::npos) {
            m.total_tracks = parse_leading_int(track.substr(slash + 1));
        }
    }
    const std::string disc = comment.get(kDiscNumber);
    if (!disc.empty()) {
        m.disc_number = parse_leading_int(disc);
    }
    return m;
}

std::string find_lyrics(const VorbisComment &comment) {
    for (const char *key : {tag_keys::kLyrics, tag_keys::kUnsyncedLyrics}) {
        const auto values = comment.get_all(key);
        if (!values.empty()) {
            return values.front();
        }
    }
    return {};
}

}  // namespace flacforge
