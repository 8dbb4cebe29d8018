//
//  tag_fields.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "metadata_set.hpp"
#include "vorbis_comment.hpp"

namespace flacforge {

// Canonical (uppercase) vorbis-comment field names.
namespace tag_keys {
inline constexpr const char *kTitle = "TITLE";
inline constexpr const char *kArtist = "ARTIST";
inline constexpr const char *kAlbum = "ALBUM";
inline constexpr const char *kAlbumArtist = "ALBUMARTIST";
inline constexpr const char *kDate = "DATE";
inline constexpr const char *kTrackNumber = "TRACKNUMBER";
inline constexpr const char *kDiscNumber = "DISCNUMBER";
inline constexpr const char *kIsrc = "ISRC";
inline constexpr const char *kDescription = "DESCRIPTION";
inline constexpr const char *kLyrics = "LYRICS";
inline constexpr const char *kUnsyncedLyrics = "UNSYNCEDLYRICS";
}  // namespace tag_keys

// "N/M" when total > 0, "N" otherwise; empty when track <= 0.
std::string format_track_number(int track, int total);

// Leading decimal integer of `text` ("12/15" -> 12, " 7" -> 7, "x" -> 0).
int parse_leading_int(const std::string &text);

// Write every set field of `meta` in the fixed order TITLE .. LYRICS/UNSYNCEDLYRICS.
void apply_metadata(VorbisComment &comment, const Metadata &meta);

// Read all fields back; TRACKNUMBER "N/M" fills track_number and total_tracks.
Metadata extract_metadata(const VorbisComment &comment);

// LYRICS, falling back to UNSYNCEDLYRICS; empty when neither has a value.
std::string find_lyrics(const VorbisComment &comment);

}  // namespace flacforge
