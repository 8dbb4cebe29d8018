//
//  flacforge.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "flacforge_errors.hpp"
#include "metadata_set.hpp"

namespace flacforge {

/// @defgroup api FlacForge Public API
/// Public, supported C++ interfaces for reading and editing FLAC metadata.
/// None of these functions throw; failures are reported through `Status`.
/// @{

/**
 * @brief Result object with success flag, failure class and optional error message.
 *
 * When `ok == true`, `error` is `ErrorKind::None` and `message` is empty. On failure,
 * `message` contains a short description of what went wrong.
 */
struct Status {
    bool ok{false};
    ErrorKind error{ErrorKind::None};
    std::string message;
};

/// Result of read_metadata().
struct ReadResult {
    Status status;
    Metadata metadata;
};

/// Result of get_audio_quality().
struct QualityResult {
    Status status;
    AudioQuality quality;
};

/// Result of extract_lyrics().
struct LyricsResult {
    Status status;
    std::string lyrics;
};

/// Result of read_cover().
struct CoverResult {
    Status status;
    std::string mime;
    std::vector<uint8_t> data;
};

/**
 * @brief Return the FlacForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Write a tag set (and optionally a JPEG cover file) into a FLAC file in place.
 *
 * Empty strings and non-positive numbers are skipped, leaving the existing values untouched.
 * When `cover_path` is non-empty all PICTURE blocks are replaced by one front cover. A missing
 * or unusable cover only logs a warning; the tags are still written.
 *
 * @param flac_path FLAC file to update.
 * @param metadata Fields to write.
 * @param cover_path Optional JPEG file.
 */
Status embed_metadata(const std::string &flac_path, const Metadata &metadata,
                      const std::string &cover_path = {});  ///< @ingroup api

/// @overload cover supplied as in-memory JPEG bytes (no temp file needed); empty = no cover.
Status embed_metadata(const std::string &flac_path, const Metadata &metadata,
                      const std::vector<uint8_t> &cover_data);  ///< @ingroup api

/// Write LYRICS and UNSYNCEDLYRICS only.
Status embed_lyrics(const std::string &flac_path, const std::string &lyrics);  ///< @ingroup api

/// LYRICS, falling back to UNSYNCEDLYRICS; `ErrorKind::NotFound` when neither is set.
LyricsResult extract_lyrics(const std::string &flac_path);  ///< @ingroup api

/// Read the tag set back from the first decodable vorbis-comment block.
ReadResult read_metadata(const std::string &flac_path);  ///< @ingroup api

/// Bit depth and sample rate from STREAMINFO.
QualityResult get_audio_quality(const std::string &flac_path);  ///< @ingroup api

/// Front cover (or first picture) bytes; `ErrorKind::NotFound` when the file has none.
CoverResult read_cover(const std::string &flac_path);  ///< @ingroup api

/// @}

}  // namespace flacforge
