//
//  vorbis_comment.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "flac_block.hpp"

namespace flacforge {

/**
 * @brief Ordered `KEY=value` list of a VORBIS_COMMENT block.
 *
 * Writes match keys case-insensitively and leave one entry per key at the end of the list.
 * Reads match the exact `KEY=` prefix, so callers use the canonical uppercase names for both.
 */
class VorbisComment {
   public:
    VorbisComment();
    explicit VorbisComment(std::string vendor) : vendor_(std::move(vendor)) {}

    // Decode a VORBIS_COMMENT payload; throws DecodeError on truncated or overrunning lengths.
    static VorbisComment decode(const std::vector<uint8_t> &payload);

    std::vector<uint8_t> encode() const;
    MetadataBlock to_block() const;

    // Drop every entry whose key equals `key` ignoring case, then append `key=value`.
    // Empty values are ignored.
    void set(const std::string &key, const std::string &value);

    // Value of the first `key=` entry with a non-empty value, or "".
    std::string get(const std::string &key) const;

    // All non-empty values of `key=` entries, in order.
    std::vector<std::string> get_all(const std::string &key) const;

    const std::string &vendor() const { return vendor_; }
    const std::vector<std::string> &comments() const { return comments_; }
    std::vector<std::string> &comments() { return comments_; }

   private:
    std::string vendor_;
    std::vector<std::string> comments_;
};

// Case-insensitive ASCII comparison used for field names.
bool key_equals(const std::string &a, const std::string &b);

}  // namespace flacforge
