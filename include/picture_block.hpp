//
//  picture_block.hpp
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

// ID3v2 APIC picture types used by FLAC; only the ones this library writes or prefers on read.
enum class PictureType : uint32_t {
    Other = 0,
    FileIcon = 1,
    OtherFileIcon = 2,
    FrontCover = 3,
    BackCover = 4,
};

/// Decoded PICTURE block.
struct Picture {
    uint32_t picture_type = static_cast<uint32_t>(PictureType::FrontCover);
    std::string mime;
    std::string description;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t color_depth = 0;      // bits per pixel
    uint32_t indexed_colors = 0;   // 0 for non-palette images
    std::vector<uint8_t> data;

    // Serialize to a PICTURE payload (all integers big-endian).
    std::vector<uint8_t> encode() const;
    MetadataBlock to_block() const;

    // Decode a PICTURE payload; throws DecodeError on truncation.
    static Picture decode(const std::vector<uint8_t> &payload);
};

/**
 * @brief Build a picture from raw JPEG bytes.
 *
 * Dimensions and color depth come from the JPEG frame header. Throws PictureError when the
 * bytes carry no readable JPEG header or the resulting block would not fit the 24-bit length.
 */
Picture make_jpeg_picture(PictureType type, const std::string &description,
                          const std::vector<uint8_t> &jpeg);

}  // namespace flacforge
