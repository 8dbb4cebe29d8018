//
//  jpeg_info.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#pragma once

#include <cstdint>
#include <vector>

namespace flacforge {

/// Frame header fields of a JPEG image.
struct JpegInfo {
    uint16_t width = 0;
    uint16_t height = 0;
    uint8_t precision = 0;   // bits per component sample
    uint8_t components = 0;  // 1 = grayscale, 3 = YCbCr, 4 = CMYK
};

// Minimal JPEG header inspection helper used to obtain dimensions and color depth for picture
// blocks. Returns true when a start-of-frame segment was found; `info` is untouched otherwise.
bool parse_jpeg_info(const std::vector<uint8_t> &data, JpegInfo &info);

}  // namespace flacforge
