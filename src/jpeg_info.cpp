//
//  jpeg_info.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "jpeg_info.hpp"

#include "logging.hpp"

namespace flacforge {

namespace {

constexpr uint8_t kMarkerPrefix = 0xFF;
constexpr uint8_t kSoi = 0xD8;
constexpr uint8_t kEoi = 0xD9;
constexpr uint8_t kSos = 0xDA;

// SOF0..SOF15 minus DHT (C4), JPG (C8) and DAC (CC).
bool is_start_of_frame(uint8_t marker) {
    return (marker >= 0xC0 && marker <= 0xC3) || (marker >= 0xC5 && marker <= 0xC7) ||
           (marker >= 0xC9 && marker <= 0xCB) || (marker >= 0xCD && marker <= 0xCF);
}

}  // namespace

bool parse_jpeg_info(const std::vector<uint8_t> &data, JpegInfo &info) {
    if (data.size() < 4 || data[0] != kMarkerPrefix || data[1] != kSoi) {
        FF_LOG("debug", "jpeg: missing SOI, head=" << hex_prefix(data));
        return false;
    }

    size_t i = 2;
    while (i + 3 < data.size()) {
        if (data[i] != kMarkerPrefix) {
            ++i;
            continue;
        }
        const uint8_t marker = data[i + 1];
        // Fill bytes.
        if (marker == kMarkerPrefix) {
            ++i;
            continue;
        }
        if (marker == kEoi || marker == kSos) {
            break;
        }

        const uint16_t seg_len = static_cast<uint16_t>((data[i + 2] << 8) | data[i + 3]);
        if (seg_len < 2 || i + 2 + seg_len > data.size()) {
            break;
        }

        // SOF payload: precision(1) height(2) width(2) components(1) ...
        if (is_start_of_frame(marker) && seg_len >= 8) {
            info.precision = data[i + 4];
            info.height = static_cast<uint16_t>((data[i + 5] << 8) | data[i + 6]);
            info.width = static_cast<uint16_t>((data[i + 7] << 8) | data[i + 8]);
            info.components = data[i + 9];
            return true;
        }

        i += 2 + seg_len;
    }
    return false;
}

}  // namespace flacforge
