//
//  stream_info.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "metadata_set.hpp"

namespace flacforge {

inline constexpr size_t kStreamInfoSize = 34;

/// Fully decoded STREAMINFO block.
struct StreamInfo {
    uint16_t min_block_size = 0;
    uint16_t max_block_size = 0;
    uint32_t min_frame_size = 0;  // 24 bits, 0 = unknown
    uint32_t max_frame_size = 0;  // 24 bits, 0 = unknown
    uint32_t sample_rate = 0;     // 20 bits
    uint8_t channels = 0;         // stored minus one in 3 bits
    uint8_t bits_per_sample = 0;  // stored minus one in 5 bits
    uint64_t total_samples = 0;   // 36 bits, 0 = unknown
    std::array<uint8_t, 16> md5{};
};

// Decode a STREAMINFO payload. Throws FormatError when shorter than kStreamInfoSize.
StreamInfo decode_stream_info(const std::vector<uint8_t> &payload);

AudioQuality audio_quality_from(const StreamInfo &info);

// Read only the marker, the first block header and the STREAMINFO payload of a file.
// Throws FormatError for a bad marker or a first block other than STREAMINFO, IoError when the
// file cannot be opened or is too short.
AudioQuality read_audio_quality(const std::string &path);

}  // namespace flacforge
