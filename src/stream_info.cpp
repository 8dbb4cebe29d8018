//
//  stream_info.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "stream_info.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "byte_io.hpp"
#include "flac_block.hpp"
#include "flacforge_errors.hpp"
#include "logging.hpp"

namespace flacforge {

namespace {

void read_exact(std::ifstream &in, uint8_t *dst, size_t len, const char *what,
                const std::string &path) {
    in.read(reinterpret_cast<char *>(dst), static_cast<std::streamsize>(len));
    if (static_cast<size_t>(in.gcount()) != len) {
        throw IoError(std::string("failed to read ") + what + " from " + path + " (got " +
                      std::to_string(in.gcount()) + " of " + std::to_string(len) + " bytes)");
    }
}

}  // namespace

// STREAMINFO layout (bit widths):
//
//   16  min block size          16  max block size
//   24  min frame size          24  max frame size
//   20  sample rate              3  channels - 1
//    5  bits per sample - 1     36  total samples
//  128  MD5 of the unencoded audio
StreamInfo decode_stream_info(const std::vector<uint8_t> &payload) {
    if (payload.size() < kStreamInfoSize) {
        throw FormatError("STREAMINFO payload too short: " + std::to_string(payload.size()) +
                          " bytes");
    }
    const uint8_t *b = payload.data();
    StreamInfo info;
    info.min_block_size = static_cast<uint16_t>((b[0] << 8) | b[1]);
    info.max_block_size = static_cast<uint16_t>((b[2] << 8) | b[3]);
    info.min_frame_size = read_u24(b + 4);
    info.max_frame_size = read_u24(b + 7);
    info.sample_rate = (uint32_t(b[10]) << 12) | (uint32_t(b[11]) << 4) | (uint32_t(b[12]) >> 4);
    info.channels = static_cast<uint8_t>(((b[12] >> 1) & 0x07) + 1);
    // The +1 belongs to the whole 5-bit field, not just its low nibble.
    info.bits_per_sample = static_cast<uint8_t>((((b[12] & 0x01) << 4) | (b[13] >> 4)) + 1);
    info.total_samples = (uint64_t(b[13] & 0x0F) << 32) | read_u32(b + 14);
    std::copy(b + 18, b + 34, info.md5.begin());
    return info;
}

AudioQuality audio_quality_from(const StreamInfo &info) {
    AudioQuality q;
    q.bit_depth = info.bits_per_sample;
    q.sample_rate = static_cast<int>(info.sample_rate);
    return q;
}

AudioQuality read_audio_quality(const std::string &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IoError(ec ? "cannot stat " + path + ": " + ec.message()
                         : "not a regular file: " + path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("failed to open " + path + ": " + std::generic_category().message(errno));
    }

    uint8_t marker[4];
    read_exact(in, marker, sizeof(marker), "marker", path);
    if (std::memcmp(marker, kFlacMarker, sizeof(marker)) != 0) {
        throw FormatError("not a FLAC file: " + path);
    }

    uint8_t header_bytes[kBlockHeaderSize];
    read_exact(in, header_bytes, sizeof(header_bytes), "block header", path);
    const BlockHeader header = decode_block_header(header_bytes);
    if (header.type != static_cast<uint8_t>(BlockType::StreamInfo)) {
        throw FormatError("first block is not STREAMINFO (" + block_type_name(header.type) +
                          ") in " + path);
    }

    std::vector<uint8_t> payload(kStreamInfoSize);
    read_exact(in, payload.data(), payload.size(), "STREAMINFO", path);

    const AudioQuality q = audio_quality_from(decode_stream_info(payload));
    FF_LOG("debug", "STREAMINFO " << path << " bits=" << q.bit_depth
                                  << " rate=" << q.sample_rate);
    return q;
}

}  // namespace flacforge
