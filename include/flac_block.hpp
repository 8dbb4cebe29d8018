//
//  flac_block.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace flacforge {

// "fLaC" stream marker.
inline constexpr uint8_t kFlacMarker[4] = {'f', 'L', 'a', 'C'};
inline constexpr size_t kBlockHeaderSize = 4;
inline constexpr uint32_t kMaxBlockPayload = 0xFFFFFF;  // 24-bit length field

// Metadata block type codes as stored in the low 7 bits of the header's first byte.
enum class BlockType : uint8_t {
    StreamInfo = 0,
    Padding = 1,
    Application = 2,
    SeekTable = 3,
    VorbisComment = 4,
    CueSheet = 5,
    Picture = 6,
};

// The closed set of block kinds this library understands; everything else is carried verbatim.
enum class BlockKind { StreamInfo, VorbisComment, Picture, Other };

/// Decoded 4-byte metadata block header.
struct BlockHeader {
    bool is_last = false;
    uint8_t type = 0;     // 7-bit type code
    uint32_t length = 0;  // payload length (24 bits)
};

BlockHeader decode_block_header(const uint8_t bytes[kBlockHeaderSize]);
void encode_block_header(std::vector<uint8_t> &out, const BlockHeader &header);

/**
 * @brief One metadata block: type code plus serialized payload.
 *
 * Blocks have no identity beyond their position in the container. Payloads of blocks that are
 * never touched are written back byte-for-byte.
 */
struct MetadataBlock {
    uint8_t type = 0;
    std::vector<uint8_t> payload;

    MetadataBlock() = default;
    MetadataBlock(BlockType t, std::vector<uint8_t> p)
        : type(static_cast<uint8_t>(t)), payload(std::move(p)) {}
    MetadataBlock(uint8_t t, std::vector<uint8_t> p) : type(t), payload(std::move(p)) {}

    BlockKind kind() const;
    bool is(BlockType t) const { return type == static_cast<uint8_t>(t); }
};

std::string block_type_name(uint8_t type);

}  // namespace flacforge
