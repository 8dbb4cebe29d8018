//
//  flac_block.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "flac_block.hpp"

#include "byte_io.hpp"

namespace flacforge {

// Header layout:
//
//   byte 0   bit 7      last-metadata-block flag
//            bits 0-6   block type
//   bytes 1-3           payload length, 24-bit big-endian
BlockHeader decode_block_header(const uint8_t bytes[kBlockHeaderSize]) {
    BlockHeader h;
    h.is_last = (bytes[0] & 0x80) != 0;
    h.type = bytes[0] & 0x7F;
    h.length = read_u24(bytes + 1);
    return h;
}

void encode_block_header(std::vector<uint8_t> &out, const BlockHeader &header) {
    write_u8(out, static_cast<uint8_t>((header.is_last ? 0x80 : 0x00) | (header.type & 0x7F)));
    write_u24(out, header.length);
}

BlockKind MetadataBlock::kind() const {
    switch (static_cast<BlockType>(type)) {
        case BlockType::StreamInfo:
            return BlockKind::StreamInfo;
        case BlockType::VorbisComment:
            return BlockKind::VorbisComment;
        case BlockType::Picture:
            return BlockKind::Picture;
        default:
            return BlockKind::Other;
    }
}

std::string block_type_name(uint8_t type) {
    switch (type) {
        case 0:
            return "STREAMINFO";
        case 1:
            return "PADDING";
        case 2:
            return "APPLICATION";
        case 3:
            return "SEEKTABLE";
        case 4:
            return "VORBIS_COMMENT";
        case 5:
            return "CUESHEET";
        case 6:
            return "PICTURE";
        default:
            return "TYPE_" + std::to_string(type);
    }
}

}  // namespace flacforge
