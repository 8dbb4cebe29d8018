//
//  picture_block.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "picture_block.hpp"

#include "byte_io.hpp"
#include "flacforge_errors.hpp"
#include "jpeg_info.hpp"
#include "logging.hpp"

namespace flacforge {

// PICTURE payload:
//
//   type, mime_length, mime, description_length, description,
//   width, height, color_depth, indexed_colors, data_length, data
//
// Fixed part is 8 x 32-bit fields.
namespace {
constexpr size_t kPictureFixedFields = 8 * 4;
}  // namespace

std::vector<uint8_t> Picture::encode() const {
    std::vector<uint8_t> p;
    p.reserve(kPictureFixedFields + mime.size() + description.size() + data.size());
    write_u32(p, picture_type);
    write_u32(p, static_cast<uint32_t>(mime.size()));
    write_bytes(p, mime);
    write_u32(p, static_cast<uint32_t>(description.size()));
    write_bytes(p, description);
    write_u32(p, width);
    write_u32(p, height);
    write_u32(p, color_depth);
    write_u32(p, indexed_colors);
    write_u32(p, static_cast<uint32_t>(data.size()));
    p.insert(p.end(), data.begin(), data.end());
    return p;
}

MetadataBlock Picture::to_block() const { return MetadataBlock(BlockType::Picture, encode()); }

Picture Picture::decode(const std::vector<uint8_t> &payload) {
    ByteCursor cur(payload);
    Picture pic;
    uint32_t len = 0;
    bool ok = cur.u32(pic.picture_type);
    ok = ok && cur.u32(len) && cur.string(len, pic.mime);
    ok = ok && cur.u32(len) && cur.string(len, pic.description);
    ok = ok && cur.u32(pic.width) && cur.u32(pic.height);
    ok = ok && cur.u32(pic.color_depth) && cur.u32(pic.indexed_colors);
    ok = ok && cur.u32(len) && cur.bytes(len, pic.data);
    if (!ok) {
        throw DecodeError("picture block truncated at offset " + std::to_string(cur.position()) +
                          " of " + std::to_string(payload.size()));
    }
    return pic;
}

Picture make_jpeg_picture(PictureType type, const std::string &description,
                          const std::vector<uint8_t> &jpeg) {
    JpegInfo info;
    if (!parse_jpeg_info(jpeg, info)) {
        throw PictureError("cover data is not a JPEG image (" + std::to_string(jpeg.size()) +
                           " bytes, head=" + hex_prefix(jpeg) + ")");
    }

    Picture pic;
    pic.picture_type = static_cast<uint32_t>(type);
    pic.mime = "image/jpeg";
    pic.description = description;
    pic.width = info.width;
    pic.height = info.height;
    pic.color_depth = static_cast<uint32_t>(info.precision) * info.components;
    pic.indexed_colors = 0;
    pic.data = jpeg;

    const size_t payload_size =
        kPictureFixedFields + pic.mime.size() + pic.description.size() + pic.data.size();
    if (payload_size > kMaxBlockPayload) {
        throw PictureError("cover too large for a PICTURE block: " +
                           std::to_string(payload_size) + " bytes");
    }
    FF_LOG("debug", "picture " << pic.width << "x" << pic.height << " depth=" << pic.color_depth
                               << " bytes=" << pic.data.size());
    return pic;
}

}  // namespace flacforge
