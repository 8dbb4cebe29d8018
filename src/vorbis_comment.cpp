//
//  vorbis_comment.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "vorbis_comment.hpp"

#include <cctype>
#include <cstddef>

#include "byte_io.hpp"
#include "flacforge_errors.hpp"
#include "flacforge_version.hpp"
#include "logging.hpp"

namespace flacforge {

namespace {

// Comment payload layout (lengths are 32-bit little-endian):
//
//   vendor_length, vendor_string
//   comment_count
//   comment_count x (length, "KEY=value")

// Key part of a `KEY=value` entry; empty when there is no '=' or it is the first character.
std::string comment_key(const std::string &comment) {
    const auto eq = comment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return {};
    }
    return comment.substr(0, eq);
}

}  // namespace

bool key_equals(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

VorbisComment::VorbisComment() : vendor_(std::string("FlacForge ") + FLACFORGE_VERSION_DISPLAY) {}

VorbisComment VorbisComment::decode(const std::vector<uint8_t> &payload) {
    ByteCursor cur(payload);
    VorbisComment out(std::string{});

    uint32_t vendor_len = 0;
    if (!cur.u32_le(vendor_len) || !cur.string(vendor_len, out.vendor_)) {
        throw DecodeError("vorbis comment: truncated vendor string");
    }
    uint32_t count = 0;
    if (!cur.u32_le(count)) {
        throw DecodeError("vorbis comment: missing comment count");
    }
    // Each entry needs at least its 4-byte length; reject counts the payload cannot hold.
    if (count > cur.remaining() / 4) {
        throw DecodeError("vorbis comment: count " + std::to_string(count) +
                          " exceeds payload size " + std::to_string(payload.size()));
    }
    out.comments_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t len = 0;
        std::string entry;
        if (!cur.u32_le(len) || !cur.string(len, entry)) {
            throw DecodeError("vorbis comment: entry " + std::to_string(i) + " overruns payload");
        }
        out.comments_.push_back(std::move(entry));
    }
    if (cur.remaining() != 0) {
        FF_LOG("debug", "vorbis comment: ignoring " << cur.remaining() << " trailing bytes");
    }
    FF_LOG("debug", "vorbis comment decoded vendor=\"" << out.vendor_
                                                       << "\" entries=" << out.comments_.size());
    return out;
}

std::vector<uint8_t> VorbisComment::encode() const {
    std::vector<uint8_t> p;
    write_u32_le(p, static_cast<uint32_t>(vendor_.size()));
    write_bytes(p, vendor_);
    write_u32_le(p, static_cast<uint32_t>(comments_.size()));
    for (const auto &c : comments_) {
        write_u32_le(p, static_cast<uint32_t>(c.size()));
        write_bytes(p, c);
    }
    return p;
}

MetadataBlock VorbisComment::to_block() const {
    return MetadataBlock(BlockType::VorbisComment, encode());
}

void VorbisComment::set(const std::string &key, const std::string &value) {
    if (value.empty()) {
        return;
    }
    for (size_t i = comments_.size(); i-- > 0;) {
        if (key_equals(comment_key(comments_[i]), key)) {
            comments_.erase(comments_.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
    comments_.push_back(key + "=" + value);
}

std::string VorbisComment::get(const std::string &key) const {
    const std::string prefix = key + "=";
    for (const auto &c : comments_) {
        if (c.size() > prefix.size() && c.compare(0, prefix.size(), prefix) == 0) {
            return c.substr(prefix.size());
        }
    }
    return {};
}

std::vector<std::string> VorbisComment::get_all(const std::string &key) const {
    std::vector<std::string> values;
    for (const auto &c : comments_) {
        if (!key_equals(comment_key(c), key)) {
            continue;
        }
        std::string value = c.substr(c.find('=') + 1);
        if (!value.empty()) {
            values.push_back(std::move(value));
        }
    }
    return values;
}

}  // namespace flacforge
