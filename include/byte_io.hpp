//
//  byte_io.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// FLAC block headers and picture fields are big-endian; vorbis-comment lengths are
// little-endian (inherited from Ogg Vorbis).

// ------------- Writers ------------------------------------------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u24(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_bytes(std::vector<uint8_t> &p, const std::string &s) {
    p.insert(p.end(), s.begin(), s.end());
}

// ------------- Readers (caller guarantees bounds) ---------------------------

inline uint32_t read_u24(const uint8_t *b) {
    return (uint32_t(b[0]) << 16) | (uint32_t(b[1]) << 8) | uint32_t(b[2]);
}

inline uint32_t read_u32(const uint8_t *b) {
    return (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) |
           uint32_t(b[3]);
}

inline uint32_t read_u32_le(const uint8_t *b) {
    return uint32_t(b[0]) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]) << 16) |
           (uint32_t(b[3]) << 24);
}

/**
 * @brief Bounds-checked cursor over a block payload.
 *
 * Every accessor returns false instead of reading past the end, so decoders can map a short
 * payload onto their own error type.
 */
class ByteCursor {
   public:
    explicit ByteCursor(const std::vector<uint8_t> &data) : data_(data) {}

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

    bool u32(uint32_t &out) {
        if (remaining() < 4) {
            return false;
        }
        out = read_u32(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    bool u32_le(uint32_t &out) {
        if (remaining() < 4) {
            return false;
        }
        out = read_u32_le(data_.data() + pos_);
        pos_ += 4;
        return true;
    }

    bool string(size_t len, std::string &out) {
        if (remaining() < len) {
            return false;
        }
        out.assign(reinterpret_cast<const char *>(data_.data() + pos_), len);
        pos_ += len;
        return true;
    }

    bool bytes(size_t len, std::vector<uint8_t> &out) {
        if (remaining() < len) {
            return false;
        }
        out.assign(data_.begin() + pos_, data_.begin() + pos_ + len);
        pos_ += len;
        return true;
    }

   private:
    const std::vector<uint8_t> &data_;
    size_t pos_ = 0;
};
