//
//  flac_test_utils.hpp
//  FlacForge
//
//  Test-only helpers to build tiny FLAC streams (kept independent of the library code to avoid
//  self-consistency bugs).
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace flac_test_utils {

inline void write_u24_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u32_be(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void write_u32_le(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

// 34-byte STREAMINFO payload with 4096-sample blocks and a zero MD5.
inline std::vector<uint8_t> make_stream_info(uint32_t sample_rate, uint32_t channels,
                                             uint32_t bits_per_sample,
                                             uint64_t total_samples = 0) {
    std::vector<uint8_t> p;
    p.reserve(34);
    p.push_back(0x10); p.push_back(0x00);  // min block size 4096
    p.push_back(0x10); p.push_back(0x00);  // max block size 4096
    write_u24_be(p, 0);                    // min frame size
    write_u24_be(p, 0);                    // max frame size
    const uint32_t ch = channels - 1;
    const uint32_t bps = bits_per_sample - 1;
    p.push_back(static_cast<uint8_t>((sample_rate >> 12) & 0xFF));
    p.push_back(static_cast<uint8_t>((sample_rate >> 4) & 0xFF));
    p.push_back(static_cast<uint8_t>(((sample_rate & 0x0F) << 4) | ((ch & 0x07) << 1) |
                                     ((bps >> 4) & 0x01)));
    p.push_back(static_cast<uint8_t>(((bps & 0x0F) << 4) | ((total_samples >> 32) & 0x0F)));
    write_u32_be(p, static_cast<uint32_t>(total_samples & 0xFFFFFFFF));
    p.resize(34, 0);  // MD5
    return p;
}

inline void append_block(std::vector<uint8_t> &buf, uint8_t type,
                         const std::vector<uint8_t> &payload, bool last) {
    buf.push_back(static_cast<uint8_t>((last ? 0x80 : 0x00) | (type & 0x7F)));
    write_u24_be(buf, static_cast<uint32_t>(payload.size()));
    buf.insert(buf.end(), payload.begin(), payload.end());
}

inline std::vector<uint8_t> make_vorbis_payload(const std::string &vendor,
                                                const std::vector<std::string> &comments) {
    std::vector<uint8_t> p;
    write_u32_le(p, static_cast<uint32_t>(vendor.size()));
    p.insert(p.end(), vendor.begin(), vendor.end());
    write_u32_le(p, static_cast<uint32_t>(comments.size()));
    for (const auto &c : comments) {
        write_u32_le(p, static_cast<uint32_t>(c.size()));
        p.insert(p.end(), c.begin(), c.end());
    }
    return p;
}

inline std::vector<uint8_t> make_picture_payload(uint32_t type, const std::string &mime,
                                                 const std::vector<uint8_t> &data) {
    std::vector<uint8_t> p;
    write_u32_be(p, type);
    write_u32_be(p, static_cast<uint32_t>(mime.size()));
    p.insert(p.end(), mime.begin(), mime.end());
    write_u32_be(p, 0);  // empty description
    write_u32_be(p, 1);  // width
    write_u32_be(p, 1);  // height
    write_u32_be(p, 24);
    write_u32_be(p, 0);
    write_u32_be(p, static_cast<uint32_t>(data.size()));
    p.insert(p.end(), data.begin(), data.end());
    return p;
}

// Some bytes standing in for encoded frames; starts with a frame sync code.
inline std::vector<uint8_t> make_audio_blob(size_t size = 64) {
    std::vector<uint8_t> audio(size);
    for (size_t i = 0; i < size; ++i) {
        audio[i] = static_cast<uint8_t>((i * 37 + 11) & 0xFF);
    }
    if (size >= 2) {
        audio[0] = 0xFF;
        audio[1] = 0xF8;
    }
    return audio;
}

// fLaC + blocks (last flag on the final one) + audio.
inline std::vector<uint8_t> make_flac(
    const std::vector<std::pair<uint8_t, std::vector<uint8_t>>> &blocks,
    const std::vector<uint8_t> &audio) {
    std::vector<uint8_t> file = {'f', 'L', 'a', 'C'};
    for (size_t i = 0; i < blocks.size(); ++i) {
        append_block(file, blocks[i].first, blocks[i].second, i + 1 == blocks.size());
    }
    file.insert(file.end(), audio.begin(), audio.end());
    return file;
}

// STREAMINFO (44.1 kHz / 16 bit / stereo) + optional extra blocks + audio.
inline std::vector<uint8_t> make_basic_flac(
    const std::vector<std::pair<uint8_t, std::vector<uint8_t>>> &extra = {}) {
    std::vector<std::pair<uint8_t, std::vector<uint8_t>>> blocks;
    blocks.emplace_back(0, make_stream_info(44100, 2, 16, 441000));
    blocks.insert(blocks.end(), extra.begin(), extra.end());
    return make_flac(blocks, make_audio_blob());
}

// Baseline JPEG header: SOI, APP0/JFIF, SOF0 (8-bit, 3 components, 4:2:0), EOI. `seed` varies
// the trailing bytes so two images differ.
inline std::vector<uint8_t> make_jpeg(uint16_t width, uint16_t height, uint8_t seed = 0) {
    std::vector<uint8_t> j = {0xFF, 0xD8};
    // APP0 JFIF, length 16.
    const uint8_t app0[] = {0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00, 0x01,
                            0x01, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00};
    j.insert(j.end(), std::begin(app0), std::end(app0));
    // SOF0, length 17.
    j.push_back(0xFF); j.push_back(0xC0);
    j.push_back(0x00); j.push_back(0x11);
    j.push_back(0x08);  // precision
    j.push_back(static_cast<uint8_t>(height >> 8)); j.push_back(static_cast<uint8_t>(height));
    j.push_back(static_cast<uint8_t>(width >> 8)); j.push_back(static_cast<uint8_t>(width));
    j.push_back(0x03);
    const uint8_t comps[] = {0x01, 0x22, 0x00, 0x02, 0x11, 0x01, 0x03, 0x11, 0x01};
    j.insert(j.end(), std::begin(comps), std::end(comps));
    // Padding bytes standing in for entropy-coded data.
    for (int i = 0; i < 16; ++i) {
        j.push_back(static_cast<uint8_t>(seed + i));
    }
    j.push_back(0xFF); j.push_back(0xD9);
    return j;
}

inline std::filesystem::path write_temp_file(const std::vector<uint8_t> &data,
                                             const std::string &name) {
    auto tmp = std::filesystem::temp_directory_path() / name;
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return tmp;
}

inline std::vector<uint8_t> read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return {};
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                std::istreambuf_iterator<char>());
}

// Block types in file order, read straight from the bytes.
inline std::vector<uint8_t> block_types(const std::vector<uint8_t> &file) {
    std::vector<uint8_t> types;
    size_t pos = 4;
    bool last = false;
    while (!last && pos + 4 <= file.size()) {
        last = (file[pos] & 0x80) != 0;
        types.push_back(file[pos] & 0x7F);
        const uint32_t len = (uint32_t(file[pos + 1]) << 16) | (uint32_t(file[pos + 2]) << 8) |
                             uint32_t(file[pos + 3]);
        pos += 4 + len;
    }
    return types;
}

}  // namespace flac_test_utils
