//
//  flac_file.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "flac_file.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "flacforge_errors.hpp"
#include "logging.hpp"

namespace flacforge {

std::vector<uint8_t> read_file_bytes(const std::string &path) {
    // Directories open fine on some filesystems and report a bogus size.
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IoError(ec ? "cannot stat " + path + ": " + ec.message()
                         : "not a regular file: " + path);
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        throw IoError("open failed for " + path + " errno=" + std::to_string(errno) + " (" +
                      std::generic_category().message(errno) + ")");
    }
    if (!f.seekg(0, std::ios::end)) {
        throw IoError("seek failed for " + path);
    }
    const std::streamoff len = f.tellg();
    if (len < 0 || !f.seekg(0, std::ios::beg)) {
        throw IoError("cannot determine size of " + path);
    }
    std::vector<uint8_t> out(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), len);
    if (f.gcount() != len) {
        throw IoError("short read for " + path + " (" + std::to_string(f.gcount()) + " of " +
                      std::to_string(len) + " bytes)");
    }
    return out;
}

FlacFile FlacFile::parse(const std::string &path) {
    FF_LOG("debug", "parse enter path=" << path);
    return parse_bytes(read_file_bytes(path), path);
}

FlacFile FlacFile::parse_bytes(const std::vector<uint8_t> &bytes, const std::string &label) {
    if (bytes.size() < sizeof(kFlacMarker) ||
        std::memcmp(bytes.data(), kFlacMarker, sizeof(kFlacMarker)) != 0) {
        throw FormatError("not a FLAC file (missing fLaC marker): " + label);
    }

    FlacFile out;
    size_t pos = sizeof(kFlacMarker);
    bool last = false;
    while (!last) {
        if (bytes.size() - pos < kBlockHeaderSize) {
            throw FormatError("truncated metadata block header at offset " +
                              std::to_string(pos) + " in " + label);
        }
        const BlockHeader header = decode_block_header(bytes.data() + pos);
        pos += kBlockHeaderSize;
        if (bytes.size() - pos < header.length) {
            throw FormatError(block_type_name(header.type) + " block at offset " +
                              std::to_string(pos - kBlockHeaderSize) + " claims " +
                              std::to_string(header.length) + " bytes, only " +
                              std::to_string(bytes.size() - pos) + " left in " + label);
        }
        if (out.blocks_.empty() && header.type != static_cast<uint8_t>(BlockType::StreamInfo)) {
            throw FormatError("first block is not STREAMINFO (" + block_type_name(header.type) +
                              ") in " + label);
        }
        out.blocks_.emplace_back(
            header.type, std::vector<uint8_t>(bytes.begin() + pos,
                                              bytes.begin() + pos + header.length));
        FF_LOG("debug", "block " << block_type_name(header.type) << " len=" << header.length
                                 << " last=" << header.is_last);
        pos += header.length;
        last = header.is_last;
    }
    out.audio_.assign(bytes.begin() + pos, bytes.end());

    FF_LOG("debug", "parse done " << label << " blocks=" << out.blocks_.size()
                                  << " audio_bytes=" << out.audio_.size());
    return out;
}

std::optional<size_t> FlacFile::find_first(BlockType type) const {
    for (size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i].is(type)) {
            return i;
        }
    }
    return std::nullopt;
}

void FlacFile::replace_or_append(MetadataBlock block) {
    const auto idx = find_first(static_cast<BlockType>(block.type));
    if (idx) {
        blocks_[*idx] = std::move(block);
    } else {
        blocks_.push_back(std::move(block));
    }
}

size_t FlacFile::remove_all(BlockType type) {
    size_t removed = 0;
    for (size_t i = blocks_.size(); i-- > 0;) {
        if (blocks_[i].is(type)) {
            blocks_.erase(blocks_.begin() + static_cast<std::ptrdiff_t>(i));
            ++removed;
        }
    }
    return removed;
}

size_t FlacFile::count(BlockType type) const {
    size_t n = 0;
    for (const auto &b : blocks_) {
        if (b.is(type)) {
            ++n;
        }
    }
    return n;
}

std::vector<uint8_t> FlacFile::serialize() const {
    if (blocks_.empty()) {
        throw FormatError("cannot serialize a FLAC stream without metadata blocks");
    }
    size_t total = sizeof(kFlacMarker) + audio_.size();
    for (const auto &b : blocks_) {
        if (b.payload.size() > kMaxBlockPayload) {
            throw FormatError(block_type_name(b.type) + " payload of " +
                              std::to_string(b.payload.size()) +
                              " bytes exceeds the 24-bit block length");
        }
        total += kBlockHeaderSize + b.payload.size();
    }

    std::vector<uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), std::begin(kFlacMarker), std::end(kFlacMarker));
    for (size_t i = 0; i < blocks_.size(); ++i) {
        const auto &b = blocks_[i];
        BlockHeader header;
        header.is_last = (i + 1 == blocks_.size());
        header.type = b.type;
        header.length = static_cast<uint32_t>(b.payload.size());
        encode_block_header(out, header);
        out.insert(out.end(), b.payload.begin(), b.payload.end());
    }
    out.insert(out.end(), audio_.begin(), audio_.end());
    return out;
}

void FlacFile::save(const std::string &path) const {
    const auto bytes = serialize();
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        throw IoError("open for write failed for " + path + " errno=" + std::to_string(errno) +
                      " (" + std::generic_category().message(errno) + ")");
    }
    f.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f.good()) {
        throw IoError("write failed for " + path);
    }
    FF_LOG("debug", "saved " << path << " bytes=" << bytes.size()
                             << " blocks=" << blocks_.size());
}

}  // namespace flacforge
