//
//  flac_file.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "flac_block.hpp"

namespace flacforge {

/**
 * @brief A parsed FLAC container: ordered metadata blocks plus the opaque audio frames.
 *
 * The audio region ("everything after the last metadata block") is kept as a blob and written
 * back untouched. Blocks keep their original payload bytes until replaced.
 */
class FlacFile {
   public:
    FlacFile() = default;

    // Throws IoError when the file cannot be read, FormatError on a bad marker, truncated block
    // framing or a first block other than STREAMINFO.
    static FlacFile parse(const std::string &path);
    static FlacFile parse_bytes(const std::vector<uint8_t> &bytes,
                                const std::string &label = "<memory>");

    // Index of the first block of `type`.
    std::optional<size_t> find_first(BlockType type) const;

    // Replace the first block of the same type in place, or append when there is none.
    void replace_or_append(MetadataBlock block);

    // Remove every block of `type`; returns how many were removed.
    size_t remove_all(BlockType type);

    size_t count(BlockType type) const;

    // Marker, blocks with fresh headers (last flag on the final block only), then audio.
    // Throws FormatError when there are no blocks or a payload exceeds the 24-bit length.
    std::vector<uint8_t> serialize() const;

    // Serialize and overwrite `path`. Throws IoError on write failure.
    void save(const std::string &path) const;

    const std::vector<MetadataBlock> &blocks() const { return blocks_; }
    std::vector<MetadataBlock> &blocks() { return blocks_; }
    const std::vector<uint8_t> &audio() const { return audio_; }

   private:
    std::vector<MetadataBlock> blocks_;
    std::vector<uint8_t> audio_;
};

// Read a whole file into memory. Throws IoError.
std::vector<uint8_t> read_file_bytes(const std::string &path);

}  // namespace flacforge
