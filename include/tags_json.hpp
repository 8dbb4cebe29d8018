//
//  tags_json.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "metadata_set.hpp"

namespace flacforge {

// nlohmann ADL hooks. Missing keys fall back to empty/zero.
void to_json(nlohmann::json &j, const Metadata &m);
void from_json(const nlohmann::json &j, Metadata &m);
void to_json(nlohmann::json &j, const AudioQuality &q);
void from_json(const nlohmann::json &j, AudioQuality &q);

/// Tag file consumed by the CLI writer.
struct TagFile {
    Metadata metadata;
    std::string cover_path;  ///< resolved against the tag file's directory; empty = no cover
};

// Load a tag file; logs and returns false when it cannot be opened or parsed.
bool load_tag_file(const std::string &json_path, TagFile &out);

}  // namespace flacforge
