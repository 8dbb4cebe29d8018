//
//  main.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "flacforge.hpp"
#include "flacforge_version.hpp"
#include "logging.hpp"
#include "tags_json.hpp"
#include <nlohmann/json.hpp>

namespace {

bool write_bytes(const std::filesystem::path &p, const std::vector<uint8_t> &data) {
    if (data.empty()) return false;
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

bool read_text(const std::string &path, std::string &out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Read mode: tags + quality as JSON on stdout.
int emit_json(const std::string &input_path) {
    auto tags = flacforge::read_metadata(input_path);
    if (!tags.status.ok) {
        FF_LOG("error", "flacforge: failed to read metadata: " << tags.status.message);
        return 1;
    }
    auto quality = flacforge::get_audio_quality(input_path);
    if (!quality.status.ok) {
        FF_LOG("error", "flacforge: failed to read STREAMINFO: " << quality.status.message);
        return 1;
    }
    nlohmann::json j = tags.metadata;
    j["quality"] = quality.quality;
    auto cover = flacforge::read_cover(input_path);
    if (cover.status.ok) {
        j["cover"] = {{"mime", cover.mime}, {"bytes", cover.data.size()}};
    }
    std::cout << j.dump(2) << "\n";
    return 0;
}

void print_usage() {
    std::cerr << "FlacForge " << FLACFORGE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2025 Till Toenshoff\n\n"
              << "usage for reading:\n"
              << "  flacforge <input.flac> [--export-cover FILE] [--extract-lyrics] "
              << "[--log-level warn|info|debug]\n"
              << "usage for writing:\n"
              << "  flacforge <input.flac> <tags.json> [--log-level warn|info|debug]\n"
              << "  flacforge <input.flac> --lyrics <lyrics.txt>\n"
              << "Options:\n"
              << "  --export-cover FILE  Write the embedded cover image to FILE.\n"
              << "  --extract-lyrics     Print embedded lyrics instead of the JSON summary.\n"
              << "  --lyrics FILE        Embed the contents of FILE as lyrics.\n"
              << "  --log-level LEVEL    Set logging verbosity (default: info).\n"
              << "                       JSON is always written to stdout when reading.\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "FlacForge " << FLACFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    std::filesystem::path export_cover;
    std::string lyrics_file;
    bool extract_lyrics = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--extract-lyrics") {
            extract_lyrics = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            flacforge::set_log_verbosity(flacforge::parse_log_verbosity(argv[++i]));
            FF_LOG("debug", "log level set to "
                                << flacforge::log_verbosity_name(flacforge::get_log_verbosity()));
        } else if (arg == "--export-cover" && i + 1 < argc) {
            export_cover = argv[++i];
        } else if (arg == "--lyrics" && i + 1 < argc) {
            lyrics_file = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty() || positional.size() > 2) {
        print_usage();
        return 2;
    }
    const std::string input_path = positional[0];

    if (!lyrics_file.empty()) {
        std::string lyrics;
        if (!read_text(lyrics_file, lyrics)) {
            std::cerr << "Cannot read lyrics file: " << lyrics_file << "\n";
            return 2;
        }
        auto status = flacforge::embed_lyrics(input_path, lyrics);
        if (!status.ok) {
            FF_LOG("error", "flacforge: failed to embed lyrics: " << status.message);
            return 1;
        }
        std::cout << "Wrote: " << input_path << "\n";
        return 0;
    }

    // Writing mode: input + tag file.
    if (positional.size() == 2) {
        flacforge::TagFile tags;
        if (!flacforge::load_tag_file(positional[1], tags)) {
            return 1;
        }
        auto status = flacforge::embed_metadata(input_path, tags.metadata, tags.cover_path);
        if (!status.ok) {
            FF_LOG("error", "flacforge: failed to embed metadata: " << status.message);
            return 1;
        }
        std::cout << "Wrote: " << input_path << "\n";
        return 0;
    }

    if (!export_cover.empty()) {
        auto cover = flacforge::read_cover(input_path);
        if (!cover.status.ok || !write_bytes(export_cover, cover.data)) {
            FF_LOG("error", "flacforge: failed to export cover: " << cover.status.message);
            return 1;
        }
    }

    if (extract_lyrics) {
        auto res = flacforge::extract_lyrics(input_path);
        if (!res.status.ok) {
            FF_LOG("error", "flacforge: " << res.status.message);
            return 1;
        }
        std::cout << res.lyrics << "\n";
        return 0;
    }

    return emit_json(input_path);
}
