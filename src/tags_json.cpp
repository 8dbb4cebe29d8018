//
//  tags_json.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tags_json.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace flacforge {

void to_json(json &j, const Metadata &m) {
    j = json{{"title", m.title},
             {"artist", m.artist},
             {"album", m.album},
             {"album_artist", m.album_artist},
             {"date", m.date},
             {"track_number", m.track_number},
             {"total_tracks", m.total_tracks},
             {"disc_number", m.disc_number},
             {"isrc", m.isrc},
             {"description", m.description},
             {"lyrics", m.lyrics}};
}

void from_json(const json &j, Metadata &m) {
    m.title = j.value("title", "");
    m.artist = j.value("artist", "");
    m.album = j.value("album", "");
    m.album_artist = j.value("album_artist", "");
    m.date = j.value("date", "");
    m.track_number = j.value("track_number", 0);
    m.total_tracks = j.value("total_tracks", 0);
    m.disc_number = j.value("disc_number", 0);
    m.isrc = j.value("isrc", "");
    m.description = j.value("description", "");
    m.lyrics = j.value("lyrics", "");
}

void to_json(json &j, const AudioQuality &q) {
    j = json{{"bit_depth", q.bit_depth}, {"sample_rate", q.sample_rate}};
}

void from_json(const json &j, AudioQuality &q) {
    q.bit_depth = j.value("bit_depth", 0);
    q.sample_rate = j.value("sample_rate", 0);
}

bool load_tag_file(const std::string &json_path, TagFile &out) {
    std::ifstream f(json_path);
    if (!f.is_open()) {
        FF_LOG("error", "open failed for " << json_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    json j;
    std::string cover;
    try {
        f >> j;
        if (!j.is_object()) {
            FF_LOG("error", "tag file " << json_path << " is not a JSON object");
            return false;
        }
        out.metadata = j.get<Metadata>();
        cover = j.value("cover", "");
    } catch (const json::exception &e) {
        FF_LOG("error", "parse error in " << json_path << ": " << e.what());
        return false;
    }

    if (!cover.empty()) {
        const auto base = std::filesystem::path(json_path).parent_path();
        out.cover_path = (base / cover).string();
    } else {
        out.cover_path.clear();
    }
    FF_LOG("debug", "loaded tag file " << json_path << " title=\"" << out.metadata.title
                                       << "\" cover=" << out.cover_path);
    return true;
}

}  // namespace flacforge
