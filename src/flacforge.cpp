//
//  flacforge.cpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "flacforge.hpp"
#include "flacforge_version.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "flac_file.hpp"
#include "logging.hpp"
#include "picture_block.hpp"
#include "stream_info.hpp"
#include "tag_fields.hpp"
#include "vorbis_comment.hpp"

namespace flacforge {

std::string version_string() { return FLACFORGE_VERSION_DISPLAY; }

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Format:
            return "format";
        case ErrorKind::IO:
            return "io";
        case ErrorKind::NotFound:
            return "not-found";
        case ErrorKind::Decode:
            return "decode";
        case ErrorKind::Picture:
            return "picture";
    }
    return "unknown";
}

namespace {

Status make_status(bool ok, ErrorKind error = ErrorKind::None, std::string msg = {}) {
    return Status{ok, error, std::move(msg)};
}

Status failure(const char *what, const std::string &path, const FlacError &e) {
    std::string msg = std::string(what) + " failed for " + path + ": " + e.what();
    FF_LOG("error", msg << " [" << error_kind_name(e.kind()) << "]");
    return make_status(false, e.kind(), std::move(msg));
}

// The vorbis comment to edit: decoded from the first VORBIS_COMMENT block (DecodeError when it
// is malformed), or a fresh one when the file has none.
VorbisComment load_comment(const FlacFile &file) {
    const auto idx = file.find_first(BlockType::VorbisComment);
    if (!idx) {
        FF_LOG("debug", "no vorbis comment block, starting empty");
        return VorbisComment();
    }
    return VorbisComment::decode(file.blocks()[*idx].payload);
}

// Replace all PICTURE blocks by a single front cover built from `jpeg`. Construction failures
// are logged and leave the file without a picture.
void embed_cover(FlacFile &file, const std::vector<uint8_t> &jpeg) {
    const size_t removed = file.remove_all(BlockType::Picture);
    if (removed > 0) {
        FF_LOG("debug", "removed " << removed << " existing picture block(s)");
    }
    try {
        const Picture pic = make_jpeg_picture(PictureType::FrontCover, "Front Cover", jpeg);
        file.replace_or_append(pic.to_block());
        FF_LOG("info", "Cover art embedded successfully (" << jpeg.size() << " bytes)");
    } catch (const PictureError &e) {
        FF_LOG("warn", "Failed to create picture block: " << e.what());
    }
}

// Read the cover file; a missing or unreadable file (directories included) is reported and
// yields nullopt.
std::optional<std::vector<uint8_t>> load_cover_file(const std::string &cover_path) {
    std::error_code ec;
    if (!std::filesystem::exists(cover_path, ec)) {
        FF_LOG("warn", "Cover file does not exist: " << cover_path);
        return std::nullopt;
    }
    try {
        return read_file_bytes(cover_path);
    } catch (const FlacError &e) {
        FF_LOG("warn", "Failed to read cover file " << cover_path << ": " << e.what());
        return std::nullopt;
    }
}

template <typename CoverStep>
Status embed_with(const std::string &flac_path, const Metadata &metadata, CoverStep cover_step) {
    const auto t0 = std::chrono::steady_clock::now();
    try {
        FlacFile file = FlacFile::parse(flac_path);
        VorbisComment comment = load_comment(file);
        apply_metadata(comment, metadata);
        file.replace_or_append(comment.to_block());

        cover_step(file);

        file.save(flac_path);
    } catch (const FlacError &e) {
        return failure("embed_metadata", flac_path, e);
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    FF_LOG("debug", "embed_metadata " << flac_path << " done in " << ms << " ms");
    return make_status(true);
}

}  // namespace

Status embed_metadata(const std::string &flac_path, const Metadata &metadata,
                      const std::string &cover_path) {
    FF_LOG("debug", "embed_metadata(path) file=" << flac_path << " cover=" << cover_path);
    return embed_with(flac_path, metadata, [&](FlacFile &file) {
        if (cover_path.empty()) {
            return;
        }
        auto cover = load_cover_file(cover_path);
        if (cover) {
            embed_cover(file, *cover);
        }
    });
}

Status embed_metadata(const std::string &flac_path, const Metadata &metadata,
                      const std::vector<uint8_t> &cover_data) {
    FF_LOG("debug", "embed_metadata(bytes) file=" << flac_path << " cover_bytes="
                                                  << cover_data.size());
    return embed_with(flac_path, metadata, [&](FlacFile &file) {
        if (!cover_data.empty()) {
            embed_cover(file, cover_data);
        }
    });
}

Status embed_lyrics(const std::string &flac_path, const std::string &lyrics) {
    FF_LOG("debug", "embed_lyrics file=" << flac_path << " chars=" << lyrics.size());
    try {
        FlacFile file = FlacFile::parse(flac_path);
        VorbisComment comment = load_comment(file);
        comment.set(tag_keys::kLyrics, lyrics);
        comment.set(tag_keys::kUnsyncedLyrics, lyrics);
        file.replace_or_append(comment.to_block());
        file.save(flac_path);
    } catch (const FlacError &e) {
        return failure("embed_lyrics", flac_path, e);
    }
    return make_status(true);
}

LyricsResult extract_lyrics(const std::string &flac_path) {
    LyricsResult res;
    try {
        const FlacFile file = FlacFile::parse(flac_path);
        for (const auto &block : file.blocks()) {
            if (block.kind() != BlockKind::VorbisComment) {
                continue;
            }
            try {
                res.lyrics = find_lyrics(VorbisComment::decode(block.payload));
            } catch (const DecodeError &e) {
                FF_LOG("warn", "skipping malformed vorbis comment: " << e.what());
                continue;
            }
            if (!res.lyrics.empty()) {
                res.status = make_status(true);
                return res;
            }
        }
    } catch (const FlacError &e) {
        res.status = failure("extract_lyrics", flac_path, e);
        return res;
    }
    res.status = failure("extract_lyrics", flac_path, NotFoundError("no lyrics found in file"));
    return res;
}

ReadResult read_metadata(const std::string &flac_path) {
    ReadResult res;
    try {
        const FlacFile file = FlacFile::parse(flac_path);
        for (const auto &block : file.blocks()) {
            if (block.kind() != BlockKind::VorbisComment) {
                continue;
            }
            try {
                res.metadata = extract_metadata(VorbisComment::decode(block.payload));
            } catch (const DecodeError &e) {
                FF_LOG("warn", "skipping malformed vorbis comment: " << e.what());
                continue;
            }
            break;
        }
    } catch (const FlacError &e) {
        res.status = failure("read_metadata", flac_path, e);
        return res;
    }
    res.status = make_status(true);
    return res;
}

QualityResult get_audio_quality(const std::string &flac_path) {
    QualityResult res;
    try {
        res.quality = read_audio_quality(flac_path);
    } catch (const FlacError &e) {
        res.status = failure("get_audio_quality", flac_path, e);
        return res;
    }
    res.status = make_status(true);
    return res;
}

CoverResult read_cover(const std::string &flac_path) {
    CoverResult res;
    try {
        const FlacFile file = FlacFile::parse(flac_path);
        std::optional<Picture> chosen;
        for (const auto &block : file.blocks()) {
            if (block.kind() != BlockKind::Picture) {
                continue;
            }
            Picture pic = Picture::decode(block.payload);
            if (pic.picture_type == static_cast<uint32_t>(PictureType::FrontCover)) {
                chosen = std::move(pic);
                break;
            }
            if (!chosen) {
                chosen = std::move(pic);
            }
        }
        if (!chosen) {
            res.status =
                failure("read_cover", flac_path, NotFoundError("no picture block in file"));
            return res;
        }
        res.mime = std::move(chosen->mime);
        res.data = std::move(chosen->data);
    } catch (const FlacError &e) {
        res.status = failure("read_cover", flac_path, e);
        return res;
    }
    res.status = make_status(true);
    return res;
}

}  // namespace flacforge
