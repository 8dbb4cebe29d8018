// Feeds truncated and malformed containers through the public API: every call must fail cleanly
// with the right error class and leave the file on disk untouched.
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "flac_test_utils.hpp"
#include "flacforge.hpp"

using flacforge::ErrorKind;
using namespace flac_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[file_safety] FAIL: " << msg << "\n";
    }
    return cond;
}

// Run every operation against `bytes` and expect `kind` from each one.
bool run_case(const std::string &name, const std::vector<uint8_t> &bytes, ErrorKind kind) {
    const auto path = write_temp_file(bytes, "ff_safety_" + name + ".flac");
    const std::string p = path.string();
    bool ok = true;

    flacforge::Metadata meta;
    meta.title = "Should not be written";
    auto st = flacforge::embed_metadata(p, meta);
    ok &= check(!st.ok && st.error == kind, name + ": embed_metadata error class");

    st = flacforge::embed_metadata(p, meta, make_jpeg(4, 4));
    ok &= check(!st.ok && st.error == kind, name + ": embed_metadata(bytes) error class");

    st = flacforge::embed_lyrics(p, "la la");
    ok &= check(!st.ok && st.error == kind, name + ": embed_lyrics error class");

    auto lyr = flacforge::extract_lyrics(p);
    ok &= check(!lyr.status.ok && lyr.status.error == kind, name + ": extract_lyrics");

    auto rd = flacforge::read_metadata(p);
    ok &= check(!rd.status.ok && rd.status.error == kind, name + ": read_metadata");

    auto cover = flacforge::read_cover(p);
    ok &= check(!cover.status.ok && cover.status.error == kind, name + ": read_cover");

    ok &= check(read_file(path) == bytes, name + ": file left unchanged");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;

    ok &= run_case("empty", {}, ErrorKind::Format);
    ok &= run_case("short_marker", {'f', 'L', 'a'}, ErrorKind::Format);
    ok &= run_case("id3_marker", {'I', 'D', '3', 0x04, 0x00, 0x00, 0x00, 0x00}, ErrorKind::Format);
    ok &= run_case("marker_only", {'f', 'L', 'a', 'C'}, ErrorKind::Format);

    // Header cut after two bytes.
    ok &= run_case("truncated_header", {'f', 'L', 'a', 'C', 0x00, 0x00}, ErrorKind::Format);

    // STREAMINFO claims 34 bytes, only 10 follow.
    auto short_payload = make_basic_flac();
    short_payload.resize(4 + 4 + 10);
    ok &= run_case("truncated_payload", short_payload, ErrorKind::Format);

    // Non-final block claims far more than the file holds.
    std::vector<uint8_t> overrun = {'f', 'L', 'a', 'C'};
    append_block(overrun, 0, make_stream_info(44100, 2, 16), false);
    overrun.push_back(0x04);
    write_u24_be(overrun, 0xFFFFFF);
    overrun.push_back('x');
    ok &= run_case("length_overrun", overrun, ErrorKind::Format);

    // Last flag never set: the walker runs off the end looking for another header.
    std::vector<uint8_t> no_last = {'f', 'L', 'a', 'C'};
    append_block(no_last, 0, make_stream_info(44100, 2, 16), false);
    ok &= run_case("missing_last_flag", no_last, ErrorKind::Format);

    auto wrong_first = make_flac(
        {{1, std::vector<uint8_t>(8)}, {0, make_stream_info(44100, 2, 16)}}, make_audio_blob());
    ok &= run_case("padding_first", wrong_first, ErrorKind::Format);

    // A missing file is an IO error for every read path.
    const std::string missing = "/nonexistent/ff_safety_missing.flac";
    auto rd = flacforge::read_metadata(missing);
    ok &= check(!rd.status.ok && rd.status.error == ErrorKind::IO, "missing file read is IO");
    auto st = flacforge::embed_lyrics(missing, "x");
    ok &= check(!st.ok && st.error == ErrorKind::IO, "missing file write is IO");
    ok &= check(!std::filesystem::exists(missing), "missing file not created");

    // A directory in place of the FLAC file is an IO error for every operation.
    const auto dir = std::filesystem::temp_directory_path() / "ff_safety_dir.flac";
    std::filesystem::create_directories(dir);
    const std::string d = dir.string();
    flacforge::Metadata meta;
    meta.title = "x";
    st = flacforge::embed_metadata(d, meta);
    ok &= check(!st.ok && st.error == ErrorKind::IO, "directory: embed_metadata is IO");
    st = flacforge::embed_metadata(d, meta, make_jpeg(4, 4));
    ok &= check(!st.ok && st.error == ErrorKind::IO, "directory: embed_metadata(bytes) is IO");
    st = flacforge::embed_lyrics(d, "x");
    ok &= check(!st.ok && st.error == ErrorKind::IO, "directory: embed_lyrics is IO");
    auto lyr = flacforge::extract_lyrics(d);
    ok &= check(!lyr.status.ok && lyr.status.error == ErrorKind::IO,
                "directory: extract_lyrics is IO");
    rd = flacforge::read_metadata(d);
    ok &= check(!rd.status.ok && rd.status.error == ErrorKind::IO,
                "directory: read_metadata is IO");
    auto quality = flacforge::get_audio_quality(d);
    ok &= check(!quality.status.ok && quality.status.error == ErrorKind::IO,
                "directory: get_audio_quality is IO");
    auto cover = flacforge::read_cover(d);
    ok &= check(!cover.status.ok && cover.status.error == ErrorKind::IO,
                "directory: read_cover is IO");
    ok &= check(std::filesystem::is_directory(dir), "directory left in place");

    if (ok) {
        std::cout << "[file_safety] OK\n";
    }
    return ok ? 0 : 1;
}
