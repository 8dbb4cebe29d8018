//
//  logging.hpp
//  FlacForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace flacforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI level name ("debug", "info", "warn"/"warning", "error") to a verbosity. Unknown
// names fall back to Error.
LogVerbosity parse_log_verbosity(std::string_view name);
const char *log_verbosity_name(LogVerbosity level);

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (block payloads,
// JPEG headers).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t>& data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace flacforge

inline constexpr flacforge::LogVerbosity ff_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return flacforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return flacforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return flacforge::LogVerbosity::Info;
    }
    // Everything else (io/parser/block/etc.) treated as debug-level.
    return flacforge::LogVerbosity::Debug;
}

inline bool ff_should_log(const char* level) {
    const auto current = flacforge::get_log_verbosity();
    const auto sev = ff_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void ff_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[FlacForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[FlacForge][" << level << "] " << msg << std::endl;
    }
}

#define FF_LOG(level, message)                                              \
    do {                                                                    \
        if (ff_should_log(level)) {                                         \
            std::ostringstream _ff_log_ss;                                  \
            _ff_log_ss << message;                                          \
            ff_log_impl(level, _ff_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
