//
//  logging.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace metasplice {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (e.g. TIFF).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t> &data,
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

}  // namespace metasplice

inline constexpr metasplice::LogVerbosity ms_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return metasplice::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return metasplice::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return metasplice::LogVerbosity::Info;
    }
    // Everything else (webp/mp4/flac/tiff/etc.) treated as debug-level.
    return metasplice::LogVerbosity::Debug;
}

inline bool ms_should_log(const char *level) {
    const auto current = metasplice::get_log_verbosity();
    const auto sev = ms_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void ms_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[MetaSplice][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[MetaSplice][" << level << "] " << msg << std::endl;
    }
}

#define MS_LOG(level, message)                                              \
    do {                                                                    \
        if (ms_should_log(level)) {                                         \
            std::ostringstream _ms_log_ss;                                  \
            _ms_log_ss << message;                                          \
            ms_log_impl(level, _ms_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
