//
//  logging.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
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

namespace toniekit {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Hex helper used in debug logs and diagnostics to dump binary blobs (hashes, packets).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t>& data,
                              size_t max_len = kHexPreviewBytes,
                              std::string_view separator = " ") {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << separator;
        }
    }
    return oss.str();
}

}  // namespace toniekit

inline constexpr toniekit::LogVerbosity tk_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return toniekit::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return toniekit::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return toniekit::LogVerbosity::Info;
    }
    // Everything else (ogg/opus/tonie/etc.) treated as debug-level.
    return toniekit::LogVerbosity::Debug;
}

inline bool tk_should_log(const char* level) {
    const auto current = toniekit::get_log_verbosity();
    const auto sev = tk_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tk_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TonieKit][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TonieKit][" << level << "] " << msg << std::endl;
    }
}

#define TK_LOG(level, message)                                              \
    do {                                                                    \
        if (tk_should_log(level)) {                                         \
            std::ostringstream _tk_log_ss;                                  \
            _tk_log_ss << message;                                          \
            tk_log_impl(level, _tk_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
