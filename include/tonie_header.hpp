//
//  tonie_header.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/// Alignment unit of a Tonie container; the audio payload starts on a page boundary.
inline constexpr size_t kToniePageSize = 0x1000;
/// Size of the big-endian length prefix in front of the encoded header message.
inline constexpr size_t kLengthPrefixSize = 4;
/// Largest message the 32-bit length prefix can describe.
inline constexpr size_t kMaxHeaderMessageSize = 0xFFFFFFFF;

// Message field numbers (fixed by existing Tonie files).
inline constexpr uint32_t kFieldDataHash = 1;
inline constexpr uint32_t kFieldDataLength = 2;
inline constexpr uint32_t kFieldTimestamp = 3;
inline constexpr uint32_t kFieldChapterPages = 4;
inline constexpr uint32_t kFieldPadding = 5;

/**
 * @brief Header of a Tonie audio container.
 *
 * Describes the Ogg payload following it: SHA-1 of the payload, its byte length, a creation
 * timestamp and the Ogg page index at which each chapter begins. `padding` fills the header up
 * to the next page boundary. Fields the codec does not know are kept as raw wire bytes in
 * `unknown_fields` and written back unchanged.
 */
struct TonieHeader {
    std::vector<uint8_t> data_hash;       ///< SHA-1 of the payload (20 bytes)
    uint64_t data_length = 0;             ///< Payload size in bytes
    uint32_t timestamp = 0;               ///< Seconds since epoch
    std::vector<uint32_t> chapter_pages;  ///< First Ogg page of each chapter, strictly increasing
    std::vector<uint8_t> padding;         ///< Alignment filler, conventionally zero
    std::vector<uint8_t> unknown_fields;  ///< Unrecognized fields, raw tag + value bytes

    bool operator==(const TonieHeader &other) const = default;
};
