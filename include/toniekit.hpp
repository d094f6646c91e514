//
//  toniekit.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "header_codec.hpp"
#include "tonie_header.hpp"

namespace toniekit {

/// @defgroup api TonieKit Public API
/// Public, supported C++ interfaces for inspecting and rewriting Tonie audio files.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open files, decode the header or repack audio).
 */
struct TonieStatus {
    bool ok{false};
    std::string message;
};

/// Header and integrity state of a Tonie file.
struct ReadResult {
    TonieStatus status;
    TonieHeader header;
    size_t header_size = 0;    ///< Bytes before the payload (prefix + message)
    uint64_t payload_size = 0; ///< Bytes after the header
    VerifyResult verification; ///< Hash/length check of the payload against the header
};

/**
 * @brief Return the TonieKit library version string (e.g. `v0.1`).
 */
std::string version_string();  ///< @ingroup api

/// Decode the header of a Tonie file and verify it against the payload.
/// A verification mismatch is reported in `verification`, not as a failed status.
ReadResult read_tonie(const std::string &path);  ///< @ingroup api

/// Write one chapter of a Tonie file as a standalone Ogg Opus file.
TonieStatus export_chapter(const std::string &input_path, size_t chapter,
                           const std::string &output_path);  ///< @ingroup api

/// Write a new Tonie file holding only the given chapters, in the given order.
TonieStatus skip_chapters(const std::string &input_path, const std::vector<size_t> &chapters,
                          const std::string &output_path);  ///< @ingroup api

/**
 * @brief Replace the chapters of a Tonie file with Ogg Opus files.
 *
 * Each Opus file becomes one chapter. The Opus streams should match the source encoding
 * (48 kHz CELT, same channel count) since the Tonie's own Opus header pages are kept.
 *
 * @param input_path Source Tonie file (provides Opus headers and timestamp).
 * @param opus_paths One Ogg Opus file per output chapter.
 * @param output_path Destination Tonie file.
 */
TonieStatus swap_chapters(const std::string &input_path,
                          const std::vector<std::string> &opus_paths,
                          const std::string &output_path);  ///< @ingroup api

/// Diagnostic JSON view of a header (hash as hex, sizes, chapter pages).
nlohmann::json describe_header(const TonieHeader &header);  ///< @ingroup api

/// @}

}  // namespace toniekit
