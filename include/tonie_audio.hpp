//
//  tonie_audio.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

#include "ogg_page.hpp"
#include "tonie_header.hpp"

// Pages 0 and 1 of a Tonie carry the Opus identification and comment headers.
inline constexpr uint32_t kOpusHeaderPages = 2;

// A decoded Tonie: header plus the Ogg pages that follow it.
struct TonieAudio {
    TonieHeader header;
    std::vector<OggPage> pages;
};

// Decode the header at the current stream position, then read all Ogg pages.
std::optional<TonieAudio> parse_tonie(std::istream &in);

// Page indices of one chapter: from its start page up to the next chapter's
// start (or the end of the stream for the last chapter).
std::optional<std::vector<uint32_t>> chapter_page_nums(const TonieAudio &audio, size_t chapter);

/**
 * @brief Write the given chapters (in order) as a new Ogg stream.
 *
 * Opus header pages are copied verbatim; when the first chapter is not chapter 0 the pages
 * 0, 1 and 2 are written first, and chapter 0 in a later position is written without its
 * header pages. All other pages are renumbered and get fresh granule
 * positions; the final page is flagged end-of-stream.
 *
 * @param add_header When true, a Tonie header (hash, length, timestamp, chapter pages) is
 *        written in front of the pages, padded to one Tonie page. `out` must be seekable.
 * @return Start page of each written chapter, or nullopt on failure.
 */
std::optional<std::vector<uint32_t>> compose(const TonieAudio &audio,
                                             const std::vector<size_t> &chapters,
                                             std::ostream &out, bool add_header = true);

/**
 * @brief Append an Ogg Opus stream as a new chapter.
 *
 * A short last page of `audio` is padded to one Tonie page. The packets of `opus` (minus its
 * two header pages) are then repacked into new pages of exactly one Tonie page each, so the
 * chapter starts on a page of its own. `audio` is left unchanged on failure.
 *
 * @return Index of the new chapter.
 */
std::optional<size_t> append_chapter(TonieAudio &audio, std::istream &opus);
