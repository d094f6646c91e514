//
//  ogg_page.hpp
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
#include <string>
#include <vector>

inline constexpr size_t kOggHeaderSize = 27;  // capture pattern + fixed header fields
inline constexpr size_t kOggMaxSegments = 255;
inline constexpr size_t kOggMaxSegmentSize = 255;

inline constexpr uint8_t kOggContinuedPacket = 0x01;
inline constexpr uint8_t kOggBeginOfStream = 0x02;
inline constexpr uint8_t kOggEndOfStream = 0x04;

// Opus always runs its granule clock at 48 kHz.
inline constexpr uint32_t kOpusSampleRateKhz = 48;

using Segment = std::vector<uint8_t>;
using Packet = std::vector<Segment>;

// One Ogg page (RFC 3533). Segments mirror the lacing table: a packet ends at
// the first segment shorter than 255 bytes.
struct OggPage {
    uint8_t version = 0;
    uint8_t header_type = 0;
    uint64_t granule_position = 0;
    uint32_t serial_no = 0;
    uint32_t page_no = 0;
    uint32_t checksum = 0;
    std::vector<Segment> segments;

    // Serialized size: header + lacing table + segment data.
    size_t size() const;

    std::vector<uint8_t> serialize() const;

    // Recompute `checksum` over the page with the checksum field zeroed.
    void update_checksum();

    // Serialize a renumbered copy (used when composing new streams).
    std::vector<uint8_t> serialize_with(bool is_last, uint64_t granule, uint32_t page_num) const;

    // Opus samples (48 kHz) of all packets starting on this page. nullopt for
    // empty packets and non-CELT configurations.
    std::optional<uint64_t> duration() const;
};

struct OggParseResult {
    bool ok = false;
    std::string message;
    std::vector<OggPage> pages;
};

// CRC-32 as used by Ogg: polynomial 0x04c11db7, zero init, no reflection, no final xor.
uint32_t ogg_crc32(const uint8_t *data, size_t size);

// Read pages until end of stream. Page sequence numbers must count up from 0.
OggParseResult parse_ogg_pages(std::istream &in);
