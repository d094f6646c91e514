//
//  ogg_page.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "ogg_page.hpp"

#include <array>
#include <cstring>
#include <utility>

#include "logging.hpp"

namespace {

constexpr char kOggMagic[4] = {'O', 'g', 'g', 'S'};
constexpr size_t kChecksumOffset = 22;
constexpr uint32_t kOggCrcPolynomial = 0x04c11db7;

// Opus TOC: configs 16..31 are CELT-only, frame size cycles 2.5/5/10/20 ms.
constexpr uint8_t kFirstCeltConfig = 16;
constexpr uint32_t kCeltFrameSamples[4] = {kOpusSampleRateKhz * 5 / 2, kOpusSampleRateKhz * 5,
                                           kOpusSampleRateKhz * 10, kOpusSampleRateKhz * 20};

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t k = i << 24;
        for (int bit = 0; bit < 8; ++bit) {
            k = (k & 0x80000000u) ? (k << 1) ^ kOggCrcPolynomial : (k << 1);
        }
        table[i] = k;
    }
    return table;
}

void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

void write_u64_le(std::vector<uint8_t> &p, uint64_t v) {
    write_u32_le(p, static_cast<uint32_t>(v & 0xFFFFFFFF));
    write_u32_le(p, static_cast<uint32_t>(v >> 32));
}

uint32_t read_u32_le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

uint64_t read_u64_le(const uint8_t *p) {
    return uint64_t(read_u32_le(p)) | (uint64_t(read_u32_le(p + 4)) << 32);
}

// Frames in one Opus packet, from the TOC byte and (for code 3) the count byte.
std::optional<uint32_t> opus_frame_count(const Segment &first) {
    switch (first[0] & 0x03) {
        case 0:
            return 1;
        case 1:
        case 2:
            return 2;
        default:
            if (first.size() < 2) {
                return std::nullopt;
            }
            return first[1] & 0x3F;
    }
}

OggParseResult parse_failure(std::string message, std::vector<OggPage> pages) {
    OggParseResult r;
    r.message = std::move(message);
    r.pages = std::move(pages);
    return r;
}

}  // namespace

uint32_t ogg_crc32(const uint8_t *data, size_t size) {
    static const std::array<uint32_t, 256> table = make_crc_table();
    uint32_t crc = 0;
    for (size_t i = 0; i < size; ++i) {
        crc = (crc << 8) ^ table[((crc >> 24) ^ data[i]) & 0xFF];
    }
    return crc;
}

// -----------------------------------------------------------------------------
// Serialization.
// -----------------------------------------------------------------------------
size_t OggPage::size() const {
    size_t total = kOggHeaderSize + segments.size();
    for (const auto &s : segments) {
        total += s.size();
    }
    return total;
}

std::vector<uint8_t> OggPage::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(size());
    out.insert(out.end(), std::begin(kOggMagic), std::end(kOggMagic));
    out.push_back(version);
    out.push_back(header_type);
    write_u64_le(out, granule_position);
    write_u32_le(out, serial_no);
    write_u32_le(out, page_no);
    write_u32_le(out, checksum);
    out.push_back(static_cast<uint8_t>(segments.size()));
    for (const auto &s : segments) {
        out.push_back(static_cast<uint8_t>(s.size()));
    }
    for (const auto &s : segments) {
        out.insert(out.end(), s.begin(), s.end());
    }
    return out;
}

void OggPage::update_checksum() {
    checksum = 0;
    const auto data = serialize();
    checksum = ogg_crc32(data.data(), data.size());
}

std::vector<uint8_t> OggPage::serialize_with(bool is_last, uint64_t granule,
                                             uint32_t page_num) const {
    OggPage page = *this;
    page.header_type = is_last ? kOggEndOfStream : 0;
    page.granule_position = granule;
    page.page_no = page_num;
    page.update_checksum();
    return page.serialize();
}

// -----------------------------------------------------------------------------
// Opus duration (RFC 7845 granule accounting, RFC 6716 TOC).
// -----------------------------------------------------------------------------
std::optional<uint64_t> OggPage::duration() const {
    uint64_t total = 0;
    // A continued page starts mid-packet; its leading segments add no frames.
    size_t prev_length = (header_type & kOggContinuedPacket) ? kOggMaxSegmentSize : 0;
    for (const auto &segment : segments) {
        if (prev_length < kOggMaxSegmentSize) {
            if (segment.empty()) {
                return std::nullopt;
            }
            const uint8_t config = segment[0] >> 3;
            if (config < kFirstCeltConfig) {
                return std::nullopt;
            }
            auto frames = opus_frame_count(segment);
            if (!frames) {
                return std::nullopt;
            }
            total += uint64_t(kCeltFrameSamples[config % 4]) * *frames;
        }
        prev_length = segment.size();
    }
    return total;
}

// -----------------------------------------------------------------------------
// Parsing.
// -----------------------------------------------------------------------------
OggParseResult parse_ogg_pages(std::istream &in) {
    std::vector<OggPage> pages;

    for (;;) {
        uint8_t header[kOggHeaderSize];
        in.read(reinterpret_cast<char *>(header), 4);
        if (in.gcount() == 0 && in.eof()) {
            break;
        }
        if (in.gcount() != 4 || std::memcmp(header, kOggMagic, 4) != 0) {
            return parse_failure("missing OggS capture pattern at page " +
                                     std::to_string(pages.size()),
                                 std::move(pages));
        }
        in.read(reinterpret_cast<char *>(header + 4), kOggHeaderSize - 4);
        if (in.gcount() != static_cast<std::streamsize>(kOggHeaderSize - 4)) {
            return parse_failure("truncated page header", std::move(pages));
        }

        OggPage page;
        page.version = header[4];
        page.header_type = header[5];
        page.granule_position = read_u64_le(header + 6);
        page.serial_no = read_u32_le(header + 14);
        page.page_no = read_u32_le(header + 18);
        page.checksum = read_u32_le(header + kChecksumOffset);
        const uint8_t segment_count = header[26];

        if (page.page_no != pages.size()) {
            return parse_failure("page sequence " + std::to_string(page.page_no) +
                                     " found at index " + std::to_string(pages.size()),
                                 std::move(pages));
        }

        uint8_t lacing[kOggMaxSegments];
        in.read(reinterpret_cast<char *>(lacing), segment_count);
        if (in.gcount() != segment_count) {
            return parse_failure("truncated lacing table", std::move(pages));
        }
        page.segments.reserve(segment_count);
        for (uint8_t i = 0; i < segment_count; ++i) {
            Segment segment(lacing[i]);
            in.read(reinterpret_cast<char *>(segment.data()), lacing[i]);
            if (in.gcount() != lacing[i]) {
                return parse_failure("truncated segment data", std::move(pages));
            }
            page.segments.push_back(std::move(segment));
        }

        OggPage check = page;
        check.update_checksum();
        if (check.checksum != page.checksum) {
            TK_LOG("warn", "ogg page " << page.page_no << " checksum mismatch (stored 0x"
                                       << std::hex << page.checksum << ", computed 0x"
                                       << check.checksum << std::dec << ")");
        }
        pages.push_back(std::move(page));
    }

    OggParseResult result;
    result.ok = true;
    result.pages = std::move(pages);
    TK_LOG("debug", "parsed " << result.pages.size() << " ogg pages");
    return result;
}
