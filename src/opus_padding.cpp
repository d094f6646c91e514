//
//  opus_padding.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "opus_padding.hpp"

#include <algorithm>

#include "logging.hpp"

namespace {

constexpr uint8_t kFrameCountMask = 0x03;
constexpr uint8_t kCode3 = 0x03;
constexpr uint8_t kPaddingFlag = 0x40;
constexpr uint8_t kVbrFlag = 0x80;
// A padding length byte of 255 means 254 bytes plus another length byte.
constexpr uint8_t kPaddingContinue = 255;
constexpr size_t kPaddingPerContinue = 254;

// Lacing values plus data bytes of a packet of `size` bytes.
size_t footprint_of(size_t size) { return size + size / kOggMaxSegmentSize + 1; }

std::vector<uint8_t> padding_lengths(size_t zero_bytes) {
    std::vector<uint8_t> out;
    while (zero_bytes > kPaddingPerContinue) {
        out.push_back(kPaddingContinue);
        zero_bytes -= kPaddingPerContinue;
    }
    out.push_back(static_cast<uint8_t>(zero_bytes));
    return out;
}

Packet split_segments(const std::vector<uint8_t> &data) {
    Packet out;
    for (size_t pos = 0; pos < data.size(); pos += kOggMaxSegmentSize) {
        const size_t n = std::min(kOggMaxSegmentSize, data.size() - pos);
        out.emplace_back(data.begin() + pos, data.begin() + pos + n);
    }
    // A packet whose size is a multiple of 255 is terminated by an empty segment.
    if (data.empty() || data.size() % kOggMaxSegmentSize == 0) {
        out.emplace_back();
    }
    return out;
}

}  // namespace

size_t packet_page_footprint(const Packet &packet) {
    size_t total = packet.size();
    for (const auto &s : packet) {
        total += s.size();
    }
    return total;
}

std::optional<Packet> pad_packet(const Packet &packet, size_t pad_length) {
    if (pad_length == 0) {
        return packet;
    }

    std::vector<uint8_t> data;
    for (const auto &s : packet) {
        data.insert(data.end(), s.begin(), s.end());
    }
    if (data.empty()) {
        TK_LOG("warn", "cannot pad an empty opus packet");
        return std::nullopt;
    }
    const size_t target = packet_page_footprint(packet) + pad_length;

    // Repack into code 3 so the packet can carry padding.
    const uint8_t code = data[0] & kFrameCountMask;
    if (code != kCode3) {
        data[0] |= kCode3;
        uint8_t frame_count_byte = 0;
        if (code == 0) {
            frame_count_byte = 1;
        } else if (code == 1) {
            frame_count_byte = 2;
        } else {
            // Code 2 already stores the first frame length, which code 3 VBR
            // expects right after the count byte and padding lengths.
            frame_count_byte = kVbrFlag | 2;
        }
        data.insert(data.begin() + 1, frame_count_byte);
    } else {
        if (data.size() < 2) {
            TK_LOG("warn", "code 3 opus packet without frame count byte");
            return std::nullopt;
        }
        if (data[1] & kPaddingFlag) {
            TK_LOG("warn", "opus packet is already padded ("
                               << toniekit::hex_prefix(data, 4) << ")");
            return std::nullopt;
        }
    }

    // The repack alone may have filled the gap.
    if (footprint_of(data.size()) == target) {
        return split_segments(data);
    }

    // Length bytes and lacing values grow in steps, so some targets cannot be
    // hit exactly.
    size_t zero_bytes = 0;
    for (;;) {
        const size_t footprint =
            footprint_of(data.size() + padding_lengths(zero_bytes).size() + zero_bytes);
        if (footprint == target) {
            break;
        }
        if (footprint > target) {
            TK_LOG("warn", "cannot pad opus packet by exactly " << pad_length << " bytes");
            return std::nullopt;
        }
        ++zero_bytes;
    }

    const auto lengths = padding_lengths(zero_bytes);
    data[1] |= kPaddingFlag;
    data.insert(data.begin() + 2, lengths.begin(), lengths.end());
    data.insert(data.end(), zero_bytes, 0);
    return split_segments(data);
}
