//
//  wire_format.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "wire_format.hpp"

namespace {

constexpr size_t kFixed32Size = 4;
constexpr size_t kFixed64Size = 8;

}  // namespace

// -----------------------------------------------------------------------------
// Packed repeated field.
// -----------------------------------------------------------------------------
void write_packed_varints(std::vector<uint8_t> &p, uint32_t field,
                          const std::vector<uint32_t> &values) {
    size_t body = 0;
    for (uint32_t v : values) {
        body += varint_size(v);
    }
    write_tag(p, field, WireType::LengthDelimited);
    write_varint(p, body);
    for (uint32_t v : values) {
        write_varint(p, v);
    }
}

// -----------------------------------------------------------------------------
// Reader.
// -----------------------------------------------------------------------------
bool WireReader::advance(size_t n) {
    if (n > size_ - pos_) {
        return false;
    }
    pos_ += n;
    return true;
}

bool WireReader::read_varint(uint64_t &out) {
    uint64_t value = 0;
    for (size_t i = 0; i < kMaxVarintBytes; ++i) {
        if (pos_ >= size_) {
            return false;
        }
        const uint8_t b = data_[pos_++];
        // The tenth byte only has room for the top bit of a 64-bit value.
        if (i == kMaxVarintBytes - 1 && b > 0x01) {
            return false;
        }
        value |= uint64_t(b & 0x7F) << (7 * i);
        if ((b & 0x80) == 0) {
            out = value;
            return true;
        }
    }
    return false;
}

bool WireReader::read_tag(uint32_t &field, WireType &type) {
    uint64_t key = 0;
    if (!read_varint(key)) {
        return false;
    }
    const uint64_t number = key >> 3;
    const uint8_t raw_type = static_cast<uint8_t>(key & 0x07);
    if (number == 0 || number > kMaxFieldNumber) {
        return false;
    }
    switch (raw_type) {
        case static_cast<uint8_t>(WireType::Varint):
        case static_cast<uint8_t>(WireType::Fixed64):
        case static_cast<uint8_t>(WireType::LengthDelimited):
        case static_cast<uint8_t>(WireType::Fixed32):
            break;
        default:
            return false;
    }
    field = static_cast<uint32_t>(number);
    type = static_cast<WireType>(raw_type);
    return true;
}

bool WireReader::read_length_delimited(const uint8_t *&out, size_t &len) {
    uint64_t n = 0;
    if (!read_varint(n)) {
        return false;
    }
    if (n > size_ - pos_) {
        return false;
    }
    out = data_ + pos_;
    len = static_cast<size_t>(n);
    pos_ += len;
    return true;
}

bool WireReader::skip_value(WireType type) {
    switch (type) {
        case WireType::Varint: {
            uint64_t ignored = 0;
            return read_varint(ignored);
        }
        case WireType::Fixed64:
            return advance(kFixed64Size);
        case WireType::LengthDelimited: {
            const uint8_t *ignored = nullptr;
            size_t len = 0;
            return read_length_delimited(ignored, len);
        }
        case WireType::Fixed32:
            return advance(kFixed32Size);
        default:
            return false;
    }
}
