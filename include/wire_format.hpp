//
//  wire_format.hpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Protocol-message wire types. Groups (3/4) are deprecated and rejected by the reader.
enum class WireType : uint8_t {
    Varint = 0,
    Fixed64 = 1,
    LengthDelimited = 2,
    StartGroup = 3,
    EndGroup = 4,
    Fixed32 = 5,
};

inline constexpr size_t kMaxVarintBytes = 10;
inline constexpr uint32_t kMaxFieldNumber = (1u << 29) - 1;

// ------------- Helper write functions ---------------------------------------

inline void write_u32_be(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline uint32_t read_u32_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

inline size_t varint_size(uint64_t v) {
    size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

inline void write_varint(std::vector<uint8_t> &p, uint64_t v) {
    while (v >= 0x80) {
        p.push_back(static_cast<uint8_t>(v | 0x80));
        v >>= 7;
    }
    p.push_back(static_cast<uint8_t>(v));
}

inline constexpr uint64_t make_tag(uint32_t field, WireType type) {
    return (uint64_t(field) << 3) | static_cast<uint8_t>(type);
}

inline void write_tag(std::vector<uint8_t> &p, uint32_t field, WireType type) {
    write_varint(p, make_tag(field, type));
}

inline void write_bytes_field(std::vector<uint8_t> &p, uint32_t field,
                              const std::vector<uint8_t> &data) {
    write_tag(p, field, WireType::LengthDelimited);
    write_varint(p, data.size());
    p.insert(p.end(), data.begin(), data.end());
}

inline void write_varint_field(std::vector<uint8_t> &p, uint32_t field, uint64_t v) {
    write_tag(p, field, WireType::Varint);
    write_varint(p, v);
}

// Packed repeated varints: one tag, one length, then the values back to back.
void write_packed_varints(std::vector<uint8_t> &p, uint32_t field,
                          const std::vector<uint32_t> &values);

// ------------- Reader --------------------------------------------------------

// Cursor over an in-memory message. Each read returns false on truncated or
// ill-formed input; the cursor position is unspecified after a failed read.
class WireReader {
   public:
    WireReader(const uint8_t *data, size_t size) : data_(data), size_(size) {}

    bool at_end() const { return pos_ >= size_; }
    size_t position() const { return pos_; }

    bool read_varint(uint64_t &out);

    // Reads a field key. Rejects field number 0, numbers above 2^29-1 and the
    // group/reserved wire types.
    bool read_tag(uint32_t &field, WireType &type);

    // Reads a length-delimited value; `out` points into the underlying buffer.
    bool read_length_delimited(const uint8_t *&out, size_t &len);

    // Skips the value of a field whose key has already been read.
    bool skip_value(WireType type);

   private:
    bool advance(size_t n);

    const uint8_t *data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};
