//
//  header_codec.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "header_codec.hpp"

#include <algorithm>
#include <limits>
#include <utility>

#include "wire_format.hpp"

namespace {

DecodeResult fail(HeaderError error, std::string message) {
    DecodeResult r;
    r.error = error;
    r.message = std::move(message);
    return r;
}

bool read_u32_varint(WireReader &reader, uint32_t &out) {
    uint64_t v = 0;
    if (!reader.read_varint(v) || v > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

// Parse the message body into `h`. Returns an empty string on success or a
// short reason for MalformedMessage.
std::string parse_message(const uint8_t *data, size_t size, TonieHeader &h) {
    WireReader reader(data, size);
    while (!reader.at_end()) {
        const size_t field_start = reader.position();
        uint32_t field = 0;
        WireType type = WireType::Varint;
        if (!reader.read_tag(field, type)) {
            return "invalid field key at offset " + std::to_string(field_start);
        }

        switch (field) {
            case kFieldDataHash:
            case kFieldPadding: {
                if (type != WireType::LengthDelimited) {
                    return "field " + std::to_string(field) + " is not length-delimited";
                }
                const uint8_t *p = nullptr;
                size_t len = 0;
                if (!reader.read_length_delimited(p, len)) {
                    return "field " + std::to_string(field) + " overruns the message";
                }
                auto &dst = field == kFieldDataHash ? h.data_hash : h.padding;
                dst.assign(p, p + len);
                break;
            }
            case kFieldDataLength: {
                if (type != WireType::Varint || !reader.read_varint(h.data_length)) {
                    return "dataLength is not a valid varint";
                }
                break;
            }
            case kFieldTimestamp: {
                if (type != WireType::Varint ||
                    !read_u32_varint(reader, h.timestamp)) {
                    return "timestamp is not a valid 32-bit varint";
                }
                break;
            }
            case kFieldChapterPages: {
                if (type == WireType::Varint) {
                    uint32_t page = 0;
                    if (!read_u32_varint(reader, page)) {
                        return "chapterPages entry is not a valid 32-bit varint";
                    }
                    h.chapter_pages.push_back(page);
                    break;
                }
                if (type != WireType::LengthDelimited) {
                    return "chapterPages has wire type " +
                           std::to_string(static_cast<int>(type));
                }
                const uint8_t *p = nullptr;
                size_t len = 0;
                if (!reader.read_length_delimited(p, len)) {
                    return "packed chapterPages overruns the message";
                }
                WireReader packed(p, len);
                while (!packed.at_end()) {
                    uint32_t page = 0;
                    if (!read_u32_varint(packed, page)) {
                        return "packed chapterPages holds an invalid 32-bit varint";
                    }
                    h.chapter_pages.push_back(page);
                }
                break;
            }
            default: {
                if (!reader.skip_value(type)) {
                    return "unknown field " + std::to_string(field) + " overruns the message";
                }
                h.unknown_fields.insert(h.unknown_fields.end(), data + field_start,
                                        data + reader.position());
                break;
            }
        }
    }
    return {};
}

}  // namespace

const char *header_error_name(HeaderError error) {
    switch (error) {
        case HeaderError::None:
            return "None";
        case HeaderError::TruncatedInput:
            return "TruncatedInput";
        case HeaderError::MalformedMessage:
            return "MalformedMessage";
        case HeaderError::HashMismatch:
            return "HashMismatch";
        case HeaderError::LengthMismatch:
            return "LengthMismatch";
        case HeaderError::NonMonotonicChapters:
            return "NonMonotonicChapters";
    }
    return "Unknown";
}

std::vector<HeaderError> VerifyResult::errors() const {
    std::vector<HeaderError> out;
    if (hash_mismatch) {
        out.push_back(HeaderError::HashMismatch);
    }
    if (length_mismatch) {
        out.push_back(HeaderError::LengthMismatch);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Decode.
// -----------------------------------------------------------------------------
DecodeResult decode_header(const uint8_t *data, size_t size) {
    if (size < kLengthPrefixSize) {
        return fail(HeaderError::TruncatedInput,
                    "need 4 bytes of length prefix, have " + std::to_string(size));
    }
    const uint32_t message_size = read_u32_be(data);
    if (message_size > size - kLengthPrefixSize) {
        return fail(HeaderError::TruncatedInput,
                    "header claims " + std::to_string(message_size) + " bytes, only " +
                        std::to_string(size - kLengthPrefixSize) + " available");
    }

    DecodeResult result;
    std::string reason = parse_message(data + kLengthPrefixSize, message_size, result.header);
    if (!reason.empty()) {
        return fail(HeaderError::MalformedMessage, std::move(reason));
    }
    result.bytes_consumed = kLengthPrefixSize + message_size;
    return result;
}

DecodeResult decode_header(const std::vector<uint8_t> &bytes) {
    return decode_header(bytes.data(), bytes.size());
}

// -----------------------------------------------------------------------------
// Encode.
// -----------------------------------------------------------------------------
std::vector<uint8_t> encode_message(const TonieHeader &header) {
    std::vector<uint8_t> out;
    out.reserve(header.data_hash.size() + header.padding.size() +
                header.unknown_fields.size() + 32 + header.chapter_pages.size() * 5);

    // Field-number order; zero scalars and empty sequences are omitted.
    if (!header.data_hash.empty()) {
        write_bytes_field(out, kFieldDataHash, header.data_hash);
    }
    if (header.data_length != 0) {
        write_varint_field(out, kFieldDataLength, header.data_length);
    }
    if (header.timestamp != 0) {
        write_varint_field(out, kFieldTimestamp, header.timestamp);
    }
    if (!header.chapter_pages.empty()) {
        write_packed_varints(out, kFieldChapterPages, header.chapter_pages);
    }
    if (!header.padding.empty()) {
        write_bytes_field(out, kFieldPadding, header.padding);
    }
    out.insert(out.end(), header.unknown_fields.begin(), header.unknown_fields.end());
    return out;
}

std::vector<uint8_t> encode_header(const TonieHeader &header) {
    const std::vector<uint8_t> message = encode_message(header);
    std::vector<uint8_t> out;
    out.reserve(kLengthPrefixSize + message.size());
    if (message.size() > kMaxHeaderMessageSize) {
        return {};
    }
    write_u32_be(out, static_cast<uint32_t>(message.size()));
    out.insert(out.end(), message.begin(), message.end());
    return out;
}

// -----------------------------------------------------------------------------
// Verification.
// -----------------------------------------------------------------------------
VerifyResult verify_header(const TonieHeader &header, const uint8_t *payload, size_t size) {
    VerifyResult result;

    auto digest = sha1_digest(payload, size);
    if (!digest) {
        result.hash_mismatch = true;
        result.message = "SHA-1 digest unavailable";
    } else if (header.data_hash.size() != kSha1Size ||
               !std::equal(digest->begin(), digest->end(), header.data_hash.begin())) {
        result.hash_mismatch = true;
        result.message = "payload SHA-1 does not match dataHash";
    }

    if (header.data_length != size) {
        result.length_mismatch = true;
        if (!result.message.empty()) {
            result.message += "; ";
        }
        result.message += "payload is " + std::to_string(size) + " bytes, dataLength says " +
                          std::to_string(header.data_length);
    }
    return result;
}

VerifyResult verify_header(const TonieHeader &header, const std::vector<uint8_t> &payload) {
    return verify_header(header, payload.data(), payload.size());
}

ValidationResult validate_chapter_pages(const std::vector<uint32_t> &pages) {
    ValidationResult result;
    for (size_t i = 1; i < pages.size(); ++i) {
        if (pages[i] <= pages[i - 1]) {
            result.error = HeaderError::NonMonotonicChapters;
            result.index = i;
            result.message = "chapter " + std::to_string(i) + " starts at page " +
                             std::to_string(pages[i]) + ", not after page " +
                             std::to_string(pages[i - 1]);
            break;
        }
    }
    return result;
}

// -----------------------------------------------------------------------------
// Header construction.
// -----------------------------------------------------------------------------
void fit_padding(TonieHeader &header, size_t page_size) {
    header.padding.clear();
    if (page_size == 0) {
        return;
    }
    const size_t base = kLengthPrefixSize + encode_message(header).size();
    if (base % page_size == 0) {
        return;
    }
    const size_t tag_size = varint_size(make_tag(kFieldPadding, WireType::LengthDelimited));

    // The padding length varint is part of the total, so solve for each varint
    // width in turn and keep the first size whose varint has that width. An
    // empty padding field is never written, so the gap is at least one byte.
    for (size_t width = 1; width <= kMaxVarintBytes; ++width) {
        const size_t fixed = base + tag_size + width;
        size_t n = page_size - fixed % page_size;
        while (varint_size(n) < width) {
            n += page_size;
        }
        if (varint_size(n) == width) {
            header.padding.assign(n, 0);
            return;
        }
    }
}

BuildResult build_header(const Sha1Digest &digest, uint64_t data_length,
                         const std::vector<uint32_t> &chapter_pages, uint32_t timestamp,
                         size_t page_size) {
    BuildResult result;
    result.status = validate_chapter_pages(chapter_pages);
    if (!result.status.ok()) {
        return result;
    }
    result.header.data_hash.assign(digest.begin(), digest.end());
    result.header.data_length = data_length;
    result.header.timestamp = timestamp;
    result.header.chapter_pages = chapter_pages;
    fit_padding(result.header, page_size);
    return result;
}

BuildResult build_header(const std::vector<uint8_t> &payload,
                         const std::vector<uint32_t> &chapter_pages, uint32_t timestamp,
                         size_t page_size) {
    auto digest = sha1_digest(payload.data(), payload.size());
    if (!digest) {
        BuildResult result;
        result.status.error = HeaderError::HashMismatch;
        result.status.message = "SHA-1 digest unavailable";
        return result;
    }
    return build_header(*digest, payload.size(), chapter_pages, timestamp, page_size);
}
