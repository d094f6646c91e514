//
//  header_codec.hpp
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

#include "sha1_digest.hpp"
#include "tonie_header.hpp"

// The codec is pure: no I/O, no logging, no shared state. Every failure is
// returned to the caller as a value.

enum class HeaderError {
    None = 0,
    TruncatedInput,        ///< Not enough bytes for the prefix or the message body
    MalformedMessage,      ///< Message bytes do not parse into the known field layout
    HashMismatch,          ///< SHA-1 of the payload differs from dataHash
    LengthMismatch,        ///< Payload size differs from dataLength
    NonMonotonicChapters,  ///< chapterPages not strictly increasing
};

const char *header_error_name(HeaderError error);

struct DecodeResult {
    HeaderError error = HeaderError::None;
    std::string message;
    TonieHeader header;
    size_t bytes_consumed = 0;  // prefix + message; the payload starts here

    bool ok() const { return error == HeaderError::None; }
};

// Both checks always run; both flags may be set.
struct VerifyResult {
    bool hash_mismatch = false;
    bool length_mismatch = false;
    std::string message;

    bool ok() const { return !hash_mismatch && !length_mismatch; }
    std::vector<HeaderError> errors() const;
};

struct ValidationResult {
    HeaderError error = HeaderError::None;
    size_t index = 0;  // first offending entry
    std::string message;

    bool ok() const { return error == HeaderError::None; }
};

struct BuildResult {
    ValidationResult status;
    TonieHeader header;

    bool ok() const { return status.ok(); }
};

/// Parse a length-prefixed header from the start of a Tonie file. Reads exactly
/// 4 + L bytes; the payload (if present) is left untouched and unverified.
DecodeResult decode_header(const uint8_t *data, size_t size);
DecodeResult decode_header(const std::vector<uint8_t> &bytes);

/// Serialize the header fields (no length prefix).
std::vector<uint8_t> encode_message(const TonieHeader &header);

/// Serialize the header with its 4-byte big-endian length prefix. Returns an
/// empty vector when the message exceeds kMaxHeaderMessageSize.
std::vector<uint8_t> encode_header(const TonieHeader &header);

/// Compare SHA-1 and length of `payload` against the header claims.
VerifyResult verify_header(const TonieHeader &header, const uint8_t *payload, size_t size);
VerifyResult verify_header(const TonieHeader &header, const std::vector<uint8_t> &payload);

/// Chapter start pages must be strictly increasing; an empty list is valid.
ValidationResult validate_chapter_pages(const std::vector<uint32_t> &pages);

/// Replace `padding` with zeros so that encode_header(header).size() is a
/// multiple of page_size.
void fit_padding(TonieHeader &header, size_t page_size = kToniePageSize);

/// Build a ready-to-write header over an already hashed payload.
BuildResult build_header(const Sha1Digest &digest, uint64_t data_length,
                         const std::vector<uint32_t> &chapter_pages, uint32_t timestamp,
                         size_t page_size = kToniePageSize);

/// Hash `payload` and build a header for it. Fails with HashMismatch only when
/// the digest could not be computed.
BuildResult build_header(const std::vector<uint8_t> &payload,
                         const std::vector<uint32_t> &chapter_pages, uint32_t timestamp,
                         size_t page_size = kToniePageSize);
