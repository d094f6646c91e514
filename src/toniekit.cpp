//
//  toniekit.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//
#include "toniekit.hpp"
#include "toniekit_version.hpp"

#include <cerrno>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "tonie_audio.hpp"

using json = nlohmann::json;

namespace toniekit {

std::string version_string() { return TONIEKIT_VERSION_DISPLAY; }

}  // namespace toniekit

namespace {

using toniekit::TonieStatus;

TonieStatus fail(std::string message) {
    TK_LOG("error", message);
    return TonieStatus{false, std::move(message)};
}

std::string open_error(const std::string &path) {
    return "open failed for " + path + " errno=" + std::to_string(errno) + " (" +
           std::generic_category().message(errno) + ")";
}

static bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        TK_LOG("error", open_error(path));
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff len = f.tellg();
    if (len < 0) {
        TK_LOG("error", "cannot determine size of " << path);
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (f.gcount() != len) {
        TK_LOG("error", "short read for " << path);
        return false;
    }
    return true;
}

static std::optional<TonieAudio> load_tonie(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        TK_LOG("error", open_error(path));
        return std::nullopt;
    }
    return parse_tonie(in);
}

static TonieStatus write_composed(const TonieAudio &audio, const std::vector<size_t> &chapters,
                                  const std::string &output_path, bool add_header) {
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return fail(open_error(output_path));
    }
    auto starts = compose(audio, chapters, out, add_header);
    if (!starts) {
        return fail("failed to compose " + output_path);
    }
    out.close();
    if (!out) {
        return fail("failed to finish writing " + output_path);
    }
    TK_LOG("info", "wrote " << output_path << " (" << starts->size() << " chapters)");
    return TonieStatus{true, {}};
}

}  // namespace

namespace toniekit {

ReadResult read_tonie(const std::string &path) {
    ReadResult res;
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes)) {
        res.status.message = "failed to read " + path;
        return res;
    }

    auto decoded = decode_header(bytes);
    if (!decoded.ok()) {
        res.status = fail(std::string("invalid tonie header in ") + path + ": " +
                          header_error_name(decoded.error) + " (" + decoded.message + ")");
        return res;
    }

    res.header = std::move(decoded.header);
    res.header_size = decoded.bytes_consumed;
    res.payload_size = bytes.size() - decoded.bytes_consumed;
    res.verification = verify_header(res.header, bytes.data() + decoded.bytes_consumed,
                                     bytes.size() - decoded.bytes_consumed);
    if (!res.verification.ok()) {
        TK_LOG("warn", path << ": " << res.verification.message);
    }
    const auto chapters = validate_chapter_pages(res.header.chapter_pages);
    if (!chapters.ok()) {
        TK_LOG("warn", path << ": " << chapters.message);
    }
    res.status.ok = true;
    return res;
}

TonieStatus export_chapter(const std::string &input_path, size_t chapter,
                           const std::string &output_path) {
    auto audio = load_tonie(input_path);
    if (!audio) {
        return fail("failed to read tonie " + input_path);
    }
    return write_composed(*audio, {chapter}, output_path, false);
}

TonieStatus skip_chapters(const std::string &input_path, const std::vector<size_t> &chapters,
                          const std::string &output_path) {
    if (chapters.empty()) {
        return fail("no chapters selected");
    }
    auto audio = load_tonie(input_path);
    if (!audio) {
        return fail("failed to read tonie " + input_path);
    }
    return write_composed(*audio, chapters, output_path, true);
}

TonieStatus swap_chapters(const std::string &input_path,
                          const std::vector<std::string> &opus_paths,
                          const std::string &output_path) {
    if (opus_paths.empty()) {
        return fail("no opus files given");
    }
    auto audio = load_tonie(input_path);
    if (!audio) {
        return fail("failed to read tonie " + input_path);
    }

    std::vector<size_t> chapters;
    chapters.reserve(opus_paths.size());
    for (const auto &opus_path : opus_paths) {
        std::ifstream opus(opus_path, std::ios::binary);
        if (!opus.is_open()) {
            return fail(open_error(opus_path));
        }
        auto chapter = append_chapter(*audio, opus);
        if (!chapter) {
            return fail("failed to append " + opus_path);
        }
        TK_LOG("info", "appended " << opus_path << " as chapter " << *chapter);
        chapters.push_back(*chapter);
    }
    return write_composed(*audio, chapters, output_path, true);
}

json describe_header(const TonieHeader &header) {
    json j;
    j["data_hash"] = hex_prefix(header.data_hash, header.data_hash.size(), "");
    j["data_length"] = header.data_length;
    j["timestamp"] = header.timestamp;
    j["chapter_pages"] = header.chapter_pages;
    j["padding_bytes"] = header.padding.size();
    j["unknown_field_bytes"] = header.unknown_fields.size();
    j["header_size"] = encode_header(header).size();
    return j;
}

}  // namespace toniekit
