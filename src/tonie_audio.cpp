//
//  tonie_audio.cpp
//  TonieKit
//
//  Created by the TonieKit authors on 10/18/26.
//  Copyright © 2026 The TonieKit Authors. All rights reserved.
//

#include "tonie_audio.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "header_codec.hpp"
#include "logging.hpp"
#include "opus_padding.hpp"
#include "sha1_digest.hpp"
#include "wire_format.hpp"

namespace {

// Reading bound, well below kMaxHeaderMessageSize; real headers are 4 KiB.
constexpr uint32_t kMaxHeaderMessage = 16 * 1024 * 1024;
// Pages written ahead of a chapter that does not start the stream.
constexpr uint32_t kLeadInPages[] = {0, 1, 2};

// Split the segments of a run of pages into packets. Each page starts a new
// packet; packets never continue across pages in Tonie streams.
std::vector<Packet> collect_packets(const std::vector<OggPage> &pages) {
    std::vector<Packet> packets;
    for (const auto &page : pages) {
        size_t prev_length = kOggMaxSegmentSize;
        bool first = true;
        for (const auto &segment : page.segments) {
            if (first || prev_length < kOggMaxSegmentSize) {
                packets.emplace_back();
                first = false;
            }
            packets.back().push_back(segment);
            prev_length = segment.size();
        }
    }
    return packets;
}

// Collects packets into pages of exactly one Tonie page, padding the last
// packet of every page to close the gap.
struct PagePacker {
    OggPage templ;  // serial/version source
    uint64_t granule = 0;
    uint32_t next_page_num = 0;
    std::vector<OggPage> out;

    std::vector<Segment> segments;
    size_t page_size = kOggHeaderSize;
    size_t last_packet_segments = 0;

    bool add(const Packet &packet) {
        const size_t added = packet_page_footprint(packet);
        if (kOggHeaderSize + added >= kToniePageSize || packet.size() > kOggMaxSegments) {
            TK_LOG("warn", "opus packet of " << added << " bytes does not fit a tonie page");
            return false;
        }
        if (page_size + added > kToniePageSize ||
            segments.size() + packet.size() > kOggMaxSegments) {
            if (!flush()) {
                return false;
            }
        }
        segments.insert(segments.end(), packet.begin(), packet.end());
        page_size += added;
        last_packet_segments = packet.size();
        return true;
    }

    bool flush() {
        if (segments.empty()) {
            return true;
        }
        const size_t split = segments.size() - last_packet_segments;
        Packet last_packet(segments.begin() + split, segments.end());
        segments.resize(split);

        auto padded = pad_packet(last_packet, kToniePageSize - page_size);
        if (!padded) {
            return false;
        }
        segments.insert(segments.end(), padded->begin(), padded->end());

        OggPage page = templ;
        page.header_type = 0;
        page.segments = std::move(segments);
        auto duration = page.duration();
        if (!duration) {
            TK_LOG("warn", "repacked page " << next_page_num << " has no valid opus duration");
            return false;
        }
        granule += *duration;
        page.granule_position = granule;
        page.page_no = next_page_num;
        if (page.segments.size() > kOggMaxSegments || page.size() != kToniePageSize) {
            TK_LOG("warn", "repacked page " << next_page_num << " is " << page.size()
                                            << " bytes in " << page.segments.size()
                                            << " segments");
            return false;
        }
        page.update_checksum();
        out.push_back(std::move(page));

        ++next_page_num;
        segments.clear();
        page_size = kOggHeaderSize;
        last_packet_segments = 0;
        return true;
    }
};

// Pad the last packet of a short page so the page fills one Tonie page, keeping
// the next chapter page aligned. Full pages are left alone.
bool fill_page(OggPage &page) {
    if (page.size() >= kToniePageSize) {
        return true;
    }
    auto packets = collect_packets({page});
    if (packets.empty()) {
        TK_LOG("warn", "page " << page.page_no << " has no packet to pad");
        return false;
    }
    const size_t gap = kToniePageSize - page.size();
    auto padded = pad_packet(packets.back(), gap);
    if (!padded) {
        return false;
    }
    page.segments.resize(page.segments.size() - packets.back().size());
    page.segments.insert(page.segments.end(), padded->begin(), padded->end());
    if (page.segments.size() > kOggMaxSegments || page.size() != kToniePageSize) {
        TK_LOG("warn", "page " << page.page_no << " cannot be filled to " << kToniePageSize
                               << " bytes");
        return false;
    }
    page.update_checksum();
    return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// Parsing.
// -----------------------------------------------------------------------------
std::optional<TonieAudio> parse_tonie(std::istream &in) {
    std::vector<uint8_t> buf(kLengthPrefixSize);
    in.read(reinterpret_cast<char *>(buf.data()), kLengthPrefixSize);
    buf.resize(static_cast<size_t>(in.gcount()));

    if (buf.size() == kLengthPrefixSize) {
        const uint32_t message_size = read_u32_be(buf.data());
        if (message_size > kMaxHeaderMessage) {
            TK_LOG("warn", "tonie header claims " << message_size
                                                  << " bytes; exceeds safety bound");
            return std::nullopt;
        }
        buf.resize(kLengthPrefixSize + message_size);
        in.read(reinterpret_cast<char *>(buf.data() + kLengthPrefixSize), message_size);
        buf.resize(kLengthPrefixSize + static_cast<size_t>(in.gcount()));
    }

    auto decoded = decode_header(buf);
    if (!decoded.ok()) {
        TK_LOG("warn", "tonie header rejected: " << header_error_name(decoded.error) << " ("
                                                 << decoded.message << ")");
        return std::nullopt;
    }

    auto ogg = parse_ogg_pages(in);
    if (!ogg.ok) {
        TK_LOG("warn", "tonie audio rejected: " << ogg.message);
        return std::nullopt;
    }

    TonieAudio audio;
    audio.header = std::move(decoded.header);
    audio.pages = std::move(ogg.pages);
    TK_LOG("debug", "tonie: " << audio.pages.size() << " pages, "
                              << audio.header.chapter_pages.size() << " chapters, hash "
                              << toniekit::hex_prefix(audio.header.data_hash));
    return audio;
}

std::optional<std::vector<uint32_t>> chapter_page_nums(const TonieAudio &audio, size_t chapter) {
    const auto &index = audio.header.chapter_pages;
    if (chapter >= index.size()) {
        TK_LOG("warn", "chapter " << chapter << " out of range (" << index.size() << " chapters)");
        return std::nullopt;
    }
    const uint64_t start = index[chapter];
    const uint64_t end = chapter + 1 < index.size() ? index[chapter + 1] : audio.pages.size();
    if (start > end || end > audio.pages.size()) {
        TK_LOG("warn", "chapter " << chapter << " spans pages " << start << ".." << end
                                  << " of " << audio.pages.size());
        return std::nullopt;
    }
    std::vector<uint32_t> nums;
    nums.reserve(static_cast<size_t>(end - start));
    for (uint64_t p = start; p < end; ++p) {
        nums.push_back(static_cast<uint32_t>(p));
    }
    return nums;
}

// -----------------------------------------------------------------------------
// Composition.
// -----------------------------------------------------------------------------
std::optional<std::vector<uint32_t>> compose(const TonieAudio &audio,
                                             const std::vector<size_t> &chapters,
                                             std::ostream &out, bool add_header) {
    std::vector<std::vector<uint32_t>> plan;
    plan.reserve(chapters.size());
    for (size_t i = 0; i < chapters.size(); ++i) {
        auto nums = chapter_page_nums(audio, chapters[i]);
        if (!nums) {
            return std::nullopt;
        }
        if (i == 0 && chapters[i] > 0) {
            nums->insert(nums->begin(), std::begin(kLeadInPages), std::end(kLeadInPages));
        } else if (i > 0 && chapters[i] == 0) {
            // The Opus header pages belong at the start of the stream only.
            nums->erase(nums->begin(), nums->begin() + std::min<size_t>(kOpusHeaderPages,
                                                                        nums->size()));
        }
        for (uint32_t p : *nums) {
            if (p >= audio.pages.size()) {
                TK_LOG("warn", "page " << p << " missing (" << audio.pages.size() << " pages)");
                return std::nullopt;
            }
        }
        plan.push_back(std::move(*nums));
    }

    // Only the very last written page carries the end-of-stream flag.
    size_t last_chapter = plan.size();
    for (size_t i = plan.size(); i-- > 0;) {
        if (!plan[i].empty()) {
            last_chapter = i;
            break;
        }
    }

    const std::streampos header_pos = out.tellp();
    if (add_header) {
        if (header_pos == std::streampos(-1)) {
            TK_LOG("error", "output stream is not seekable; cannot place tonie header");
            return std::nullopt;
        }
        const std::vector<char> placeholder(kToniePageSize, 0);
        out.write(placeholder.data(), static_cast<std::streamsize>(placeholder.size()));
    }

    Sha1Hasher sha1;
    uint64_t data_length = 0;
    uint64_t granule = 0;
    uint32_t next_page = 0;
    std::vector<uint32_t> chapter_starts;
    chapter_starts.reserve(plan.size());

    for (size_t c = 0; c < plan.size(); ++c) {
        chapter_starts.push_back(next_page);
        for (size_t k = 0; k < plan[c].size(); ++k) {
            const uint32_t page_num = plan[c][k];
            const OggPage &page = audio.pages[page_num];
            std::vector<uint8_t> data;
            if (page_num < kOpusHeaderPages) {
                data = page.serialize();
            } else {
                auto duration = page.duration();
                if (!duration) {
                    TK_LOG("warn", "page " << page_num << " has no valid opus duration");
                    return std::nullopt;
                }
                granule += *duration;
                const bool is_last = c == last_chapter && k + 1 == plan[c].size();
                data = page.serialize_with(is_last, granule, next_page);
            }
            out.write(reinterpret_cast<const char *>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            if (add_header && !sha1.update(data)) {
                TK_LOG("error", "SHA-1 update failed at page " << next_page);
                return std::nullopt;
            }
            data_length += data.size();
            ++next_page;
        }
    }
    if (!out) {
        TK_LOG("error", "writing ogg pages failed after " << data_length << " bytes");
        return std::nullopt;
    }

    if (add_header) {
        auto digest = sha1.finish();
        if (!digest) {
            TK_LOG("error", "SHA-1 digest of composed payload failed");
            return std::nullopt;
        }
        auto built = build_header(*digest, data_length, chapter_starts, audio.header.timestamp);
        if (!built.ok()) {
            TK_LOG("warn", "cannot build tonie header: " << built.status.message);
            return std::nullopt;
        }
        const auto encoded = encode_header(built.header);
        if (encoded.size() != kToniePageSize) {
            TK_LOG("warn", "tonie header needs " << encoded.size() << " bytes; only "
                                                 << kToniePageSize << " reserved");
            return std::nullopt;
        }
        const std::streampos end_pos = out.tellp();
        out.seekp(header_pos);
        out.write(reinterpret_cast<const char *>(encoded.data()),
                  static_cast<std::streamsize>(encoded.size()));
        out.seekp(end_pos);
        if (!out) {
            TK_LOG("error", "writing tonie header failed");
            return std::nullopt;
        }
        TK_LOG("debug", "composed " << next_page << " pages, " << data_length
                                    << " bytes, hash " << toniekit::hex_prefix(built.header.data_hash));
    }
    return chapter_starts;
}

std::optional<size_t> append_chapter(TonieAudio &audio, std::istream &opus) {
    if (audio.pages.size() <= kOpusHeaderPages) {
        TK_LOG("warn", "tonie has no audio page to continue from");
        return std::nullopt;
    }
    auto source = parse_ogg_pages(opus);
    if (!source.ok) {
        TK_LOG("warn", "opus input rejected: " << source.message);
        return std::nullopt;
    }
    if (source.pages.size() <= kOpusHeaderPages) {
        TK_LOG("warn", "opus input has no audio pages");
        return std::nullopt;
    }

    const size_t chapter_num = audio.header.chapter_pages.size();
    std::vector<OggPage> pages = audio.pages;
    if (!fill_page(pages.back())) {
        return std::nullopt;
    }
    const uint32_t chapter_start = static_cast<uint32_t>(pages.size());

    PagePacker packer;
    packer.templ = pages.back();
    packer.granule = pages.back().granule_position;
    packer.next_page_num = chapter_start;

    const std::vector<OggPage> audio_pages(source.pages.begin() + kOpusHeaderPages,
                                           source.pages.end());
    for (const auto &packet : collect_packets(audio_pages)) {
        if (packet.empty()) {
            continue;
        }
        if (!packer.add(packet)) {
            return std::nullopt;
        }
    }
    if (!packer.flush()) {
        return std::nullopt;
    }

    TK_LOG("debug", "chapter " << chapter_num << " appended: " << packer.out.size()
                               << " pages from page " << chapter_start);
    pages.insert(pages.end(), std::make_move_iterator(packer.out.begin()),
                 std::make_move_iterator(packer.out.end()));
    audio.pages = std::move(pages);
    audio.header.chapter_pages.push_back(chapter_start);
    return chapter_num;
}
