// Opus packet padding: code 3 repacking and exact page footprint growth.
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "opus_padding.hpp"
#include "tonie_test_utils.hpp"

using namespace tonie_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[opus_padding_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

std::vector<uint8_t> flatten(const Packet &packet) {
    std::vector<uint8_t> out;
    for (const auto &s : packet) {
        out.insert(out.end(), s.begin(), s.end());
    }
    return out;
}

bool grows_by(const Packet &packet, size_t pad, const std::string &what) {
    auto padded = pad_packet(packet, pad);
    bool ok = check(padded.has_value(), what + ": padding accepted");
    ok &= check(padded && packet_page_footprint(*padded) == packet_page_footprint(packet) + pad,
                what + ": footprint grows by exactly " + std::to_string(pad));
    return ok;
}

bool test_footprint() {
    bool ok = check(packet_page_footprint(to_segments(make_opus_packet(200))) == 201,
                    "single segment packet");
    ok &= check(packet_page_footprint(to_segments(make_opus_packet(255))) == 257,
                "255-byte packet needs a terminating lacing value");
    ok &= check(packet_page_footprint(to_segments(make_opus_packet(300))) == 302,
                "two segment packet");
    return ok;
}

bool test_no_padding() {
    const Packet packet = to_segments(make_opus_packet(200));
    auto same = pad_packet(packet, 0);
    return check(same && *same == packet, "zero padding leaves the packet untouched");
}

bool test_code0() {
    const Packet packet = to_segments(make_opus_packet(200));

    auto one = pad_packet(packet, 1);
    auto bytes = one ? flatten(*one) : std::vector<uint8_t>{};
    bool ok = check(one && bytes.size() == 201, "one byte is the count byte alone");
    ok &= check(bytes.size() > 1 && bytes[0] == (kToc20ms | 0x03) && bytes[1] == 0x01,
                "code 0 becomes code 3 with one frame, no padding flag");

    auto padded = pad_packet(packet, 49);
    bytes = padded ? flatten(*padded) : std::vector<uint8_t>{};
    ok &= check(bytes.size() == 249, "padded packet size");
    ok &= check(bytes.size() > 2 && bytes[1] == 0x41 && bytes[2] == 47,
                "padding flag set and length byte written");
    ok &= check(bytes.size() > 3 && bytes[3] == 0x55, "frame data follows the padding length");
    ok &= check(bytes.size() == 249 && bytes[248] == 0 && bytes[202] == 0,
                "padding bytes appended as zeros");
    ok &= grows_by(packet, 49, "code 0 by 49");
    return ok;
}

bool test_code1_code2() {
    const Packet code1 = to_segments(make_opus_packet(200, kToc20ms | 0x01));
    auto a = pad_packet(code1, 10);
    auto bytes = a ? flatten(*a) : std::vector<uint8_t>{};
    bool ok = check(bytes.size() > 2 && bytes[1] == 0x42 && bytes[2] == 8,
                    "code 1 becomes two CBR frames with padding");
    ok &= grows_by(code1, 10, "code 1 by 10");

    std::vector<uint8_t> raw = make_opus_packet(200, kToc20ms | 0x02);
    raw[1] = 90;  // first frame length
    const Packet code2 = to_segments(raw);
    auto b = pad_packet(code2, 10);
    bytes = b ? flatten(*b) : std::vector<uint8_t>{};
    ok &= check(bytes.size() > 3 && bytes[1] == 0xC2 && bytes[2] == 8,
                "code 2 becomes two VBR frames with padding");
    ok &= check(bytes.size() > 3 && bytes[3] == 90, "first frame length kept after padding");
    ok &= grows_by(code2, 10, "code 2 by 10");
    return ok;
}

bool test_code3() {
    std::vector<uint8_t> raw = make_opus_packet(200, kToc20ms | 0x03);
    raw[1] = 0x02;
    const Packet unpadded = to_segments(raw);
    auto a = pad_packet(unpadded, 20);
    auto bytes = a ? flatten(*a) : std::vector<uint8_t>{};
    bool ok = check(bytes.size() > 2 && bytes[1] == 0x42 && bytes[2] == 19,
                    "code 3 keeps its count byte and gains padding");
    ok &= grows_by(unpadded, 20, "code 3 by 20");

    raw[1] = 0x42;
    ok &= check(!pad_packet(to_segments(raw), 20).has_value(), "already padded packet refused");

    const Packet bare = {Segment{kToc20ms | 0x03}};
    ok &= check(!pad_packet(bare, 5).has_value(), "code 3 without count byte refused");

    const Packet empty = {Segment{}};
    ok &= check(!pad_packet(empty, 5).has_value(), "empty packet refused");
    return ok;
}

bool test_long_padding() {
    const Packet packet = to_segments(make_opus_packet(200));
    auto padded = pad_packet(packet, 1255);
    auto bytes = padded ? flatten(*padded) : std::vector<uint8_t>{};
    bool ok = check(bytes.size() > 6, "long padding produced");
    ok &= check(bytes.size() > 6 && bytes[2] == 255 && bytes[3] == 255 && bytes[4] == 255 &&
                    bytes[5] == 255 && bytes[6] == 228,
                "continuation length bytes (255 means 254 + more)");
    ok &= grows_by(packet, 1255, "code 0 by 1255");

    // The tail segment crosses lacing boundaries.
    const Packet wide = to_segments(make_opus_packet(300));
    ok &= grows_by(wide, 100, "two segment packet by 100");
    ok &= grows_by(wide, 300, "two segment packet by 300");
    ok &= grows_by(to_segments(make_opus_packet(250)), 60, "packet crossing 255 bytes");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_footprint();
    ok &= test_no_padding();
    ok &= test_code0();
    ok &= test_code1_code2();
    ok &= test_code3();
    ok &= test_long_padding();
    return ok ? 0 : 1;
}
