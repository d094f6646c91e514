// Unit coverage for small helpers: wire primitives, hex preview and log gating.
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "wire_format.hpp"

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_big_endian() {
    std::vector<uint8_t> out;
    write_u32_be(out, 0x01020304u);
    bool ok = check(out == std::vector<uint8_t>({0x01, 0x02, 0x03, 0x04}), "write_u32_be");
    ok &= check(read_u32_be(out.data()) == 0x01020304u, "read_u32_be");
    return ok;
}

bool test_varints() {
    bool ok = check(varint_size(0) == 1 && varint_size(127) == 1, "one byte varints");
    ok &= check(varint_size(128) == 2 && varint_size(16383) == 2, "two byte varints");
    ok &= check(varint_size(UINT64_MAX) == kMaxVarintBytes, "largest varint");

    std::vector<uint8_t> out;
    write_varint(out, 300);
    ok &= check(out == std::vector<uint8_t>({0xAC, 0x02}), "varint 300");

    WireReader reader(out.data(), out.size());
    uint64_t value = 0;
    ok &= check(reader.read_varint(value) && value == 300, "read back varint 300");
    ok &= check(reader.at_end(), "reader consumed everything");

    std::vector<uint8_t> packed;
    write_packed_varints(packed, 4, {0, 10, 200});
    ok &= check(packed == std::vector<uint8_t>({0x22, 0x04, 0x00, 0x0A, 0xC8, 0x01}),
                "packed repeated field");
    return ok;
}

bool test_hex_prefix() {
    using toniekit::hex_prefix;
    bool ok = check(hex_prefix({}) == "", "hex_prefix empty");
    std::vector<uint8_t> data = {0x00, 0x11, 0xAB, 0xCD, 0xFF};
    ok &= check(hex_prefix(data, 4) == "00 11 ab cd", "hex_prefix truncates to max_len");
    ok &= check(hex_prefix(data) == "00 11 ab cd ff", "hex_prefix default prints all up to limit");
    ok &= check(hex_prefix(data, data.size(), "") == "0011abcdff", "hex_prefix without separator");
    return ok;
}

bool test_log_gating() {
    const auto saved = toniekit::get_log_verbosity();
    std::ostringstream captured;
    auto *old_buf = std::cerr.rdbuf(captured.rdbuf());

    toniekit::set_log_verbosity(toniekit::LogVerbosity::Warn);
    TK_LOG("error", "first " << 1);
    TK_LOG("warn", "second");
    TK_LOG("info", "hidden info");
    TK_LOG("ogg", "hidden debug");
    const std::string at_warn = captured.str();

    captured.str("");
    toniekit::set_log_verbosity(toniekit::LogVerbosity::Debug);
    TK_LOG("ogg", "shown debug");
    const std::string at_debug = captured.str();

    std::cerr.rdbuf(old_buf);
    toniekit::set_log_verbosity(saved);

    bool ok = check(at_warn.find("first 1") != std::string::npos, "error logged at warn level");
    ok &= check(at_warn.find("[TonieKit][warn] second") != std::string::npos,
                "warn logged with prefix");
    ok &= check(at_warn.find("hidden") == std::string::npos, "info and debug suppressed");
    ok &= check(at_debug.find("shown debug") != std::string::npos, "debug logged at debug level");
    ok &= check(tk_severity_for_tag("warning") == toniekit::LogVerbosity::Warn,
                "warning alias maps to warn");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_big_endian();
    ok &= test_varints();
    ok &= test_hex_prefix();
    ok &= test_log_gating();
    return ok ? 0 : 1;
}
