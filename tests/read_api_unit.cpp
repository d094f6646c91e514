// Unit test for the public file API: read, export, skip, swap and the JSON header view.
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "tonie_test_utils.hpp"
#include "toniekit.hpp"

using namespace tonie_test_utils;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[read_api_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

std::string compose_tonie(const TonieAudio &audio, const std::vector<size_t> &chapters) {
    std::stringstream out(std::ios::in | std::ios::out | std::ios::binary);
    if (!compose(audio, chapters, out)) {
        return {};
    }
    return out.str();
}

std::filesystem::path write_fixture() {
    return write_temp_file(compose_tonie(make_tonie_audio({3, 2, 2}), {0, 1, 2}),
                           "toniekit_read_api_input");
}

bool test_read_tonie() {
    const auto path = write_fixture();
    const auto file_size = std::filesystem::file_size(path);

    auto res = toniekit::read_tonie(path.string());
    bool ok = check(res.status.ok, "read_tonie succeeds");
    ok &= check(res.status.message.empty(), "no message on success");
    ok &= check(res.verification.ok(), "hash and length verified");
    ok &= check(res.header_size == kToniePageSize, "header size");
    ok &= check(res.payload_size == file_size - kToniePageSize, "payload size");
    ok &= check(res.header.chapter_pages == std::vector<uint32_t>({0, 5, 7}), "chapter pages");
    ok &= check(res.header.data_length == res.payload_size, "dataLength matches payload");

    // Corrupt one payload byte: the header still decodes, the hash no longer matches.
    std::string data = read_all(path);
    data[data.size() - 10] ^= 0x5A;
    const auto corrupted = write_temp_file(data, "toniekit_read_api_corrupted");
    auto bad = toniekit::read_tonie(corrupted.string());
    ok &= check(bad.status.ok, "corrupted payload still reads");
    ok &= check(bad.verification.hash_mismatch && !bad.verification.length_mismatch,
                "corruption reported as hash mismatch");

    auto missing = toniekit::read_tonie("/nonexistent/toniekit/500304E0");
    ok &= check(!missing.status.ok && !missing.status.message.empty(), "missing file fails");

    const auto garbage = write_temp_file(std::string("\x00\x00\x00\x05\x08", 5),
                                         "toniekit_read_api_garbage");
    auto broken = toniekit::read_tonie(garbage.string());
    ok &= check(!broken.status.ok, "undecodable header fails");

    std::filesystem::remove(path);
    std::filesystem::remove(corrupted);
    std::filesystem::remove(garbage);
    return ok;
}

bool test_skip_and_export() {
    const auto input = write_fixture();
    const auto skipped = std::filesystem::temp_directory_path() / "toniekit_read_api_skipped";
    const auto exported = std::filesystem::temp_directory_path() / "toniekit_read_api_export.ogg";

    auto st = toniekit::skip_chapters(input.string(), {2, 0}, skipped.string());
    bool ok = check(st.ok, "skip_chapters succeeds");
    auto res = toniekit::read_tonie(skipped.string());
    ok &= check(res.status.ok && res.verification.ok(), "skipped tonie verifies");
    ok &= check(res.header.chapter_pages == std::vector<uint32_t>({0, 5}),
                "kept chapters renumbered");

    ok &= check(!toniekit::skip_chapters(input.string(), {}, skipped.string()).ok,
                "empty chapter selection fails");
    ok &= check(!toniekit::skip_chapters(input.string(), {9}, skipped.string()).ok,
                "unknown chapter fails");

    st = toniekit::export_chapter(input.string(), 1, exported.string());
    ok &= check(st.ok, "export_chapter succeeds");
    const std::string ogg = read_all(exported);
    ok &= check(ogg.compare(0, 4, "OggS") == 0, "exported file is plain ogg");
    std::istringstream in(ogg);
    auto pages = parse_ogg_pages(in);
    ok &= check(pages.ok && pages.pages.size() == 5, "exported chapter with lead-in pages");

    ok &= check(!toniekit::export_chapter(input.string(), 3, exported.string()).ok,
                "export of unknown chapter fails");
    ok &= check(!toniekit::export_chapter(input.string(), 0, "/nonexistent/dir/out.ogg").ok,
                "unwritable output fails");

    std::filesystem::remove(input);
    std::filesystem::remove(skipped);
    std::filesystem::remove(exported);
    return ok;
}

bool test_swap_chapters() {
    const auto input = write_fixture();
    const auto first = write_temp_file(serialize_pages(make_opus_pages(2, 4)),
                                       "toniekit_read_api_first.ogg");
    const auto second = write_temp_file(serialize_pages(make_opus_pages(3, 10)),
                                        "toniekit_read_api_second.ogg");
    const auto output = std::filesystem::temp_directory_path() / "toniekit_read_api_swapped";

    auto st = toniekit::swap_chapters(input.string(), {first.string(), second.string()},
                                      output.string());
    bool ok = check(st.ok, "swap_chapters succeeds");
    auto res = toniekit::read_tonie(output.string());
    ok &= check(res.status.ok && res.verification.ok(), "swapped tonie verifies");
    ok &= check(res.header.chapter_pages == std::vector<uint32_t>({0, 4}),
                "one chapter per opus file");
    ok &= check(res.header.timestamp == 1700000000, "timestamp of the source kept");

    ok &= check(!toniekit::swap_chapters(input.string(), {}, output.string()).ok,
                "no opus files fails");
    ok &= check(!toniekit::swap_chapters(input.string(), {"/nonexistent/a.ogg"},
                                         output.string())
                     .ok,
                "missing opus file fails");

    std::filesystem::remove(input);
    std::filesystem::remove(first);
    std::filesystem::remove(second);
    std::filesystem::remove(output);
    return ok;
}

bool test_describe_header() {
    TonieHeader h;
    h.data_hash = {0xDE, 0xAD, 0xBE, 0xEF};
    h.data_length = 4242;
    h.timestamp = 99;
    h.chapter_pages = {0, 12};
    fit_padding(h);

    const auto j = toniekit::describe_header(h);
    bool ok = check(j["data_hash"] == "deadbeef", "hash rendered as hex");
    ok &= check(j["data_length"] == 4242, "data_length");
    ok &= check(j["timestamp"] == 99, "timestamp");
    ok &= check(j["chapter_pages"] == nlohmann::json::array({0, 12}), "chapter_pages");
    ok &= check(j["header_size"] == kToniePageSize, "header_size");
    ok &= check(j["padding_bytes"] == h.padding.size(), "padding_bytes");
    ok &= check(j["unknown_field_bytes"] == 0, "unknown_field_bytes");
    return ok;
}

bool test_version() {
    const auto v = toniekit::version_string();
    return check(!v.empty() && v[0] == 'v', "version string starts with v");
}

}  // namespace

int main() {
    toniekit::set_log_verbosity(toniekit::LogVerbosity::Error);
    bool ok = true;
    ok &= test_read_tonie();
    ok &= test_skip_and_export();
    ok &= test_swap_chapters();
    ok &= test_describe_header();
    ok &= test_version();
    return ok ? 0 : 1;
}
