// Unit coverage for small helpers: endian readers/writers, fourcc utilities, hex preview and
// the ordered metadata record.
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "errors.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "metadata_record.hpp"

using metasplice::MetadataRecord;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[helper_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_readers() {
    bool ok = true;
    const std::vector<uint8_t> buf = {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0};
    ok &= check(read_u16_be(buf, 0) == 0x1234, "read_u16_be");
    ok &= check(read_u16_le(buf, 0) == 0x3412, "read_u16_le");
    ok &= check(read_u24_be(buf, 1) == 0x345678, "read_u24_be");
    ok &= check(read_u32_be(buf, 0) == 0x12345678u, "read_u32_be");
    ok &= check(read_u32_le(buf, 0) == 0x78563412u, "read_u32_le");
    ok &= check(read_u64_be(buf, 0) == 0x123456789ABCDEF0ull, "read_u64_be");
    ok &= check(read_u16(buf, 2, true) == 0x7856 && read_u16(buf, 2, false) == 0x5678,
                "read_u16 endian switch");
    ok &= check(read_u32(buf, 4, true) == 0xF0DEBC9Au, "read_u32 little endian");

    bool threw = false;
    try {
        (void)read_u32_be(buf, 6);
    } catch (const metasplice::MalformedEntry &) {
        threw = true;
    }
    ok &= check(threw, "read past the end throws MalformedEntry");
    ok &= check(has_bytes(buf, 8, 0), "zero bytes at the end are available");
    ok &= check(!has_bytes(buf, 9, 0), "offset past the end is not available");
    ok &= check(!has_bytes(buf, 4, SIZE_MAX), "huge length does not wrap");
    return ok;
}

bool test_writers() {
    bool ok = true;
    std::vector<uint8_t> out;
    write_u8(out, 0x01);
    write_u16(out, 0x0203);
    write_u24(out, 0x040506);
    write_u32(out, 0x0708090A);
    ok &= check(out == std::vector<uint8_t>({1, 2, 3, 4, 5, 6, 7, 8, 9, 10}), "big-endian writers");

    std::vector<uint8_t> le;
    write_u16_le(le, 0x0102);
    write_u32_le(le, 0x03040506);
    ok &= check(le == std::vector<uint8_t>({2, 1, 6, 5, 4, 3}), "little-endian writers");

    std::vector<uint8_t> wide;
    write_u64(wide, 0x0000000100000002ull);
    ok &= check(wide == std::vector<uint8_t>({0, 0, 0, 1, 0, 0, 0, 2}), "write_u64");

    std::vector<uint8_t> patch(8, 0);
    put_u32(patch, 0, 0xAABBCCDD, true);
    put_u16(patch, 4, 0x1122, false);
    ok &= check(patch[0] == 0xDD && patch[3] == 0xAA, "put_u32 little endian");
    ok &= check(patch[4] == 0x11 && patch[5] == 0x22, "put_u16 big endian");
    put_u64_be(patch, 0, 0x0102030405060708ull);
    ok &= check(read_u64_be(patch, 0) == 0x0102030405060708ull, "put_u64_be");
    return ok;
}

bool test_fourcc() {
    bool ok = true;
    ok &= check(fourcc("moov") == 0x6D6F6F76u, "fourcc literal");
    ok &= check(fourcc(std::string("udta")) == fourcc('u', 'd', 't', 'a'), "fourcc from string");
    ok &= check(fourcc_to_string(fourcc("EXIF")) == "EXIF", "fourcc_to_string");
    ok &= check(is_printable_fourcc(fourcc("ftyp")), "printable type");
    ok &= check(is_printable_fourcc(fourcc('\xA9', 'n', 'a', 'm')), "copyright-sign type");
    ok &= check(!is_printable_fourcc(0x00000001), "binary type is not printable");

    const std::vector<uint8_t> buf = {'R', 'I', 'F', 'F', 0, 0};
    ok &= check(fourcc_at(buf, 0, fourcc("RIFF")), "fourcc_at match");
    ok &= check(!fourcc_at(buf, 3, fourcc("RIFF")), "fourcc_at short buffer");

    bool threw = false;
    try {
        (void)fourcc(std::string("ab"));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    ok &= check(threw, "short fourcc string throws");
    return ok;
}

bool test_hex_prefix() {
    bool ok = true;
    std::vector<uint8_t> data = {0x00, 0x01, 0xAB, 0xFF, 0x10, 0x20, 0x30, 0x40, 0x50};
    ok &= check(metasplice::hex_prefix(data) == "00 01 ab ff 10 20 30 40", "default preview");
    ok &= check(metasplice::hex_prefix(data, 2) == "00 01", "short preview");
    ok &= check(metasplice::hex_prefix({}).empty(), "empty preview");
    return ok;
}

bool test_log_verbosity() {
    bool ok = true;
    const auto saved = metasplice::get_log_verbosity();
    metasplice::set_log_verbosity(metasplice::LogVerbosity::Warn);
    ok &= check(ms_should_log("error") && ms_should_log("warn"), "warn admits errors and warnings");
    ok &= check(!ms_should_log("info") && !ms_should_log("mp4"), "warn filters info and tags");
    metasplice::set_log_verbosity(metasplice::LogVerbosity::Debug);
    ok &= check(ms_should_log("tiff"), "debug admits component tags");
    metasplice::set_log_verbosity(saved);
    return ok;
}

bool test_record() {
    bool ok = true;
    MetadataRecord r;
    ok &= check(r.empty(), "new record is empty");
    r.set("b", "1");
    r.set("a", "2");
    r.set("b", "3");
    ok &= check(r.size() == 2, "overwrite keeps one entry per key");
    ok &= check(r.keys() == std::vector<std::string>({"b", "a"}), "insertion order kept");
    ok &= check(r.get("b") == std::optional<std::string>("3"), "last write wins");
    ok &= check(!r.get("missing").has_value() && r.find("missing") == nullptr, "absent key");
    ok &= check(r.contains("a"), "contains");
    ok &= check(r.erase("a") && !r.erase("a"), "erase once");

    MetadataRecord exact{{"Key", "v"}};
    ok &= check(!exact.contains("key"), "keys are case-sensitive");

    const MetadataRecord existing{{"prompt", "old"}, {"workflow", "{}"}};
    const MetadataRecord incoming{{"prompt", "new"}, {"seed", "7"}};
    const auto merged = metasplice::merge_records(existing, incoming);
    ok &= check(merged.keys() == std::vector<std::string>({"prompt", "workflow", "seed"}),
                "merge keeps existing order then appends");
    ok &= check(*merged.find("prompt") == "new", "merge: incoming wins");
    ok &= check(*merged.find("workflow") == "{}", "merge: existing preserved");
    ok &= check(metasplice::merge_records(existing, {}) == existing,
                "merge with empty is identity");

    MetadataRecord reordered{{"workflow", "{}"}, {"prompt", "old"}};
    ok &= check(!(reordered == existing), "comparison is order-sensitive");
    return ok;
}

bool test_split_key_value() {
    bool ok = true;
    auto kv = metasplice::split_key_value("workflow:{\"a\":1}", ':');
    ok &= check(kv && kv->first == "workflow" && kv->second == "{\"a\":1}",
                "split at the first separator only");
    auto empty_value = metasplice::split_key_value("key:", ':');
    ok &= check(empty_value && empty_value->second.empty(), "empty value");
    auto empty_key = metasplice::split_key_value("=v", '=');
    ok &= check(empty_key && empty_key->first.empty(), "empty key");
    ok &= check(!metasplice::split_key_value("no separator", ':'), "missing separator");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_readers();
    ok &= test_writers();
    ok &= test_fourcc();
    ok &= test_hex_prefix();
    ok &= test_log_verbosity();
    ok &= test_record();
    ok &= test_split_key_value();
    if (!ok) {
        return 1;
    }
    std::cout << "[helper_unit] all checks passed\n";
    return 0;
}
