// TIFF/IFD engine: decoding hand-built blocks, offset prediction, corruption fallback and the
// encoder's layout.
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"
#include "fixture_builders.hpp"
#include "tiff_ifd.hpp"

using namespace metasplice;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[tiff_ifd_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool test_decode_sequential_block() {
    bool ok = true;
    const auto block = test_utils::tiff_ascii_block(
        {{exif_tags::kMake, "workflow:{\"nodes\":[]}"}, {exif_tags::kModel, "prompt:a cat"}});
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.little_endian, "II block is little endian");
    ok &= check(tiff.ifd_offset == 8, "IFD at offset 8");
    ok &= check(tiff.entries.size() == 2, "two entries");
    ok &= check(tiff.mismatched_offsets == 0, "sequential layout predicts every offset");
    ok &= check(tiff.tail_padding == 0, "no tail padding");
    if (tiff.entries.size() == 2) {
        ok &= check(tiff.entries[0].tag == exif_tags::kMake, "first tag");
        ok &= check(tiff.entries[0].ascii == std::optional<std::string>("workflow:{\"nodes\":[]}"),
                    "first text");
        ok &= check(tiff.entries[1].ascii == std::optional<std::string>("prompt:a cat"),
                    "second text");
        ok &= check(tiff.entries[0].predicted_offset == 8 + 2 + 2 * 12 + 4, "first value offset");
        ok &= check(tiff.entries[1].predicted_offset % 2 == 0, "word aligned prediction");
    }
    return ok;
}

bool test_inline_and_padding() {
    bool ok = true;
    const auto block = test_utils::tiff_ascii_block({{0x0131, "ab"}, {0x010E, "k:v and more"}}, 6);
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.entries.size() == 2, "two entries");
    if (tiff.entries.size() == 2) {
        ok &= check(tiff.entries[0].is_inline, "3-byte value is inline");
        ok &= check(tiff.entries[0].ascii == std::optional<std::string>("ab"), "inline text");
        ok &= check(!tiff.entries[1].is_inline, "long value is out of line");
    }
    ok &= check(tiff.tail_padding == 6, "tail padding measured");

    const auto reencoded = encode_tiff_block(tiff.entries, tiff.tail_padding, tiff.little_endian);
    ok &= check(reencoded == block, "decode/encode reproduces a canonical block");
    return ok;
}

bool test_big_endian() {
    bool ok = true;
    // MM, magic 42, IFD at 8, one ASCII entry "key:value" (10 bytes) at offset 26.
    std::vector<uint8_t> block = {'M', 'M', 0, 42, 0, 0, 0, 8, 0, 1, 0x01, 0x0F, 0, 2,
                                  0,   0,   0, 10, 0, 0, 0, 26, 0, 0, 0,    0};
    const std::string text = "key:value";
    block.insert(block.end(), text.begin(), text.end());
    block.push_back(0);
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(!tiff.little_endian, "MM block is big endian");
    ok &= check(tiff.entries.size() == 1 &&
                    tiff.entries[0].ascii == std::optional<std::string>(text),
                "big-endian text");
    const auto out = encode_tiff_block(tiff.entries, 0, false);
    ok &= check(out == block, "big-endian re-encode");
    return ok;
}

bool test_corrupted_offset_falls_back() {
    bool ok = true;
    auto block = test_utils::tiff_ascii_block({{exif_tags::kMake, "prompt:hello"}});
    // Point the stored offset at the IFD itself, where the bytes contain NULs.
    block[8 + 2 + 8] = 8;
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.mismatched_offsets == 1, "mismatch counted");
    ok &= check(tiff.entries.size() == 1 &&
                    tiff.entries[0].ascii == std::optional<std::string>("prompt:hello"),
                "text recovered from the predicted offset");
    if (!tiff.entries.empty()) {
        ok &= check(tiff.entries[0].value == tiff.entries[0].predicted_value,
                    "recovered value is re-encoded");
    }
    return ok;
}

bool test_embedded_nul_without_fallback() {
    bool ok = true;
    auto block = test_utils::tiff_ascii_block({{exif_tags::kMake, "abcdefgh"}});
    block[26 + 3] = 0;  // "abc\0efgh\0"
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.entries.size() == 1 && !tiff.entries[0].ascii, "embedded NUL is undecodable");
    return ok;
}

bool test_short_text_stored_out_of_line() {
    bool ok = true;
    const auto block =
        test_utils::tiff_out_of_line_block({{exif_tags::kMake, "a:b"}, {exif_tags::kModel, "k:"}});
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.entries.size() == 2, "two entries");
    if (tiff.entries.size() == 2) {
        ok &= check(!tiff.entries[0].is_inline, "4-byte text read from its offset");
        ok &= check(tiff.entries[0].ascii == std::optional<std::string>("a:b"), "a:b");
        ok &= check(tiff.entries[1].ascii == std::optional<std::string>("k:"), "empty value");
        ok &= check(tiff.entries[1].predicted_offset == 8 + 2 + 2 * 12 + 4 + 4,
                    "prediction advances past the first value");
    }
    ok &= check(tiff.mismatched_offsets == 0, "packed short values match the prediction");

    // Re-encoding puts the short values inline, where they still decode.
    const TiffBlock again =
        decode_tiff_block(encode_tiff_block(tiff.entries, tiff.tail_padding, tiff.little_endian));
    ok &= check(again.entries.size() == 2 && again.entries[0].is_inline &&
                    again.entries[0].ascii == std::optional<std::string>("a:b") &&
                    again.entries[1].ascii == std::optional<std::string>("k:"),
                "re-encoded short values");

    // Inline text without a colon whose field does not point into the block stays inline.
    const auto inline_block = test_utils::tiff_ascii_block({{0x0131, "ab"}});
    const TiffBlock plain = decode_tiff_block(inline_block);
    ok &= check(plain.entries.size() == 1 && plain.entries[0].is_inline &&
                    plain.entries[0].ascii == std::optional<std::string>("ab"),
                "genuine inline text kept");
    return ok;
}

bool test_encode_drops_unbacked_values() {
    bool ok = true;
    IfdEntry lost;
    lost.tag = 0x0128;
    lost.type = 3;  // SHORT
    lost.count = 4;
    IfdEntry recovered = lost;
    recovered.tag = 0x0129;
    recovered.predicted_value = {1, 0, 2, 0, 3, 0, 4, 0};

    const auto block =
        encode_tiff_block({lost, recovered, make_ascii_entry(exif_tags::kMake, "k:v")});
    const TiffBlock back = decode_tiff_block(block);
    ok &= check(back.entries.size() == 2, "entry without backing bytes dropped");
    if (back.entries.size() == 2) {
        ok &= check(back.entries[0].tag == 0x0129 && !back.entries[0].is_inline &&
                        back.entries[0].value == recovered.predicted_value,
                    "predicted bytes written for a lost stored value");
        ok &= check(back.entries[0].stored_offset == back.entries[0].predicted_offset,
                    "recovered value has a real offset");
    }
    ok &= check(back.mismatched_offsets == 0, "encoder output is sequential");

    // A short SHORT value goes inline by declared size.
    IfdEntry small;
    small.tag = 0x0112;
    small.type = 3;
    small.count = 1;
    small.value = {6, 0};
    const TiffBlock one = decode_tiff_block(encode_tiff_block({small}));
    ok &= check(one.entries.size() == 1 && one.entries[0].is_inline &&
                    one.entries[0].value == small.value,
                "two-byte value inline");
    return ok;
}

bool test_malformed() {
    bool ok = true;
    auto expect_throw = [&](const std::vector<uint8_t> &block, const std::string &what) {
        bool threw = false;
        try {
            (void)decode_tiff_block(block);
        } catch (const MalformedEntry &) {
            threw = true;
        }
        ok &= check(threw, what);
    };
    expect_throw({'I', 'I', 42, 0}, "short block");
    expect_throw({'X', 'Y', 42, 0, 8, 0, 0, 0, 0, 0}, "bad byte-order mark");
    expect_throw({'I', 'I', 42, 0, 8, 0, 0, 0, 5, 0, 1, 2}, "entry table past the end");
    expect_throw({'I', 'I', 42, 0, 0xFF, 0, 0, 0}, "IFD offset past the end");
    return ok;
}

bool test_wrong_magic_is_tolerated() {
    bool ok = true;
    auto block = test_utils::tiff_ascii_block({{exif_tags::kMake, "k:v"}});
    block[2] = 43;
    const TiffBlock tiff = decode_tiff_block(block);
    ok &= check(tiff.entries.size() == 1, "magic mismatch only warns");
    return ok;
}

bool test_encode_layout() {
    bool ok = true;
    std::vector<IfdEntry> entries = {make_ascii_entry(exif_tags::kMake, "odd"),  // 4 bytes inline
                                     make_ascii_entry(exif_tags::kModel, "five!"),
                                     make_ascii_entry(exif_tags::kCopyright, "xy:z")};
    const auto block = encode_tiff_block(entries);
    ok &= check(block[0] == 'I' && block[1] == 'I' && block[2] == 42 && block[4] == 8,
                "little-endian header");
    const size_t data_start = 8 + 2 + 3 * 12 + 4;
    ok &= check(test_utils::get_le32(block, 8 + 2 + 12 + 8) == data_start, "first value offset");
    // "five!\0" is 6 bytes; the next value must start word aligned.
    ok &= check(test_utils::get_le32(block, 8 + 2 + 24 + 8) == data_start + 6,
                "second value follows");
    ok &= check(block.size() == data_start + 6 + 5, "no trailing bytes");

    const TiffBlock back = decode_tiff_block(block);
    ok &= check(back.entries.size() == 3 && back.mismatched_offsets == 0, "encoder output decodes");
    if (back.entries.size() == 3) {
        ok &= check(back.entries[0].is_inline, "four-byte value inline");
        ok &= check(back.entries[2].ascii == std::optional<std::string>("xy:z"),
                    "third entry text");
    }

    // Odd-length value forces a pad byte before the next out-of-line value.
    std::vector<IfdEntry> odd = {make_ascii_entry(0x0100, "1234"),  // 5 bytes
                                 make_ascii_entry(0x0101, "abcdef")};
    const auto odd_block = encode_tiff_block(odd);
    const uint32_t second = test_utils::get_le32(odd_block, 8 + 2 + 12 + 8);
    ok &= check(second % 2 == 0, "second offset word aligned");
    ok &= check(decode_tiff_block(odd_block).mismatched_offsets == 0, "aligned layout predicted");
    return ok;
}

bool test_make_ascii_entry() {
    bool ok = true;
    const IfdEntry e = make_ascii_entry(exif_tags::kImageDescription, "a:b");
    ok &= check(e.type == kTiffTypeAscii && e.count == 4, "count includes the NUL");
    ok &= check(e.value.back() == 0, "NUL terminated");
    ok &= check(tiff_type_size(3) == 2 && tiff_type_size(5) == 8 && tiff_type_size(99) == 1,
                "type sizes");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_decode_sequential_block();
    ok &= test_inline_and_padding();
    ok &= test_big_endian();
    ok &= test_corrupted_offset_falls_back();
    ok &= test_embedded_nul_without_fallback();
    ok &= test_short_text_stored_out_of_line();
    ok &= test_encode_drops_unbacked_values();
    ok &= test_malformed();
    ok &= test_wrong_magic_is_tolerated();
    ok &= test_encode_layout();
    ok &= test_make_ascii_entry();
    if (!ok) {
        return 1;
    }
    std::cout << "[tiff_ifd_unit] all checks passed\n";
    return 0;
}
