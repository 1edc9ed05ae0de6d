// FLAC codec: Vorbis comment decoding/encoding, block chain rewriting and audio preservation.
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "fixture_builders.hpp"
#include "flac_block_walker.hpp"
#include "flac_codec.hpp"
#include "vorbis_comment.hpp"

using namespace metasplice;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[flac_codec_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool ends_with_audio(const std::vector<uint8_t> &buf) {
    const auto audio = test_utils::flac_audio();
    return buf.size() >= audio.size() &&
           std::equal(audio.begin(), audio.end(), buf.end() - audio.size());
}

bool test_get() {
    bool ok = true;
    const std::vector<std::string> comments = {"TITLE=x", "workflow={\"a\":1}", "note=a=b",
                                               "NOSEPARATOR"};
    const auto flac = test_utils::flac_file(&comments);
    const MetadataRecord record = flac_get(flac);
    ok &= check(record.size() == 3, "comment without '=' skipped");
    ok &= check(record.get("TITLE") == std::optional<std::string>("x"), "TITLE");
    ok &= check(record.get("workflow") == std::optional<std::string>("{\"a\":1}"), "workflow");
    ok &= check(record.get("note") == std::optional<std::string>("a=b"),
                "split at the first '=' only");

    ok &= check(flac_get(test_utils::flac_file(nullptr)).empty(), "no comment block");

    bool threw = false;
    try {
        (void)flac_get({'O', 'g', 'g', 'S', 0, 0, 0, 0});
    } catch (const InvalidContainer &) {
        threw = true;
    }
    ok &= check(threw, "missing signature throws");
    return ok;
}

bool test_set_on_file_without_comment() {
    bool ok = true;
    const auto flac = test_utils::flac_file(nullptr);
    const MetadataRecord fields{{"workflow", "{}"}, {"prompt", "rain"}};
    const auto out = flac_set(flac, fields);
    ok &= check(flac_get(out) == fields, "round trip");
    ok &= check(out[4] == kFlacStreamInfoBlock, "STREAMINFO stays first, not last");
    ok &= check(out[4 + 38] == kFlacPaddingBlock, "padding kept with its last flag cleared");
    ok &= check(out[4 + 38 + 20] == (kFlacLastBlockFlag | kFlacVorbisCommentBlock),
                "comment block is the last block");
    ok &= check(ends_with_audio(out), "audio frames copied verbatim");
    ok &= check(test_utils::find_bytes(out, kDefaultVendor) != std::string::npos,
                "default vendor for a new comment");

    FlacBlockWalker walker(out);
    size_t last_flags = 0;
    while (auto block = walker.next()) {
        last_flags += block->last ? 1 : 0;
        if (block->type == kFlacVorbisCommentBlock) {
            ok &= check(block->payload_size % 2 == 0, "comment payload is even-sized");
        }
    }
    ok &= check(last_flags == 1 && walker.reached_last(), "exactly one last block");
    ok &= check(walker.position() == out.size() - test_utils::flac_audio().size(),
                "audio starts right after the chain");
    return ok;
}

bool test_set_merges_existing_comment() {
    bool ok = true;
    const std::vector<std::string> comments = {"TITLE=x", "ARTIST=y"};
    const auto flac = test_utils::flac_file(&comments);
    const auto out = flac_set(flac, {{"TITLE", "z"}, {"NEW", "1"}});
    const MetadataRecord record = flac_get(out);
    ok &= check(record.keys() == std::vector<std::string>({"TITLE", "ARTIST", "NEW"}),
                "existing order, new keys appended");
    ok &= check(record.get("TITLE") == std::optional<std::string>("z"), "value replaced");
    ok &= check(test_utils::find_bytes(out, "reference libFLAC 1.4.3") != std::string::npos,
                "vendor string preserved");
    ok &= check(ends_with_audio(out), "audio preserved");
    return ok;
}

bool test_set_is_idempotent() {
    bool ok = true;
    const auto once = flac_set(test_utils::flac_file(nullptr), {{"k", "v"}});
    ok &= check(flac_set(once, {}) == once, "rewriting with no fields is byte-identical");
    ok &= check(flac_set(once, {{"k", "v"}}) == once,
                "rewriting the same value is byte-identical");
    return ok;
}

bool test_set_drops_additional_comment_blocks() {
    bool ok = true;
    std::vector<uint8_t> flac = {'f', 'L', 'a', 'C'};
    const auto first = test_utils::vorbis_payload("v", {"a=1"});
    const auto second = test_utils::vorbis_payload("v", {"a=2"});
    const auto parts = {test_utils::flac_block(0, false, std::vector<uint8_t>(34, 0)),
                        test_utils::flac_block(4, false, first),
                        test_utils::flac_block(4, true, second)};
    for (const auto &p : parts) {
        flac.insert(flac.end(), p.begin(), p.end());
    }
    const auto audio = test_utils::flac_audio();
    flac.insert(flac.end(), audio.begin(), audio.end());

    const auto out = flac_set(flac, {{"b", "3"}});
    const MetadataRecord record = flac_get(out);
    ok &= check(record.get("a") == std::optional<std::string>("1"), "first comment block wins");
    ok &= check(record.get("b") == std::optional<std::string>("3"), "new key");
    size_t comment_blocks = 0;
    FlacBlockWalker walker(out);
    while (auto block = walker.next()) {
        comment_blocks += block->type == kFlacVorbisCommentBlock ? 1 : 0;
    }
    ok &= check(comment_blocks == 1, "a single comment block remains");
    return ok;
}

bool test_set_rejects_truncated_chain() {
    bool ok = true;
    auto flac = test_utils::flac_file(nullptr);
    flac.resize(4 + 4 + 20);
    bool threw = false;
    try {
        (void)flac_set(flac, {{"a", "b"}});
    } catch (const InvalidContainer &) {
        threw = true;
    }
    ok &= check(threw, "block overrunning the file throws");

    bool garbage = false;
    try {
        (void)flac_set({'g', 'a', 'r', 'b', 'a', 'g', 'e'}, {{"a", "b"}});
    } catch (const InvalidContainer &) {
        garbage = true;
    }
    ok &= check(garbage, "garbage input throws");
    return ok;
}

bool test_vorbis_comment_codec() {
    bool ok = true;
    VorbisComment vc{"vendor", {"A=1", "B=2"}};
    const auto payload = encode_vorbis_comment(vc);
    ok &= check(payload.size() % 2 == 0, "encoded payload is even-sized");
    ok &= check(test_utils::get_le32(payload, 0) == 6, "vendor length little endian");
    const VorbisComment back = decode_vorbis_comment(payload);
    ok &= check(back.vendor == "vendor" && back.comments == vc.comments, "decode");

    auto cut = test_utils::vorbis_payload("vendor", {"A=1", "B=2"});
    cut.resize(cut.size() - 2);
    const VorbisComment partial = decode_vorbis_comment(cut);
    ok &= check(partial.comments.size() == 1, "truncated list keeps complete comments");

    bool threw = false;
    try {
        (void)decode_vorbis_comment({10, 0, 0, 0, 'v', 'e'});
    } catch (const MalformedEntry &) {
        threw = true;
    }
    ok &= check(threw, "truncated vendor throws");

    const VorbisComment from = vorbis_comment_from_record("x", {{"k", "v=w"}});
    ok &= check(from.comments == std::vector<std::string>({"k=v=w"}), "record to comments");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_get();
    ok &= test_set_on_file_without_comment();
    ok &= test_set_merges_existing_comment();
    ok &= test_set_is_idempotent();
    ok &= test_set_drops_additional_comment_blocks();
    ok &= test_set_rejects_truncated_chain();
    ok &= test_vorbis_comment_codec();
    if (!ok) {
        return 1;
    }
    std::cout << "[flac_codec_unit] all checks passed\n";
    return 0;
}
