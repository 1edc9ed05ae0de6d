//
//  flac_codec.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "flac_codec.hpp"

#include <optional>

#include "byte_io.hpp"
#include "errors.hpp"
#include "flac_block_walker.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "vorbis_comment.hpp"

namespace metasplice {

namespace {

std::vector<uint8_t> block_payload(const std::vector<uint8_t> &buf, const FramingUnit &block) {
    return std::vector<uint8_t>(buf.begin() + block.payload_offset(),
                                buf.begin() + block.payload_end());
}

std::optional<VorbisComment> try_decode(const std::vector<uint8_t> &buf,
                                        const FramingUnit &block) {
    try {
        return decode_vorbis_comment(block_payload(buf, block));
    } catch (const MalformedEntry &e) {
        MS_LOG("warn", "unreadable Vorbis comment block at offset " << block.offset << ": "
                                                                    << e.what());
        return std::nullopt;
    }
}

}  // namespace

bool has_flac_signature(const std::vector<uint8_t> &buf) {
    return fourcc_at(buf, 0, fourcc("fLaC"));
}

MetadataRecord flac_get(const std::vector<uint8_t> &buf) {
    if (!has_flac_signature(buf)) {
        throw InvalidContainer("not a valid FLAC file");
    }
    FlacBlockWalker walker(buf);
    while (auto block = walker.next()) {
        if (block->type != kFlacVorbisCommentBlock) {
            continue;
        }
        if (auto comment = try_decode(buf, *block)) {
            return vorbis_comment_to_record(*comment);
        }
        return {};
    }
    if (walker.truncated()) {
        MS_LOG("warn", "FLAC metadata chain is truncated at offset " << walker.position());
    }
    return {};
}

std::vector<uint8_t> flac_set(const std::vector<uint8_t> &buf, const MetadataRecord &record) {
    if (!has_flac_signature(buf)) {
        throw InvalidContainer("not a valid FLAC file");
    }

    std::vector<uint8_t> out(buf.begin(), buf.begin() + kFlacSignatureSize);
    out.reserve(buf.size() + 256);

    std::optional<VorbisComment> existing;
    bool seen_comment = false;
    FlacBlockWalker walker(buf);
    while (auto block = walker.next()) {
        if (block->type == kFlacVorbisCommentBlock) {
            if (seen_comment) {
                MS_LOG("warn", "dropping additional Vorbis comment block at offset "
                                   << block->offset);
                continue;
            }
            seen_comment = true;
            existing = try_decode(buf, *block);
            continue;
        }
        const size_t header_at = out.size();
        out.insert(out.end(), buf.begin() + block->offset, buf.begin() + block->end());
        out[header_at] &= kFlacBlockTypeMask;  // the comment block becomes the last one
    }
    if (walker.truncated()) {
        throw InvalidContainer("FLAC metadata block at offset " +
                               std::to_string(walker.position()) + " overruns the file");
    }
    if (!walker.reached_last()) {
        MS_LOG("warn", "FLAC metadata chain ends without a last-block flag");
    }

    const std::string vendor = existing ? existing->vendor : std::string(kDefaultVendor);
    const MetadataRecord merged =
        merge_records(existing ? vorbis_comment_to_record(*existing) : MetadataRecord{}, record);
    const auto payload = encode_vorbis_comment(vorbis_comment_from_record(vendor, merged));

    write_u8(out, kFlacLastBlockFlag | kFlacVorbisCommentBlock);
    write_u24(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());

    // Audio frames.
    out.insert(out.end(), buf.begin() + walker.position(), buf.end());

    MS_LOG("flac", "wrote Vorbis comment with " << merged.size() << " entries, "
                                                << payload.size() << " bytes");
    return out;
}

}  // namespace metasplice
