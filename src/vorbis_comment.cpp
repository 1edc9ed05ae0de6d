//
//  vorbis_comment.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "vorbis_comment.hpp"

#include <limits>
#include <stdexcept>

#include "byte_io.hpp"
#include "errors.hpp"
#include "flac_block_walker.hpp"
#include "logging.hpp"

namespace metasplice {

namespace {

void write_length_prefixed(std::vector<uint8_t> &out, const std::string &text) {
    if (text.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("Vorbis comment string too long");
    }
    write_u32_le(out, static_cast<uint32_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

VorbisComment decode_vorbis_comment(const std::vector<uint8_t> &payload) {
    VorbisComment comment;
    const uint32_t vendor_length = read_u32_le(payload, 0);
    require_bytes(payload, 4, vendor_length, "Vorbis vendor string");
    comment.vendor.assign(payload.begin() + 4, payload.begin() + 4 + vendor_length);

    size_t pos = 4 + size_t(vendor_length);
    const uint32_t count = read_u32_le(payload, pos);
    pos += 4;
    for (uint32_t i = 0; i < count; ++i) {
        if (!has_bytes(payload, pos, 4)) {
            MS_LOG("warn", "Vorbis comment list truncated after " << i << " of " << count);
            break;
        }
        const uint32_t length = read_u32_le(payload, pos);
        if (!has_bytes(payload, pos + 4, length)) {
            MS_LOG("warn", "Vorbis comment " << i << " claims " << length
                                             << " bytes past the block end");
            break;
        }
        comment.comments.emplace_back(payload.begin() + pos + 4,
                                      payload.begin() + pos + 4 + length);
        pos += 4 + size_t(length);
    }
    return comment;
}

std::vector<uint8_t> encode_vorbis_comment(const VorbisComment &comment) {
    std::vector<uint8_t> out;
    write_length_prefixed(out, comment.vendor);
    write_u32_le(out, static_cast<uint32_t>(comment.comments.size()));
    for (const auto &text : comment.comments) {
        write_length_prefixed(out, text);
    }
    // Keep blocks even-sized; readers stop after the declared comments.
    if (out.size() % 2) {
        out.push_back(0);
    }
    if (out.size() > kFlacMaxBlockLength) {
        throw std::length_error("Vorbis comment block exceeds 16 MiB");
    }
    return out;
}

MetadataRecord vorbis_comment_to_record(const VorbisComment &comment) {
    MetadataRecord record;
    for (const auto &text : comment.comments) {
        auto kv = split_key_value(text, '=');
        if (!kv) {
            MS_LOG("warn", "skipping Vorbis comment without '=' (" << text.size() << " bytes)");
            continue;
        }
        record.set(kv->first, std::move(kv->second));
    }
    return record;
}

VorbisComment vorbis_comment_from_record(const std::string &vendor, const MetadataRecord &record) {
    VorbisComment comment;
    comment.vendor = vendor;
    comment.comments.reserve(record.size());
    for (const auto &[key, value] : record) {
        comment.comments.push_back(key + "=" + value);
    }
    return comment;
}

}  // namespace metasplice
