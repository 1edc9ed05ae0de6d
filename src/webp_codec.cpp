//
//  webp_codec.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "webp_codec.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>

#include "byte_io.hpp"
#include "errors.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "riff_chunk_walker.hpp"

namespace metasplice {

namespace {

constexpr uint32_t kExifChunk = fourcc('E', 'X', 'I', 'F');

bool has_exif_marker(const std::vector<uint8_t> &buf, size_t offset, size_t end) {
    if (end < offset || end - offset < sizeof(kExifMarker)) {
        return false;
    }
    return std::equal(std::begin(kExifMarker), std::end(kExifMarker), buf.begin() + offset);
}

// TIFF block inside an EXIF chunk, with the optional "Exif\0\0" marker stripped.
std::vector<uint8_t> exif_tiff_block(const std::vector<uint8_t> &buf, const FramingUnit &chunk,
                                     bool &has_marker) {
    const size_t begin = chunk.payload_offset();
    const size_t end = chunk.payload_end();
    has_marker = has_exif_marker(buf, begin, end);
    const size_t tiff_begin = begin + (has_marker ? sizeof(kExifMarker) : 0);
    return std::vector<uint8_t>(buf.begin() + tiff_begin, buf.begin() + end);
}

std::vector<uint8_t> build_exif_payload(const TiffBlock &tiff, bool with_marker) {
    std::vector<uint8_t> payload;
    if (with_marker) {
        payload.assign(std::begin(kExifMarker), std::end(kExifMarker));
    }
    const auto block = encode_tiff_block(tiff.entries, tiff.tail_padding, tiff.little_endian);
    payload.insert(payload.end(), block.begin(), block.end());
    return payload;
}

// EXIF chunk seen during `set`, decoded when possible.
struct ExifChunk {
    FramingUnit unit;
    bool has_marker = false;
    std::optional<TiffBlock> tiff;
    bool changed = false;
};

}  // namespace

bool has_webp_signature(const std::vector<uint8_t> &buf) {
    return buf.size() >= kRiffHeaderSize && fourcc_at(buf, 0, fourcc("RIFF")) &&
           fourcc_at(buf, 8, fourcc("WEBP"));
}

std::vector<uint8_t> make_riff_chunk(uint32_t type, const std::vector<uint8_t> &payload) {
    if (payload.size() > std::numeric_limits<uint32_t>::max() - 1) {
        throw std::length_error("RIFF chunk payload too large");
    }
    std::vector<uint8_t> out;
    out.reserve(kRiffChunkHeaderSize + payload.size() + 1);
    write_u32(out, type);
    write_u32_le(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    if (payload.size() % 2) {
        out.push_back(0);
    }
    return out;
}

bool rewrite_text_entries(TiffBlock &tiff, const MetadataRecord &incoming,
                          std::set<std::string> &consumed) {
    bool changed = false;
    for (auto &entry : tiff.entries) {
        if (!entry.ascii) {
            continue;
        }
        const auto kv = split_key_value(*entry.ascii, ':');
        if (!kv) {
            continue;
        }
        const std::string *value = incoming.find(kv->first);
        if (!value) {
            continue;
        }
        consumed.insert(kv->first);
        if (*value == kv->second) {
            continue;
        }
        const IfdEntry replacement = make_ascii_entry(entry.tag, kv->first + ":" + *value);
        entry.type = replacement.type;
        entry.count = replacement.count;
        entry.value = replacement.value;
        entry.ascii = replacement.ascii;
        changed = true;
    }
    return changed;
}

void append_text_entries(TiffBlock &tiff, const MetadataRecord &fields) {
    std::set<uint16_t> used;
    for (const auto &entry : tiff.entries) {
        used.insert(entry.tag);
    }
    uint16_t tag = exif_tags::kFirstNewEntryTag;
    for (const auto &[key, value] : fields) {
        while (used.count(tag)) {
            if (tag == 0) {
                throw std::length_error("no free IFD tag left for new entries");
            }
            --tag;
        }
        MS_LOG("webp", "adding IFD entry 0x" << std::hex << tag << std::dec << " for key '"
                                             << key << "'");
        tiff.entries.push_back(make_ascii_entry(tag, key + ":" + value));
        used.insert(tag);
    }
}

MetadataRecord webp_get(const std::vector<uint8_t> &buf) {
    MetadataRecord record;
    if (!has_webp_signature(buf)) {
        MS_LOG("warn", "not a valid WEBP file");
        return record;
    }

    RiffChunkWalker walker(buf);
    while (auto chunk = walker.next()) {
        if (chunk->type != kExifChunk) {
            continue;
        }
        bool has_marker = false;
        const auto block = exif_tiff_block(buf, *chunk, has_marker);
        TiffBlock tiff;
        try {
            tiff = decode_tiff_block(block);
        } catch (const MalformedEntry &e) {
            MS_LOG("warn", "skipping undecodable EXIF chunk at offset " << chunk->offset << ": "
                                                                       << e.what());
            continue;
        }
        for (const auto &entry : tiff.entries) {
            if (!entry.ascii) {
                continue;
            }
            auto kv = split_key_value(*entry.ascii, ':');
            if (!kv) {
                MS_LOG("warn", "no colon found in EXIF text entry 0x" << std::hex << entry.tag);
                continue;
            }
            record.set(kv->first, std::move(kv->second));
        }
    }
    return record;
}

std::vector<uint8_t> webp_set(const std::vector<uint8_t> &buf, const MetadataRecord &record) {
    if (!has_webp_signature(buf)) {
        throw InvalidContainer("not a valid WEBP file");
    }

    // Pass 1: locate EXIF chunks and rewrite the entries they already carry.
    std::vector<ExifChunk> exif_chunks;
    std::set<std::string> consumed;
    RiffChunkWalker walker(buf);
    while (auto chunk = walker.next()) {
        if (chunk->type != kExifChunk) {
            continue;
        }
        ExifChunk exif;
        exif.unit = *chunk;
        const auto block = exif_tiff_block(buf, *chunk, exif.has_marker);
        try {
            exif.tiff = decode_tiff_block(block);
            exif.changed = rewrite_text_entries(*exif.tiff, record, consumed);
        } catch (const MalformedEntry &e) {
            MS_LOG("warn", "EXIF chunk at offset " << chunk->offset
                                                   << " cannot be modified, copying verbatim: "
                                                   << e.what());
        }
        exif_chunks.push_back(std::move(exif));
    }
    const size_t chunks_end = walker.position();

    MetadataRecord remaining;
    for (const auto &[key, value] : record) {
        if (!consumed.count(key)) {
            remaining.set(key, value);
        }
    }

    // Pass 2: new keys go into the first decodable EXIF chunk.
    std::optional<std::vector<uint8_t>> synthesized;
    if (!remaining.empty()) {
        auto target = std::find_if(exif_chunks.begin(), exif_chunks.end(),
                                   [](const ExifChunk &c) { return c.tiff.has_value(); });
        if (target != exif_chunks.end()) {
            append_text_entries(*target->tiff, remaining);
            target->changed = true;
        } else {
            if (!exif_chunks.empty()) {
                MS_LOG("warn", "found EXIF chunk but failed to modify it, adding a new one");
            }
            TiffBlock fresh;
            append_text_entries(fresh, remaining);
            synthesized = make_riff_chunk(kExifChunk, build_exif_payload(fresh, true));
        }
    }

    std::vector<uint8_t> out(buf.begin(), buf.begin() + kRiffHeaderSize);
    out.reserve(buf.size() + 256);
    auto next_exif = exif_chunks.begin();
    RiffChunkWalker copier(buf);
    while (auto chunk = copier.next()) {
        if (next_exif != exif_chunks.end() && next_exif->unit.offset == chunk->offset) {
            const ExifChunk &exif = *next_exif++;
            if (exif.changed) {
                const auto rebuilt =
                    make_riff_chunk(kExifChunk, build_exif_payload(*exif.tiff, exif.has_marker));
                out.insert(out.end(), rebuilt.begin(), rebuilt.end());
                continue;
            }
        }
        out.insert(out.end(), buf.begin() + chunk->offset, buf.begin() + chunk->end());
        const size_t padded = kRiffChunkHeaderSize + chunk->payload_size + chunk->payload_size % 2;
        if (chunk->total_size < padded) {
            out.push_back(0);  // final odd chunk arrived without its pad byte
        }
    }
    if (synthesized) {
        out.insert(out.end(), synthesized->begin(), synthesized->end());
    }
    if (chunks_end < buf.size()) {
        MS_LOG("warn", "copying " << (buf.size() - chunks_end)
                                  << " trailing bytes after the last complete chunk");
        out.insert(out.end(), buf.begin() + chunks_end, buf.end());
    }

    if (out.size() - 8 > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("WEBP file exceeds RIFF size limit");
    }
    put_u32(out, 4, static_cast<uint32_t>(out.size() - 8), true);
    return out;
}

}  // namespace metasplice
