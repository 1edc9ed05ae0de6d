//
//  mp4_codec.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp4_codec.hpp"

#include <limits>
#include <stdexcept>

#include "byte_io.hpp"
#include "errors.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"
#include "mp4_atoms.hpp"
#include "mp4_box_walker.hpp"
#include "mp4_parser.hpp"
#include "udta_builder.hpp"

namespace metasplice {

namespace {

constexpr size_t kChunkTableHeaderBytes = 8;  // version/flags + entry count

// Collect every stco/co64 box below moov/trak/mdia/minf/stbl.
void collect_chunk_tables(const std::vector<uint8_t> &moov, const FramingUnit &parent,
                          int depth, std::vector<FramingUnit> &tables) {
    static const uint32_t kPath[] = {fourcc("trak"), fourcc("mdia"), fourcc("minf"),
                                     fourcc("stbl")};
    Mp4BoxWalker walker(moov, parent.payload_offset(), parent.end());
    while (auto child = walker.next()) {
        if (depth < 4) {
            if (child->type == kPath[depth]) {
                collect_chunk_tables(moov, *child, depth + 1, tables);
            }
        } else if (child->type == fourcc("stco") || child->type == fourcc("co64")) {
            tables.push_back(*child);
        }
    }
}

void patch_chunk_table(std::vector<uint8_t> &moov, const FramingUnit &table, uint64_t threshold,
                       int64_t delta) {
    const bool wide = table.type == fourcc("co64");
    const size_t entry_size = wide ? 8 : 4;
    if (table.payload_size < kChunkTableHeaderBytes) {
        MS_LOG("warn", fourcc_to_string(table.type) << " at offset " << table.offset
                                                    << " is truncated");
        return;
    }
    uint32_t count = read_u32_be(moov, table.payload_offset() + 4);
    const size_t capacity = (table.payload_size - kChunkTableHeaderBytes) / entry_size;
    if (count > capacity) {
        MS_LOG("warn", fourcc_to_string(table.type) << " claims " << count << " entries, room for "
                                                    << capacity);
        count = static_cast<uint32_t>(capacity);
    }

    size_t pos = table.payload_offset() + kChunkTableHeaderBytes;
    size_t shifted = 0;
    for (uint32_t i = 0; i < count; ++i, pos += entry_size) {
        const uint64_t value = wide ? read_u64_be(moov, pos) : read_u32_be(moov, pos);
        if (value < threshold) {
            continue;
        }
        const int64_t moved = static_cast<int64_t>(value) + delta;
        if (moved < 0 || (!wide && moved > std::numeric_limits<uint32_t>::max())) {
            throw std::length_error("chunk offset out of range after moov resize");
        }
        if (wide) {
            put_u64_be(moov, pos, static_cast<uint64_t>(moved));
        } else {
            put_u32(moov, pos, static_cast<uint32_t>(moved), false);
        }
        ++shifted;
    }
    MS_LOG("mp4", "shifted " << shifted << " of " << count << " " << fourcc_to_string(table.type)
                             << " entries by " << delta);
}

void shift_chunk_offsets(std::vector<uint8_t> &moov, uint64_t threshold, int64_t delta) {
    if (delta == 0) {
        return;
    }
    Mp4BoxWalker top(moov, 0, moov.size());
    auto root = top.next();
    if (!root) {
        return;
    }
    std::vector<FramingUnit> tables;
    collect_chunk_tables(moov, *root, 0, tables);
    for (const auto &table : tables) {
        patch_chunk_table(moov, table, threshold, delta);
    }
}

// udta children that carry no metadata MetaSplice owns, kept verbatim.
std::vector<AtomPtr> foreign_udta_children(const std::vector<uint8_t> &buf,
                                           const Mp4MetadataView &view) {
    std::vector<AtomPtr> kept;
    if (!view.udta) {
        return kept;
    }
    const bool owns_meta = view.udta_meta && view.udta_meta->has_keys_box;
    Mp4BoxWalker walker(buf, view.udta->payload_offset(), view.udta->end());
    while (auto child = walker.next()) {
        if (child->type == kLegacyWorkflowBox) {
            continue;
        }
        if (owns_meta && view.udta_meta_box && child->offset == view.udta_meta_box->offset) {
            continue;
        }
        kept.push_back(Atom::create_raw(
            std::vector<uint8_t>(buf.begin() + child->offset, buf.begin() + child->end())));
    }
    if (walker.position() < view.udta->end()) {
        MS_LOG("warn", "dropping " << (view.udta->end() - walker.position())
                                   << " unparsable bytes at the end of udta");
    }
    return kept;
}

}  // namespace

MetadataRecord mp4_get(const std::vector<uint8_t> &buf) {
    if (!has_ftyp_box(buf)) {
        MS_LOG("warn", "not a valid MP4 file (no ftyp)");
        return {};
    }
    try {
        return parse_mp4_metadata(buf).to_record();
    } catch (const MetaSpliceError &e) {
        MS_LOG("error", "error extracting MP4 metadata: " << e.what());
        return {};
    }
}

std::vector<uint8_t> mp4_set(const std::vector<uint8_t> &buf, const MetadataRecord &record) {
    if (!has_ftyp_box(buf)) {
        throw InvalidContainer("not a valid MP4 file (no ftyp)");
    }
    const Mp4MetadataView view = parse_mp4_metadata(buf);
    if (!view.moov) {
        throw BoxNotFound("moov");
    }
    const FramingUnit &moov = *view.moov;

    const MetadataRecord merged = merge_records(view.udta_record(), record);
    auto udta = build_udta(merged, foreign_udta_children(buf, view));
    const std::vector<uint8_t> udta_bytes = udta->serialize();

    // moov children with the udta replaced in place (or appended).
    std::vector<uint8_t> body;
    body.reserve(moov.payload_size + udta_bytes.size());
    const auto payload_begin = buf.begin() + moov.payload_offset();
    const auto payload_end = buf.begin() + moov.end();
    if (view.udta) {
        body.insert(body.end(), payload_begin, buf.begin() + view.udta->offset);
        body.insert(body.end(), udta_bytes.begin(), udta_bytes.end());
        body.insert(body.end(), buf.begin() + view.udta->end(), payload_end);
    } else {
        body.insert(body.end(), payload_begin, payload_end);
        body.insert(body.end(), udta_bytes.begin(), udta_bytes.end());
    }

    if (body.size() + kAtomHeaderSize > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("moov exceeds 32-bit box size");
    }
    std::vector<uint8_t> new_moov;
    new_moov.reserve(kAtomHeaderSize + body.size());
    write_u32(new_moov, static_cast<uint32_t>(kAtomHeaderSize + body.size()));
    write_u32(new_moov, fourcc("moov"));
    new_moov.insert(new_moov.end(), body.begin(), body.end());

    const int64_t delta =
        static_cast<int64_t>(new_moov.size()) - static_cast<int64_t>(moov.total_size);
    shift_chunk_offsets(new_moov, moov.end(), delta);

    MS_LOG("mp4", "moov " << moov.total_size << " -> " << new_moov.size() << " bytes, "
                          << merged.size() << " metadata entries");

    std::vector<uint8_t> out;
    out.reserve(buf.size() + static_cast<size_t>(delta > 0 ? delta : 0));
    out.insert(out.end(), buf.begin(), buf.begin() + moov.offset);
    out.insert(out.end(), new_moov.begin(), new_moov.end());
    out.insert(out.end(), buf.begin() + moov.end(), buf.end());
    return out;
}

}  // namespace metasplice

#ifdef METASPLICE_TESTING
namespace metasplice::testing {
void shift_chunk_offsets_for_test(std::vector<uint8_t> &moov, uint64_t threshold,
                                  int64_t delta) {
    shift_chunk_offsets(moov, threshold, delta);
}
}  // namespace metasplice::testing
#endif
