//
//  mp4_parser.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp4_parser.hpp"

#include <algorithm>
#include <iterator>

#include "byte_io.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "mp4_box_walker.hpp"

namespace metasplice {

namespace {

constexpr size_t kFullBoxHeaderBytes = 4;   // version + flags
constexpr size_t kKeysHeaderBytes = 8;      // version/flags + entry count
constexpr size_t kKeyEntryHeaderBytes = 8;  // size + namespace
constexpr size_t kDataHeaderBytes = 8;      // data type + locale
constexpr size_t kTextAtomPrefixBytes = 4;  // length + language in ©xxx atoms

std::string string_from(const std::vector<uint8_t> &buf, size_t begin, size_t end) {
    return std::string(buf.begin() + begin, buf.begin() + end);
}

// Text payload with trailing NULs removed.
std::string text_from(const std::vector<uint8_t> &buf, size_t begin, size_t end) {
    while (end > begin && buf[end - 1] == 0) {
        --end;
    }
    return string_from(buf, begin, end);
}

std::vector<std::string> parse_keys_box(const std::vector<uint8_t> &buf, const FramingUnit &keys) {
    std::vector<std::string> names;
    const size_t end = keys.payload_end();
    if (keys.payload_size < kKeysHeaderBytes) {
        throw MalformedEntry("keys box too short");
    }
    const uint32_t entry_count = read_u32_be(buf, keys.payload_offset() + kFullBoxHeaderBytes);
    size_t pos = keys.payload_offset() + kKeysHeaderBytes;
    for (uint32_t i = 0; i < entry_count; ++i) {
        if (end - pos < kKeyEntryHeaderBytes) {
            MS_LOG("warn", "keys box holds " << i << " of " << entry_count << " entries");
            break;
        }
        const uint32_t entry_size = read_u32_be(buf, pos);
        if (entry_size < kKeyEntryHeaderBytes || entry_size > end - pos) {
            MS_LOG("warn", "keys entry " << (i + 1) << " has invalid size " << entry_size);
            break;
        }
        names.push_back(string_from(buf, pos + kKeyEntryHeaderBytes, pos + entry_size));
        pos += entry_size;
    }
    return names;
}

// First UTF-8 `data` child of an ilst item, nullopt when the item holds no text.
std::optional<std::string> parse_ilst_item(const std::vector<uint8_t> &buf,
                                           const FramingUnit &item) {
    Mp4BoxWalker walker(buf, item.payload_offset(), item.end());
    while (auto child = walker.next()) {
        if (child->type != fourcc("data")) {
            continue;
        }
        if (child->payload_size < kDataHeaderBytes) {
            throw MalformedEntry("data box of item at offset " + std::to_string(item.offset) +
                                 " is truncated");
        }
        const uint32_t data_type = read_u32_be(buf, child->payload_offset());
        if (data_type != kDataTypeUtf8) {
            MS_LOG("mp4", "ignoring non-text data box (type " << data_type << ") at offset "
                                                              << child->offset);
            return std::nullopt;
        }
        return string_from(buf, child->payload_offset() + kDataHeaderBytes, child->payload_end());
    }
    if (walker.truncated()) {
        throw MalformedEntry("ilst item at offset " + std::to_string(item.offset) +
                             " is truncated");
    }
    return std::nullopt;
}

bool is_workflow_uuid(const std::vector<uint8_t> &buf, const FramingUnit &box) {
    if (box.payload_size < sizeof(kWorkflowUuid)) {
        return false;
    }
    return std::equal(std::begin(kWorkflowUuid), std::end(kWorkflowUuid),
                      buf.begin() + box.payload_offset());
}

void merge_into(MetadataRecord &dst, const MetadataRecord &src) {
    for (const auto &[key, value] : src) {
        dst.set(key, value);
    }
}

void parse_udta_box(const std::vector<uint8_t> &buf, const FramingUnit &udta,
                    Mp4MetadataView &view) {
    Mp4BoxWalker walker(buf, udta.payload_offset(), udta.end());
    while (auto child = walker.next()) {
        const uint32_t type = child->type;
        if (type == kLegacyWorkflowBox) {
            if (child->payload_size < kFullBoxHeaderBytes) {
                MS_LOG("warn", "wflo box at offset " << child->offset << " is truncated");
                continue;
            }
            view.legacy_workflow =
                text_from(buf, child->payload_offset() + kFullBoxHeaderBytes, child->end());
        } else if (type == fourcc("meta")) {
            if (view.udta_meta && view.udta_meta->has_keys_box) {
                MS_LOG("mp4", "ignoring additional udta meta at offset " << child->offset);
                continue;
            }
            // A keyed meta replaces an earlier item-list-only one (e.g. an iTunes mdir).
            auto items = parse_meta_box(buf, *child);
            if (view.udta_meta && !items.has_keys_box) {
                continue;
            }
            view.udta_meta = std::move(items);
            view.udta_meta_box = child;
        } else if (((type >> 24) & 0xFF) == 0xA9) {
            if (child->payload_size <= kTextAtomPrefixBytes) {
                continue;
            }
            const std::string key = fourcc_to_string(type).substr(1);
            view.udta_text_atoms.set(
                key, text_from(buf, child->payload_offset() + kTextAtomPrefixBytes, child->end()));
        }
    }
}

void parse_outer_meta(const std::vector<uint8_t> &buf, const FramingUnit &meta,
                      Mp4MetadataView &view) {
    merge_into(view.outer_meta, parse_meta_box(buf, meta).to_record());
}

}  // namespace

MetadataRecord Mp4MetaItems::to_record() const {
    MetadataRecord record;
    for (const auto &[index, value] : values) {
        if (index == 0 || index > keys.size()) {
            MS_LOG("warn", "ilst item refers to unknown key index " << index);
            continue;
        }
        record.set(keys[index - 1], value);
    }
    return record;
}

MetadataRecord Mp4MetadataView::to_record() const {
    MetadataRecord record;
    if (uuid_workflow) {
        record.set(kWorkflowKey, *uuid_workflow);
    }
    merge_into(record, outer_meta);
    merge_into(record, udta_text_atoms);
    if (legacy_workflow) {
        record.set(kWorkflowKey, *legacy_workflow);
    }
    if (udta_meta) {
        merge_into(record, udta_meta->to_record());
    }
    return record;
}

MetadataRecord Mp4MetadataView::udta_record() const {
    MetadataRecord record;
    if (udta_meta && udta_meta->has_keys_box) {
        record = udta_meta->to_record();
    }
    if (legacy_workflow && !record.contains(kWorkflowKey)) {
        record.set(kWorkflowKey, *legacy_workflow);
    }
    return record;
}

bool has_ftyp_box(const std::vector<uint8_t> &buf) {
    return buf.size() >= kAtomHeaderSize && fourcc_at(buf, 4, fourcc("ftyp"));
}

bool looks_like_box_header(const std::vector<uint8_t> &buf, size_t offset, size_t end) {
    if (end > buf.size() || offset > end || end - offset < kAtomHeaderSize) {
        return false;
    }
    const uint32_t size = read_u32_be(buf, offset);
    const uint32_t type = read_u32_be(buf, offset + 4);
    return size >= kAtomHeaderSize && size <= end - offset && is_printable_fourcc(type);
}

size_t meta_children_offset(const std::vector<uint8_t> &buf, const FramingUnit &meta) {
    const size_t start = meta.payload_offset();
    // ISO meta is a full box; QuickTime meta starts with its first child right away.
    if (!looks_like_box_header(buf, start + kFullBoxHeaderBytes, meta.end()) &&
        looks_like_box_header(buf, start, meta.end())) {
        MS_LOG("mp4", "meta at offset " << meta.offset << " has no version/flags");
        return start;
    }
    return std::min(start + kFullBoxHeaderBytes, meta.end());
}

Mp4MetaItems parse_meta_box(const std::vector<uint8_t> &buf, const FramingUnit &meta) {
    Mp4MetaItems items;

    // Pass 1: key dictionary and the ilst location.
    std::optional<FramingUnit> ilst;
    Mp4BoxWalker walker(buf, meta_children_offset(buf, meta), meta.end());
    while (auto child = walker.next()) {
        if (child->type == fourcc("keys")) {
            items.has_keys_box = true;
            try {
                items.keys = parse_keys_box(buf, *child);
            } catch (const MalformedEntry &e) {
                MS_LOG("warn", "unreadable keys box at offset " << child->offset << ": "
                                                                << e.what());
            }
        } else if (child->type == fourcc("ilst") && !ilst) {
            ilst = child;
        }
    }
    if (!ilst) {
        return items;
    }
    if (!items.has_keys_box) {
        MS_LOG("mp4", "meta at offset " << meta.offset << " has ilst but no keys, skipping");
        return items;
    }

    // Pass 2: items reference keys by their type (1-based), else by position.
    Mp4BoxWalker item_walker(buf, ilst->payload_offset(), ilst->end());
    uint32_t position = 0;
    while (auto item = item_walker.next()) {
        ++position;
        const uint32_t index =
            (item->type >= 1 && item->type <= items.keys.size()) ? item->type : position;
        try {
            if (auto value = parse_ilst_item(buf, *item)) {
                items.values.emplace_back(index, std::move(*value));
            }
        } catch (const MalformedEntry &e) {
            MS_LOG("warn", "skipping ilst item " << position << ": " << e.what());
        }
    }
    if (item_walker.truncated()) {
        MS_LOG("warn", "ilst at offset " << ilst->offset << " ends with a truncated item");
    }
    MS_LOG("mp4", "meta at offset " << meta.offset << ": " << items.keys.size() << " keys, "
                                    << items.values.size() << " text items");
    return items;
}

Mp4MetadataView parse_mp4_metadata(const std::vector<uint8_t> &buf) {
    Mp4MetadataView view;
    Mp4BoxWalker top(buf, 0, buf.size());
    while (auto box = top.next()) {
        if (box->type == fourcc("moov")) {
            if (view.moov) {
                MS_LOG("warn", "ignoring additional moov at offset " << box->offset);
                continue;
            }
            view.moov = box;
            Mp4BoxWalker moov_walker(buf, box->payload_offset(), box->end());
            while (auto child = moov_walker.next()) {
                if (child->type == fourcc("udta") && !view.udta) {
                    view.udta = child;
                    parse_udta_box(buf, *child, view);
                } else if (child->type == fourcc("meta")) {
                    parse_outer_meta(buf, *child, view);
                }
            }
        } else if (box->type == fourcc("meta")) {
            parse_outer_meta(buf, *box, view);
        } else if (box->type == fourcc("uuid") && is_workflow_uuid(buf, *box)) {
            view.uuid_workflow =
                text_from(buf, box->payload_offset() + sizeof(kWorkflowUuid), box->end());
        }
    }
    return view;
}

}  // namespace metasplice
