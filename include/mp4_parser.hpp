//
//  mp4_parser.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fourcc_utils.hpp"
#include "framing_unit.hpp"
#include "metadata_record.hpp"

namespace metasplice {

// Legacy workflow box inside udta: version/flags then raw text.
inline constexpr uint32_t kLegacyWorkflowBox = fourcc('w', 'f', 'l', 'o');

// 16-byte identifier of the top-level workflow uuid box ("comfyuiworkflow\0").
inline constexpr uint8_t kWorkflowUuid[16] = {0x63, 0x6f, 0x6d, 0x66, 0x79, 0x75, 0x69, 0x77,
                                              0x6f, 0x72, 0x6b, 0x66, 0x6c, 0x6f, 0x77, 0x00};

// `data` box value type for UTF-8 text.
inline constexpr uint32_t kDataTypeUtf8 = 1;

/// Key/value content of one `meta` box (keys + ilst).
struct Mp4MetaItems {
    bool has_keys_box = false;
    std::vector<std::string> keys;                          // keys[0] is key index 1
    std::vector<std::pair<uint32_t, std::string>> values;  // (key index, UTF-8 value)

    MetadataRecord to_record() const;
};

/// Everything the metadata reader/writer needs to know about an MP4 file.
struct Mp4MetadataView {
    std::optional<FramingUnit> moov;
    std::optional<FramingUnit> udta;  // first udta inside moov

    std::optional<std::string> uuid_workflow;
    MetadataRecord outer_meta;       // meta boxes at file root or directly in moov
    MetadataRecord udta_text_atoms;  // ©xxx atoms, key without the ©
    std::optional<std::string> legacy_workflow;
    std::optional<Mp4MetaItems> udta_meta;
    std::optional<FramingUnit> udta_meta_box;  // the meta box udta_meta was read from

    /// Merged view in precedence order (later sources win).
    MetadataRecord to_record() const;

    /// Record `set` starts from: udta meta entries, plus the legacy workflow when absent.
    MetadataRecord udta_record() const;
};

/// True when the first box of the file is `ftyp`.
bool has_ftyp_box(const std::vector<uint8_t> &buf);

/// True when [offset, end) starts with something that parses as a plausible box header.
bool looks_like_box_header(const std::vector<uint8_t> &buf, size_t offset, size_t end);

/// Offset of the first child box of `meta`, skipping version/flags when present.
size_t meta_children_offset(const std::vector<uint8_t> &buf, const FramingUnit &meta);

/**
 * @brief Two-pass `meta` parse: collect `keys` and locate `ilst`, then resolve the items.
 *
 * Truncated keys or items are logged and skipped; never throws MalformedEntry.
 */
Mp4MetaItems parse_meta_box(const std::vector<uint8_t> &buf, const FramingUnit &meta);

/// Collect the metadata-bearing boxes of a file.
Mp4MetadataView parse_mp4_metadata(const std::vector<uint8_t> &buf);

}  // namespace metasplice
