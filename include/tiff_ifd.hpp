//
//  tiff_ifd.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metasplice {

// Tag IDs used for key:value text entries.
namespace exif_tags {
inline constexpr uint16_t kImageDescription = 0x010E;
inline constexpr uint16_t kMake = 0x010F;
inline constexpr uint16_t kModel = 0x0110;
inline constexpr uint16_t kCopyright = 0x8298;
// First tag handed out to new entries; later ones count down from here.
inline constexpr uint16_t kFirstNewEntryTag = kMake;
}  // namespace exif_tags

inline constexpr uint16_t kTiffTypeAscii = 2;
inline constexpr size_t kTiffHeaderSize = 8;
inline constexpr size_t kIfdEntrySize = 12;

/// One 12-byte IFD entry plus its resolved value bytes.
struct IfdEntry {
    uint16_t tag = 0;
    uint16_t type = 0;
    uint32_t count = 0;
    uint32_t stored_offset = 0;     ///< Raw offset field (meaningless for inline values)
    uint32_t predicted_offset = 0;  ///< Where a sequential layout would put the value
    bool is_inline = false;
    std::vector<uint8_t> value;            ///< Bytes at stored_offset (or inline)
    std::vector<uint8_t> predicted_value;  ///< Bytes at predicted_offset
    std::optional<std::string> ascii;      ///< Decoded text for ASCII entries
};

struct TiffBlock {
    bool little_endian = true;
    uint32_t ifd_offset = kTiffHeaderSize;
    std::vector<IfdEntry> entries;
    size_t tail_padding = 0;
    size_t mismatched_offsets = 0;
};

/// Byte size of one element of a TIFF field type; unknown types count as 1.
size_t tiff_type_size(uint16_t type);

/**
 * @brief Decode the first IFD of a TIFF block.
 *
 * Throws MalformedEntry when the header is unusable or the entry table does not fit.
 * Offset disagreements are logged and counted, never fatal.
 */
TiffBlock decode_tiff_block(const std::vector<uint8_t> &block);

/**
 * @brief Encode a single-IFD TIFF block with the IFD at offset 8.
 *
 * Values go out-of-line in entry order (word aligned) unless they fit in 4 bytes.
 * `tail_padding` zero bytes are appended.
 */
std::vector<uint8_t> encode_tiff_block(const std::vector<IfdEntry> &entries,
                                       size_t tail_padding = 0, bool little_endian = true);

/// ASCII entry holding `text` plus its NUL terminator.
IfdEntry make_ascii_entry(uint16_t tag, const std::string &text);

}  // namespace metasplice
