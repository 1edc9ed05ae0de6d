//
//  webp_codec.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "metadata_record.hpp"
#include "tiff_ifd.hpp"

namespace metasplice {

// Optional marker some writers put in front of the TIFF block inside an EXIF chunk.
inline constexpr uint8_t kExifMarker[6] = {'E', 'x', 'i', 'f', 0, 0};

/// "RIFF" at 0 and "WEBP" at 8.
bool has_webp_signature(const std::vector<uint8_t> &buf);

/**
 * @brief Read the key:value text entries of every EXIF chunk.
 *
 * Never throws; a buffer that is not a WEBP file yields an empty record.
 */
MetadataRecord webp_get(const std::vector<uint8_t> &buf);

/**
 * @brief Write `record` into the EXIF chunk(s), synthesizing one when none exists.
 *
 * All other chunks are copied verbatim. Throws InvalidContainer without RIFF/WEBP magic.
 */
std::vector<uint8_t> webp_set(const std::vector<uint8_t> &buf, const MetadataRecord &record);

/// Serialize a RIFF chunk (header, payload and pad byte for odd lengths).
std::vector<uint8_t> make_riff_chunk(uint32_t type, const std::vector<uint8_t> &payload);

/**
 * @brief Replace the values of existing "key:value" entries whose key is in `incoming`.
 *
 * Every matching key is added to `consumed`. Returns true when any entry changed.
 */
bool rewrite_text_entries(TiffBlock &tiff, const MetadataRecord &incoming,
                          std::set<std::string> &consumed);

/// Append `fields` as new ASCII entries, handing out free tags downwards from Make.
void append_text_entries(TiffBlock &tiff, const MetadataRecord &fields);

}  // namespace metasplice
