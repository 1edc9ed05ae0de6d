//
//  flac_codec.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "metadata_record.hpp"

namespace metasplice {

/// Vendor string written when the file had no Vorbis comment block.
inline constexpr const char *kDefaultVendor = "MetaSplice";

/// "fLaC" at offset 0.
bool has_flac_signature(const std::vector<uint8_t> &buf);

/**
 * @brief Decode the first Vorbis comment block.
 *
 * Throws InvalidContainer without the "fLaC" signature. A file without a comment block (or
 * with an unreadable one) yields an empty record.
 */
MetadataRecord flac_get(const std::vector<uint8_t> &buf);

/**
 * @brief Merge `record` into the Vorbis comment and emit it as the last metadata block.
 *
 * Other blocks are copied in order with their last flag cleared; audio frames follow verbatim.
 * Throws InvalidContainer without the signature or when a block overruns the buffer.
 */
std::vector<uint8_t> flac_set(const std::vector<uint8_t> &buf, const MetadataRecord &record);

}  // namespace metasplice
