//
//  vorbis_comment.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "metadata_record.hpp"

namespace metasplice {

/// Payload of a FLAC VORBIS_COMMENT block.
struct VorbisComment {
    std::string vendor;
    std::vector<std::string> comments;  // raw "key=value" strings in file order
};

/**
 * @brief Decode {vendorLength, vendor, count, [length, comment]...} (lengths LE).
 *
 * Throws MalformedEntry when the vendor or the comment count is cut off. A truncated comment
 * list keeps what was decoded. Bytes after the declared comments are ignored.
 */
VorbisComment decode_vorbis_comment(const std::vector<uint8_t> &payload);

/// Encode; odd-length results get one trailing zero byte. Throws std::length_error above 16 MiB.
std::vector<uint8_t> encode_vorbis_comment(const VorbisComment &comment);

/// Split comments on the first '='; comments without one are skipped with a warning.
MetadataRecord vorbis_comment_to_record(const VorbisComment &comment);

VorbisComment vorbis_comment_from_record(const std::string &vendor, const MetadataRecord &record);

}  // namespace metasplice
