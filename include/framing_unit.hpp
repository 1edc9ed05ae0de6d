//
//  framing_unit.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief One tagged region of a container: RIFF chunk, MP4 box or FLAC metadata block.
 *
 * Offsets are absolute within the buffer the walker was created on.
 */
struct FramingUnit {
    uint32_t type = 0;         ///< FourCC (RIFF/MP4) or block type (FLAC)
    size_t offset = 0;         ///< Start of the header
    size_t header_size = 0;    ///< 8 (RIFF/MP4), 16 (MP4 largesize) or 4 (FLAC)
    size_t payload_size = 0;   ///< Declared payload length
    size_t total_size = 0;     ///< Header + payload + padding actually present
    bool last = false;         ///< FLAC is-last-block flag

    size_t payload_offset() const { return offset + header_size; }
    size_t payload_end() const { return offset + header_size + payload_size; }
    size_t end() const { return offset + total_size; }
};
