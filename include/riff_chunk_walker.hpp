//
//  riff_chunk_walker.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "framing_unit.hpp"

inline constexpr size_t kRiffHeaderSize = 12;  // "RIFF" + size + form type
inline constexpr size_t kRiffChunkHeaderSize = 8;

// Walks the chunks of a RIFF form: {type(4), length(4, LE), payload, pad to even}.
class RiffChunkWalker {
   public:
    explicit RiffChunkWalker(const std::vector<uint8_t> &buf, size_t start = kRiffHeaderSize);

    // Next complete chunk, or nullopt at the end of the buffer or on a truncated chunk.
    std::optional<FramingUnit> next();

    // Offset just past the last chunk returned.
    size_t position() const { return pos_; }

    // True when the walk stopped on a chunk that does not fit the buffer.
    bool truncated() const { return truncated_; }

   private:
    const std::vector<uint8_t> &buf_;
    size_t pos_;
    bool truncated_ = false;
};
