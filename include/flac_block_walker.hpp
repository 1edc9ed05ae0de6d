//
//  flac_block_walker.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "framing_unit.hpp"

inline constexpr size_t kFlacSignatureSize = 4;  // "fLaC"
inline constexpr size_t kFlacBlockHeaderSize = 4;
inline constexpr uint8_t kFlacLastBlockFlag = 0x80;
inline constexpr uint8_t kFlacBlockTypeMask = 0x7F;
inline constexpr uint32_t kFlacStreamInfoBlock = 0;
inline constexpr uint32_t kFlacPaddingBlock = 1;
inline constexpr uint32_t kFlacVorbisCommentBlock = 4;
inline constexpr uint32_t kFlacMaxBlockLength = 0xFFFFFF;

// Walks the metadata block chain: {last(1 bit), type(7 bits), length(24, BE), payload}.
// Stops after the block carrying the last-block flag.
class FlacBlockWalker {
   public:
    explicit FlacBlockWalker(const std::vector<uint8_t> &buf,
                             size_t start = kFlacSignatureSize);

    std::optional<FramingUnit> next();

    // Offset just past the last block returned; after the final block this is where the
    // audio frames start.
    size_t position() const { return pos_; }

    bool reached_last() const { return done_; }
    bool truncated() const { return truncated_; }

   private:
    const std::vector<uint8_t> &buf_;
    size_t pos_;
    bool done_ = false;
    bool truncated_ = false;
};
