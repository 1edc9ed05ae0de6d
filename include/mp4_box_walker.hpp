//
//  mp4_box_walker.hpp
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

inline constexpr size_t kAtomHeaderSize = 8;
inline constexpr size_t kLargeAtomHeaderSize = 16;

// Walks sibling boxes inside [start, end): {size(4, BE), type(4)[, largesize(8)], payload}.
// size == 0 extends the box to `end`; size == 1 reads the 64-bit largesize.
class Mp4BoxWalker {
   public:
    Mp4BoxWalker(const std::vector<uint8_t> &buf, size_t start, size_t end);

    // Next box that fits inside the parent, or nullopt.
    std::optional<FramingUnit> next();

    size_t position() const { return pos_; }

    // True when the walk stopped on a box that overruns its parent.
    bool truncated() const { return truncated_; }

   private:
    const std::vector<uint8_t> &buf_;
    size_t pos_;
    size_t end_;
    bool truncated_ = false;
};

// First direct child of type `type` inside [start, end).
std::optional<FramingUnit> find_box(const std::vector<uint8_t> &buf, size_t start, size_t end,
                                    uint32_t type);
