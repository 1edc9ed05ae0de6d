//
//  mp4_box_walker.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "mp4_box_walker.hpp"

#include <algorithm>

#include "byte_io.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

Mp4BoxWalker::Mp4BoxWalker(const std::vector<uint8_t> &buf, size_t start, size_t end)
    : buf_(buf), pos_(start), end_(std::min(end, buf.size())) {}

std::optional<FramingUnit> Mp4BoxWalker::next() {
    if (pos_ >= end_) {
        return std::nullopt;
    }
    if (end_ - pos_ < kAtomHeaderSize) {
        MS_LOG("mp4", "trailing " << (end_ - pos_) << " bytes at offset " << pos_
                                  << " too short for a box header");
        truncated_ = true;
        return std::nullopt;
    }

    FramingUnit unit;
    unit.offset = pos_;
    unit.header_size = kAtomHeaderSize;
    const uint32_t size32 = read_u32_be(buf_, pos_);
    unit.type = read_u32_be(buf_, pos_ + 4);

    uint64_t size = size32;
    if (size32 == 1) {
        if (end_ - pos_ < kLargeAtomHeaderSize) {
            truncated_ = true;
            return std::nullopt;
        }
        // 64-bit extended size. Anything beyond the parent (including >= 4 GiB files on a
        // buffer we could never hold) stops the walk below.
        size = read_u64_be(buf_, pos_ + 8);
        unit.header_size = kLargeAtomHeaderSize;
    } else if (size32 == 0) {
        // Box extends to the end of its parent.
        size = end_ - pos_;
    }

    if (size < unit.header_size || size > end_ - pos_) {
        MS_LOG("mp4", "box " << fourcc_to_string(unit.type) << " at offset " << pos_
                             << " claims " << size << " bytes, parent has " << (end_ - pos_));
        truncated_ = true;
        return std::nullopt;
    }

    unit.total_size = static_cast<size_t>(size);
    unit.payload_size = unit.total_size - unit.header_size;
    pos_ += unit.total_size;
    return unit;
}

std::optional<FramingUnit> find_box(const std::vector<uint8_t> &buf, size_t start, size_t end,
                                    uint32_t type) {
    Mp4BoxWalker walker(buf, start, end);
    while (auto box = walker.next()) {
        if (box->type == type) {
            return box;
        }
    }
    return std::nullopt;
}
