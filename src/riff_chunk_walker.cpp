//
//  riff_chunk_walker.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "riff_chunk_walker.hpp"

#include "byte_io.hpp"
#include "fourcc_utils.hpp"
#include "logging.hpp"

RiffChunkWalker::RiffChunkWalker(const std::vector<uint8_t> &buf, size_t start)
    : buf_(buf), pos_(start) {}

std::optional<FramingUnit> RiffChunkWalker::next() {
    if (pos_ >= buf_.size()) {
        return std::nullopt;
    }
    if (buf_.size() - pos_ < kRiffChunkHeaderSize) {
        MS_LOG("riff", "trailing " << (buf_.size() - pos_) << " bytes at offset " << pos_
                                   << " too short for a chunk header");
        truncated_ = true;
        return std::nullopt;
    }

    FramingUnit unit;
    unit.offset = pos_;
    unit.type = read_u32_be(buf_, pos_);
    unit.header_size = kRiffChunkHeaderSize;
    unit.payload_size = read_u32_le(buf_, pos_ + 4);

    const size_t available = buf_.size() - pos_ - kRiffChunkHeaderSize;
    if (unit.payload_size > available) {
        MS_LOG("riff", "chunk " << fourcc_to_string(unit.type) << " at offset " << pos_
                                << " claims " << unit.payload_size << " bytes, only "
                                << available << " available");
        truncated_ = true;
        return std::nullopt;
    }

    // Odd payloads carry one pad byte; tolerate it missing at the very end of the file.
    const size_t padding = unit.payload_size % 2;
    unit.total_size = kRiffChunkHeaderSize + unit.payload_size +
                      (available > unit.payload_size ? padding : 0);

    pos_ += unit.total_size;
    return unit;
}
