//
//  flac_block_walker.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/15/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "flac_block_walker.hpp"

#include "byte_io.hpp"
#include "logging.hpp"

FlacBlockWalker::FlacBlockWalker(const std::vector<uint8_t> &buf, size_t start)
    : buf_(buf), pos_(start) {}

std::optional<FramingUnit> FlacBlockWalker::next() {
    if (done_ || pos_ >= buf_.size()) {
        return std::nullopt;
    }
    if (buf_.size() - pos_ < kFlacBlockHeaderSize) {
        MS_LOG("flac", "trailing " << (buf_.size() - pos_) << " bytes at offset " << pos_
                                   << " too short for a block header");
        truncated_ = true;
        return std::nullopt;
    }

    const uint8_t header = buf_[pos_];
    FramingUnit unit;
    unit.offset = pos_;
    unit.type = header & kFlacBlockTypeMask;
    unit.last = (header & kFlacLastBlockFlag) != 0;
    unit.header_size = kFlacBlockHeaderSize;
    unit.payload_size = read_u24_be(buf_, pos_ + 1);

    if (unit.payload_size > buf_.size() - pos_ - kFlacBlockHeaderSize) {
        MS_LOG("flac", "block type " << unit.type << " at offset " << pos_ << " claims "
                                     << unit.payload_size << " bytes, only "
                                     << (buf_.size() - pos_ - kFlacBlockHeaderSize)
                                     << " available");
        truncated_ = true;
        return std::nullopt;
    }

    unit.total_size = kFlacBlockHeaderSize + unit.payload_size;
    pos_ += unit.total_size;
    done_ = unit.last;
    return unit;
}
