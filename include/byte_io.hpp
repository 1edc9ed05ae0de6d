//
//  byte_io.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

// ------------- Bounds-checked readers ---------------------------------------
//
// All readers throw metasplice::MalformedEntry when the requested range does not fit the
// buffer, so a corrupt length field never turns into an out-of-bounds access.

inline bool has_bytes(const std::vector<uint8_t> &buf, size_t offset, size_t len) {
    return offset <= buf.size() && len <= buf.size() - offset;
}

inline void require_bytes(const std::vector<uint8_t> &buf, size_t offset, size_t len,
                          const char *what) {
    if (!has_bytes(buf, offset, len)) {
        throw metasplice::MalformedEntry(std::string(what) + " truncated at offset " +
                                         std::to_string(offset) + " (need " +
                                         std::to_string(len) + " bytes, buffer has " +
                                         std::to_string(buf.size()) + ")");
    }
}

inline uint16_t read_u16_be(const std::vector<uint8_t> &buf, size_t off) {
    require_bytes(buf, off, 2, "u16");
    return static_cast<uint16_t>((uint16_t(buf[off]) << 8) | uint16_t(buf[off + 1]));
}

inline uint16_t read_u16_le(const std::vector<uint8_t> &buf, size_t off) {
    require_bytes(buf, off, 2, "u16");
    return static_cast<uint16_t>(uint16_t(buf[off]) | (uint16_t(buf[off + 1]) << 8));
}

inline uint32_t read_u24_be(const std::vector<uint8_t> &buf, size_t off) {
    require_bytes(buf, off, 3, "u24");
    return (uint32_t(buf[off]) << 16) | (uint32_t(buf[off + 1]) << 8) | uint32_t(buf[off + 2]);
}

inline uint32_t read_u32_be(const std::vector<uint8_t> &buf, size_t off) {
    require_bytes(buf, off, 4, "u32");
    return (uint32_t(buf[off]) << 24) | (uint32_t(buf[off + 1]) << 16) |
           (uint32_t(buf[off + 2]) << 8) | uint32_t(buf[off + 3]);
}

inline uint32_t read_u32_le(const std::vector<uint8_t> &buf, size_t off) {
    require_bytes(buf, off, 4, "u32");
    return uint32_t(buf[off]) | (uint32_t(buf[off + 1]) << 8) | (uint32_t(buf[off + 2]) << 16) |
           (uint32_t(buf[off + 3]) << 24);
}

inline uint64_t read_u64_be(const std::vector<uint8_t> &buf, size_t off) {
    return (uint64_t(read_u32_be(buf, off)) << 32) | uint64_t(read_u32_be(buf, off + 4));
}

// Byte-order selectable variants (TIFF).
inline uint16_t read_u16(const std::vector<uint8_t> &buf, size_t off, bool little_endian) {
    return little_endian ? read_u16_le(buf, off) : read_u16_be(buf, off);
}

inline uint32_t read_u32(const std::vector<uint8_t> &buf, size_t off, bool little_endian) {
    return little_endian ? read_u32_le(buf, off) : read_u32_be(buf, off);
}

// ------------- Append writers (big-endian unless noted) ---------------------

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u24(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u32(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_u64(std::vector<uint8_t> &p, uint64_t v) {
    write_u32(p, static_cast<uint32_t>(v >> 32));
    write_u32(p, static_cast<uint32_t>(v & 0xFFFFFFFF));
}

inline void write_u16_le(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

// ------------- In-place patchers --------------------------------------------

inline void put_u16(std::vector<uint8_t> &p, size_t off, uint16_t v, bool little_endian) {
    require_bytes(p, off, 2, "u16 patch");
    if (little_endian) {
        p[off] = v & 0xFF;
        p[off + 1] = (v >> 8) & 0xFF;
    } else {
        p[off] = (v >> 8) & 0xFF;
        p[off + 1] = v & 0xFF;
    }
}

inline void put_u32(std::vector<uint8_t> &p, size_t off, uint32_t v, bool little_endian) {
    require_bytes(p, off, 4, "u32 patch");
    for (int i = 0; i < 4; ++i) {
        const int shift = little_endian ? 8 * i : 8 * (3 - i);
        p[off + i] = static_cast<uint8_t>((v >> shift) & 0xFF);
    }
}

inline void put_u64_be(std::vector<uint8_t> &p, size_t off, uint64_t v) {
    put_u32(p, off, static_cast<uint32_t>(v >> 32), false);
    put_u32(p, off + 4, static_cast<uint32_t>(v & 0xFFFFFFFF), false);
}
