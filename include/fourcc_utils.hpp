//
//  fourcc_utils.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// FourCC helpers.
inline constexpr uint32_t fourcc(const char a, const char b, const char c, const char d) {
    return (uint32_t(uint8_t(a)) << 24) | (uint32_t(uint8_t(b)) << 16) |
           (uint32_t(uint8_t(c)) << 8) | (uint32_t(uint8_t(d)));
}

inline constexpr uint32_t fourcc(const char t[4]) { return fourcc(t[0], t[1], t[2], t[3]); }

inline uint32_t fourcc(const std::string &s) {
    if (s.size() < 4) {
        throw std::runtime_error("fourcc string too short");
    }
    return fourcc(s[0], s[1], s[2], s[3]);
}

inline bool is_printable_fourcc(uint32_t type) {
    for (int i = 0; i < 4; ++i) {
        const uint8_t c = static_cast<uint8_t>(type >> (24 - 8 * i));
        // 0xA9 ('©') prefixes QuickTime user data text atoms.
        if ((c < 0x20 || c > 0x7E) && c != 0xA9) {
            return false;
        }
    }
    return true;
}

inline std::string fourcc_to_string(uint32_t type) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((type >> 24) & 0xFF);
    s[1] = static_cast<char>((type >> 16) & 0xFF);
    s[2] = static_cast<char>((type >> 8) & 0xFF);
    s[3] = static_cast<char>(type & 0xFF);
    return s;
}

// Compare four bytes at `offset` against a FourCC without reading past the buffer.
inline bool fourcc_at(const std::vector<uint8_t> &buf, size_t offset, uint32_t type) {
    if (offset > buf.size() || buf.size() - offset < 4) {
        return false;
    }
    return buf[offset] == ((type >> 24) & 0xFF) && buf[offset + 1] == ((type >> 16) & 0xFF) &&
           buf[offset + 2] == ((type >> 8) & 0xFF) && buf[offset + 3] == (type & 0xFF);
}
