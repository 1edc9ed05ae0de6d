//
//  tiff_ifd.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/13/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "tiff_ifd.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>

#include "byte_io.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace metasplice {

namespace {

constexpr size_t kInlineValueBytes = 4;
constexpr uint16_t kTiffMagic = 42;

std::vector<uint8_t> slice_or_empty(const std::vector<uint8_t> &block, size_t offset,
                                    size_t len) {
    if (!has_bytes(block, offset, len)) {
        return {};
    }
    return std::vector<uint8_t>(block.begin() + static_cast<std::ptrdiff_t>(offset),
                                block.begin() + static_cast<std::ptrdiff_t>(offset + len));
}

// Text of an ASCII value with its trailing NUL run removed; nullopt when a NUL remains inside.
std::optional<std::string> ascii_text(const std::vector<uint8_t> &value) {
    size_t len = value.size();
    while (len > 0 && value[len - 1] == 0) {
        --len;
    }
    const auto end = value.begin() + static_cast<std::ptrdiff_t>(len);
    if (std::find(value.begin(), end, 0) != end) {
        return std::nullopt;
    }
    return std::string(value.begin(), end);
}

}  // namespace

size_t tiff_type_size(uint16_t type) {
    switch (type) {
        case 1:   // BYTE
        case 2:   // ASCII
        case 6:   // SBYTE
        case 7:   // UNDEFINED
            return 1;
        case 3:   // SHORT
        case 8:   // SSHORT
            return 2;
        case 4:   // LONG
        case 9:   // SLONG
        case 11:  // FLOAT
        case 13:  // IFD
            return 4;
        case 5:   // RATIONAL
        case 10:  // SRATIONAL
        case 12:  // DOUBLE
            return 8;
        default:
            return 1;
    }
}

TiffBlock decode_tiff_block(const std::vector<uint8_t> &block) {
    if (block.size() < kTiffHeaderSize) {
        throw MalformedEntry("TIFF block too short (" + std::to_string(block.size()) +
                             " bytes)");
    }
    TiffBlock tiff;
    if (block[0] == 'I' && block[1] == 'I') {
        tiff.little_endian = true;
    } else if (block[0] == 'M' && block[1] == 'M') {
        tiff.little_endian = false;
    } else {
        throw MalformedEntry("TIFF block has unknown byte-order mark");
    }
    const bool le = tiff.little_endian;
    if (read_u16(block, 2, le) != kTiffMagic) {
        MS_LOG("warn", "TIFF magic is " << read_u16(block, 2, le) << ", expected 42");
    }
    tiff.ifd_offset = read_u32(block, 4, le);

    const size_t ifd = tiff.ifd_offset;
    require_bytes(block, ifd, 2, "IFD entry count");
    const uint16_t entry_count = read_u16(block, ifd, le);
    const size_t table_size = 2 + size_t(entry_count) * kIfdEntrySize + 4;
    require_bytes(block, ifd, table_size - 4, "IFD entry table");

    MS_LOG("tiff", "decoding " << (le ? "II" : "MM") << " block of " << block.size()
                               << " bytes, " << entry_count << " entries at " << ifd
                               << " [" << hex_prefix(block) << "]");

    // Sequential layout prediction starts right after the next-IFD pointer.
    size_t predicted = ifd + table_size;
    size_t data_end = predicted;
    for (uint16_t i = 0; i < entry_count; ++i) {
        const size_t pos = ifd + 2 + size_t(i) * kIfdEntrySize;
        IfdEntry entry;
        entry.tag = read_u16(block, pos, le);
        entry.type = read_u16(block, pos + 2, le);
        entry.count = read_u32(block, pos + 4, le);
        entry.stored_offset = read_u32(block, pos + 8, le);

        const uint64_t byte_size = uint64_t(entry.count) * tiff_type_size(entry.type);
        if (byte_size <= kInlineValueBytes) {
            entry.is_inline = true;
            entry.value = slice_or_empty(block, pos + 8, static_cast<size_t>(byte_size));
            entry.predicted_value = entry.value;
            entry.predicted_offset = static_cast<uint32_t>(pos + 8);
        } else {
            if (predicted % 2) {
                ++predicted;  // word alignment
            }
            entry.predicted_offset = static_cast<uint32_t>(predicted);
            if (entry.stored_offset != predicted) {
                ++tiff.mismatched_offsets;
                MS_LOG("warn", "IFD entry 0x" << std::hex << entry.tag << std::dec
                                              << " stored offset " << entry.stored_offset
                                              << " != predicted " << predicted
                                              << ", TIFF block may be corrupted");
            }
            const size_t len = byte_size > block.size() ? block.size()
                                                        : static_cast<size_t>(byte_size);
            entry.value = slice_or_empty(block, entry.stored_offset, len);
            entry.predicted_value = slice_or_empty(block, predicted, len);
            predicted += static_cast<size_t>(byte_size);
            data_end = std::max(data_end, predicted);
        }

        if (entry.type == kTiffTypeAscii && entry.is_inline) {
            entry.ascii = ascii_text(entry.value);
            // Some writers put short text out of line too; the field then holds an offset.
            const size_t len = static_cast<size_t>(byte_size);
            const size_t at = entry.stored_offset;
            const bool clear_of_table = at >= ifd + table_size || at + len <= ifd;
            if ((!entry.ascii || entry.ascii->find(':') == std::string::npos) && len > 0 &&
                at >= kTiffHeaderSize && clear_of_table && has_bytes(block, at, len)) {
                const size_t aligned = predicted + (predicted % 2);
                auto stored = slice_or_empty(block, at, len);
                auto at_prediction = slice_or_empty(block, aligned, len);
                auto text = ascii_text(stored);
                if (!text && !at_prediction.empty()) {
                    text = ascii_text(at_prediction);
                    stored = at_prediction;
                }
                if (text) {
                    MS_LOG("debug", "IFD entry 0x" << std::hex << entry.tag << std::dec
                                                   << " stores " << len
                                                   << " text bytes out of line at " << at);
                    if (at != aligned) {
                        ++tiff.mismatched_offsets;
                    }
                    entry.is_inline = false;
                    entry.ascii = std::move(text);
                    entry.value = std::move(stored);
                    entry.predicted_value = std::move(at_prediction);
                    entry.predicted_offset = static_cast<uint32_t>(aligned);
                    predicted = aligned + len;
                    data_end = std::max(data_end, predicted);
                }
            }
        } else if (entry.type == kTiffTypeAscii) {
            if (!entry.value.empty()) {
                entry.ascii = ascii_text(entry.value);
            }
            if (!entry.ascii && !entry.predicted_value.empty()) {
                entry.ascii = ascii_text(entry.predicted_value);
                if (entry.ascii) {
                    entry.value = entry.predicted_value;  // re-encode what was decoded
                }
            }
        }
        if (entry.type == kTiffTypeAscii && !entry.ascii) {
            MS_LOG("warn", "IFD ASCII entry 0x" << std::hex << entry.tag << std::dec
                                                << " could not be decoded");
        }
        tiff.entries.push_back(std::move(entry));
    }

    tiff.tail_padding = block.size() > data_end ? block.size() - data_end : 0;
    return tiff;
}

std::vector<uint8_t> encode_tiff_block(const std::vector<IfdEntry> &all_entries,
                                       size_t tail_padding, bool little_endian) {
    // Only entries whose bytes back their declared count are written.
    std::vector<IfdEntry> entries;
    entries.reserve(all_entries.size());
    for (const auto &entry : all_entries) {
        const uint64_t byte_size = uint64_t(entry.count) * tiff_type_size(entry.type);
        if (entry.value.size() == byte_size) {
            entries.push_back(entry);
        } else if (entry.predicted_value.size() == byte_size) {
            IfdEntry recovered = entry;
            recovered.value = entry.predicted_value;
            entries.push_back(std::move(recovered));
        } else {
            MS_LOG("warn", "dropping IFD entry 0x" << std::hex << entry.tag << std::dec
                                                   << ": " << entry.value.size()
                                                   << " value bytes for " << byte_size
                                                   << " declared");
        }
    }
    if (entries.size() > std::numeric_limits<uint16_t>::max()) {
        throw std::length_error("too many IFD entries");
    }
    const size_t table_size = 2 + entries.size() * kIfdEntrySize + 4;

    std::vector<uint8_t> out;
    if (little_endian) {
        out = {'I', 'I'};
        write_u16_le(out, kTiffMagic);
        write_u32_le(out, static_cast<uint32_t>(kTiffHeaderSize));
    } else {
        out = {'M', 'M'};
        write_u16(out, kTiffMagic);
        write_u32(out, static_cast<uint32_t>(kTiffHeaderSize));
    }
    out.resize(kTiffHeaderSize + table_size, 0);
    put_u16(out, kTiffHeaderSize, static_cast<uint16_t>(entries.size()), little_endian);

    for (size_t i = 0; i < entries.size(); ++i) {
        const IfdEntry &entry = entries[i];
        const size_t pos = kTiffHeaderSize + 2 + i * kIfdEntrySize;
        put_u16(out, pos, entry.tag, little_endian);
        put_u16(out, pos + 2, entry.type, little_endian);
        put_u32(out, pos + 4, entry.count, little_endian);

        if (uint64_t(entry.count) * tiff_type_size(entry.type) <= kInlineValueBytes) {
            std::copy(entry.value.begin(), entry.value.end(), out.begin() + pos + 8);
            continue;
        }
        if (out.size() % 2) {
            out.push_back(0);
        }
        if (out.size() > std::numeric_limits<uint32_t>::max()) {
            throw std::length_error("TIFF block exceeds 32-bit offsets");
        }
        put_u32(out, pos + 8, static_cast<uint32_t>(out.size()), little_endian);
        out.insert(out.end(), entry.value.begin(), entry.value.end());
    }
    // Next-IFD pointer stays 0.
    out.insert(out.end(), tail_padding, 0);
    return out;
}

IfdEntry make_ascii_entry(uint16_t tag, const std::string &text) {
    IfdEntry entry;
    entry.tag = tag;
    entry.type = kTiffTypeAscii;
    entry.value.assign(text.begin(), text.end());
    entry.value.push_back(0);
    entry.count = static_cast<uint32_t>(entry.value.size());
    entry.ascii = text;
    return entry;
}

}  // namespace metasplice
