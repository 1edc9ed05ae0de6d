//
//  mp4_codec.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/14/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "metadata_record.hpp"

namespace metasplice {

/**
 * @brief Read the metadata record of an MP4/MOV buffer.
 *
 * Sources, later ones winning: workflow uuid box, root/moov meta, udta ©xxx atoms,
 * udta wflo, udta meta. Never throws; failures are logged and yield an empty record.
 */
MetadataRecord mp4_get(const std::vector<uint8_t> &buf);

/**
 * @brief Merge `record` into the first udta of moov and return the rebuilt file.
 *
 * Throws InvalidContainer without a leading ftyp and BoxNotFound without a top-level moov.
 * Chunk offsets pointing behind moov are shifted when moov changes size.
 */
std::vector<uint8_t> mp4_set(const std::vector<uint8_t> &buf, const MetadataRecord &record);

}  // namespace metasplice

#ifdef METASPLICE_TESTING
namespace metasplice::testing {
// Shift every stco/co64 entry >= `threshold` inside a serialized moov box by `delta`.
void shift_chunk_offsets_for_test(std::vector<uint8_t> &moov, uint64_t threshold,
                                  int64_t delta);
}  // namespace metasplice::testing
#endif
