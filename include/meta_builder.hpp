//
//  meta_builder.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "metadata_record.hpp"
#include "mp4_atoms.hpp"

// Key dictionary: one 'mdta' entry per key, in record order.
std::unique_ptr<Atom> build_keys(const std::vector<std::string> &keys);

// ILST item for the key at 1-based `key_index`, holding one data atom.
std::unique_ptr<Atom> build_ilst_item(uint32_t key_index, const std::string &value,
                                      uint32_t data_type = 1);

// ILST container builder.
std::unique_ptr<Atom> build_ilst(std::vector<std::unique_ptr<Atom>> items);

// Full keyed meta box (version/flags, hdlr 'mdta', keys, ilst) for every record entry.
std::unique_ptr<Atom> build_meta(const metasplice::MetadataRecord &record);
