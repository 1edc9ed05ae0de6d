//
//  meta_builder.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "meta_builder.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

#include "hdlr_builder.hpp"
#include "mp4_atoms.hpp"

// keys structure:
//
// [keys] atom.
//   version/flags (uint32=0)
//   entry_count   (uint32)
//   entries:
//      size      (uint32, 8 + name length)
//      namespace ('mdta')
//      <name bytes>
std::unique_ptr<Atom> build_keys(const std::vector<std::string> &keys) {
    auto atom = Atom::create("keys");
    auto &p = atom->payload;

    write_u8(p, 0);   // version
    write_u24(p, 0);  // flags
    write_u32(p, static_cast<uint32_t>(keys.size()));

    for (const auto &key : keys) {
        if (key.size() > std::numeric_limits<uint32_t>::max() - 8) {
            throw std::length_error("metadata key too long");
        }
        write_u32(p, static_cast<uint32_t>(8 + key.size()));
        write_u32(p, fourcc('m', 'd', 't', 'a'));
        p.insert(p.end(), key.begin(), key.end());
    }
    return atom;
}

// ILST item structure:
//
// [<key index>] atom.
//   [data] sub-atom.
//      type   (uint32)
//      lang   (uint32=0)
//      <raw data>
std::unique_ptr<Atom> build_ilst_item(uint32_t key_index, const std::string &value,
                                      uint32_t data_type) {
    auto item = Atom::create(key_index);

    auto data_atom = Atom::create("data");
    auto &d = data_atom->payload;

    // data header.
    write_u32(d, data_type);  // type (1 = UTF-8)
    write_u32(d, 0);          // locale/language = 0

    // value.
    d.insert(d.end(), value.begin(), value.end());

    item->add(std::move(data_atom));
    return item;
}

// Assemble an ilst atom from the supplied items.
std::unique_ptr<Atom> build_ilst(std::vector<std::unique_ptr<Atom>> items) {
    auto ilst = Atom::create("ilst");

    for (auto &item : items) {
        ilst->add(std::move(item));
    }

    return ilst;
}

std::unique_ptr<Atom> build_meta(const metasplice::MetadataRecord &record) {
    auto meta = Atom::create("meta");

    auto &p = meta->payload;

    // FullBox header.
    write_u8(p, 0);   // version
    write_u24(p, 0);  // flags

    std::vector<std::unique_ptr<Atom>> items;
    uint32_t index = 1;
    for (const auto &entry : record) {
        items.push_back(build_ilst_item(index++, entry.second));
    }

    meta->add(build_hdlr_mdta());
    meta->add(build_keys(record.keys()));
    meta->add(build_ilst(std::move(items)));

    return meta;
}
