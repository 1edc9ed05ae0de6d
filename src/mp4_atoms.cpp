//
//  mp4_atoms.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "mp4_atoms.hpp"

#include <limits>

// -----------------------------------------------------------------------------
// Factory.
// -----------------------------------------------------------------------------
AtomPtr Atom::create(const char t[4]) { return std::make_unique<Atom>(t); }

AtomPtr Atom::create(uint32_t t) { return std::make_unique<Atom>(t); }


AtomPtr Atom::create_raw(const std::vector<uint8_t> &bytes) {
    if (bytes.size() < 8) {
        throw std::invalid_argument("raw atom shorter than its header");
    }
    auto atom = std::make_unique<Atom>(read_u32_be(bytes, 4));
    atom->payload = bytes;
    atom->raw_ = true;
    return atom;
}

// -----------------------------------------------------------------------------
// Add child.
// -----------------------------------------------------------------------------
void Atom::add(AtomPtr child) { children.push_back(std::move(child)); }

// -----------------------------------------------------------------------------
// Compute recursive box size.
// -----------------------------------------------------------------------------
void Atom::fix_size_recursive() {
    if (raw_) {
        if (payload.size() > std::numeric_limits<uint32_t>::max()) {
            throw std::length_error("raw atom exceeds 32-bit size");
        }
        box_size = static_cast<uint32_t>(payload.size());
        return;
    }

    // Start with MP4 header: 8 bytes (size + type)
    uint64_t total = 8;

    // Payload.
    total += payload.size();

    // Children.
    for (auto &c : children) {
        c->fix_size_recursive();
        total += c->box_size;
    }

    if (total > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("atom '" + fourcc_to_string(type) + "' exceeds 32-bit size");
    }
    box_size = static_cast<uint32_t>(total);
}

// -----------------------------------------------------------------------------
// Serialize atom.
// -----------------------------------------------------------------------------
void Atom::write(std::vector<uint8_t> &out) const {
    if (raw_) {
        out.insert(out.end(), payload.begin(), payload.end());
        return;
    }

    write_u32(out, box_size);
    write_u32(out, type);

    // Write payload.
    out.insert(out.end(), payload.begin(), payload.end());

    // Write children.
    for (const auto &c : children) {
        c->write(out);
    }
}

std::vector<uint8_t> Atom::serialize() {
    fix_size_recursive();
    std::vector<uint8_t> out;
    out.reserve(box_size);
    write(out);
    return out;
}
