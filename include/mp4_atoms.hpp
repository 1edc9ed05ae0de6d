//
//  mp4_atoms.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "byte_io.hpp"
#include "fourcc_utils.hpp"

// Forward declaration.
class Atom;

using AtomPtr = std::unique_ptr<Atom>;

class Atom {
   public:
    uint32_t type = 0;              // FourCC
    std::vector<uint8_t> payload;   // Raw payload (before children)
    std::vector<AtomPtr> children;  // Nested boxes

    uint32_t box_size = 0;  // Computed via fix_size_recursive()

    Atom() = default;
    explicit Atom(uint32_t t) : type(t) {}
    explicit Atom(const char t[4]) : type(fourcc(t)) {}

    // Factory.
    static AtomPtr create(const char t[4]);
    static AtomPtr create(uint32_t t);

    // Opaque box: `bytes` is a complete serialized box (header included) kept verbatim.
    static AtomPtr create_raw(const std::vector<uint8_t> &bytes);

    // Add child atom.
    void add(AtomPtr child);

    // Recursive size computation. Throws std::length_error above 4 GiB.
    void fix_size_recursive();

    // Append the serialized atom (must call fix_size_recursive first).
    void write(std::vector<uint8_t> &out) const;

    // Convenience: fix sizes and serialize into a fresh buffer.
    std::vector<uint8_t> serialize();

   private:
    bool raw_ = false;  // payload already holds header + body
};
