//
//  hdlr_builder.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "hdlr_builder.hpp"

namespace {

std::unique_ptr<Atom> build_hdlr(const char type[4], const std::string &name) {
    auto h = Atom::create("hdlr");
    auto &p = h->payload;

    write_u8(p, 0);   // version
    write_u24(p, 0);  // flags

    write_u32(p, 0);             // pre_defined
    write_u32(p, fourcc(type));  // handler_type

    write_u32(p, 0);  // reserved[0]
    write_u32(p, 0);  // reserved[1]
    write_u32(p, 0);  // reserved[2]

    p.insert(p.end(), name.begin(), name.end());
    p.push_back(0);  // NULL terminated string

    return h;
}

}  // namespace

std::unique_ptr<Atom> build_hdlr_mdta() { return build_hdlr("mdta", ""); }
