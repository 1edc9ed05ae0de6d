//
//  hdlr_builder.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>
#include <string>

#include "mp4_atoms.hpp"

// Handler box for keyed metadata (meta/keys/ilst):
//   handler_type = "mdta"
//   handler_name = "" (33-byte box)
std::unique_ptr<Atom> build_hdlr_mdta();
