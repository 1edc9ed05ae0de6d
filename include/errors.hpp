//
//  errors.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <stdexcept>
#include <string>

namespace metasplice {

/// Base class for all container/metadata errors raised by the codecs.
class MetaSpliceError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// Missing or wrong magic signature; the buffer is not the container it claims to be.
class InvalidContainer : public MetaSpliceError {
   public:
    using MetaSpliceError::MetaSpliceError;
};

/// A structural box required for the operation is absent (e.g. MP4 `moov`).
class BoxNotFound : public MetaSpliceError {
   public:
    explicit BoxNotFound(const std::string &box_type)
        : MetaSpliceError("required box '" + box_type + "' not found"), box(box_type) {}

    std::string box;
};

/// A single entry/item is truncated or malformed. Callers log and skip it.
class MalformedEntry : public MetaSpliceError {
   public:
    using MetaSpliceError::MetaSpliceError;
};

}  // namespace metasplice
