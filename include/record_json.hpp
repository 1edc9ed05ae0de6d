//
//  record_json.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "metadata_record.hpp"

namespace metasplice {

/// Serialize as a JSON object, keys in record order.
std::string record_to_json(const MetadataRecord &record, int indent = 2);

/**
 * @brief Parse a JSON object of string values into `out`.
 *
 * Returns false and fills `error` when the text is not valid JSON, not an object, or holds a
 * non-string value.
 */
bool record_from_json(const std::string &text, MetadataRecord &out, std::string &error);

}  // namespace metasplice
