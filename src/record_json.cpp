//
//  record_json.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "record_json.hpp"

#include <nlohmann/json.hpp>

#include "logging.hpp"

using json = nlohmann::ordered_json;

namespace metasplice {

std::string record_to_json(const MetadataRecord &record, int indent) {
    json j = json::object();
    for (const auto &[key, value] : record) {
        j[key] = value;
    }
    // Values are opaque bytes; replace invalid UTF-8 instead of throwing.
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool record_from_json(const std::string &text, MetadataRecord &out, std::string &error) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error &e) {
        error = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        error = "expected a JSON object of string fields";
        return false;
    }
    MetadataRecord record;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            error = "field '" + it.key() + "' must be a string (got " + it.value().type_name() +
                    ")";
            return false;
        }
        record.set(it.key(), it.value().get<std::string>());
    }
    MS_LOG("debug", "parsed " << record.size() << " fields from JSON");
    out = std::move(record);
    return true;
}

}  // namespace metasplice
