//
//  metadata_record.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "metadata_record.hpp"

#include <algorithm>

namespace metasplice {

MetadataRecord::MetadataRecord(std::initializer_list<Entry> init) {
    for (const auto &e : init) {
        set(e.first, e.second);
    }
}

void MetadataRecord::set(const std::string &key, std::string value) {
    for (auto &e : entries_) {
        if (e.first == key) {
            e.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

const std::string *MetadataRecord::find(const std::string &key) const {
    for (const auto &e : entries_) {
        if (e.first == key) {
            return &e.second;
        }
    }
    return nullptr;
}

std::optional<std::string> MetadataRecord::get(const std::string &key) const {
    if (const auto *v = find(key)) {
        return *v;
    }
    return std::nullopt;
}

bool MetadataRecord::erase(const std::string &key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry &e) { return e.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> MetadataRecord::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &e : entries_) {
        out.push_back(e.first);
    }
    return out;
}

MetadataRecord merge_records(const MetadataRecord &existing, const MetadataRecord &incoming) {
    MetadataRecord merged = existing;
    for (const auto &[key, value] : incoming) {
        merged.set(key, value);
    }
    return merged;
}

std::optional<std::pair<std::string, std::string>> split_key_value(const std::string &text,
                                                                   char separator) {
    const auto pos = text.find(separator);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, pos), text.substr(pos + 1));
}

}  // namespace metasplice
