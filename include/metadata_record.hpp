//
//  metadata_record.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/12/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metasplice {

/// Reserved key holding the (opaque) JSON workflow document.
inline constexpr const char *kWorkflowKey = "workflow";

/**
 * @brief Ordered string-to-string map describing the metadata embedded in a media file.
 *
 * Keys are case-sensitive and unique. Insertion order is preserved; overwriting an existing
 * key keeps its position, so re-serializing a record that came from `get` reproduces the
 * original field order.
 */
class MetadataRecord {
   public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    MetadataRecord() = default;
    MetadataRecord(std::initializer_list<Entry> init);

    /// Insert or overwrite (last write wins).
    void set(const std::string &key, std::string value);

    /// Pointer to the stored value, or nullptr when the key is absent.
    const std::string *find(const std::string &key) const;

    std::optional<std::string> get(const std::string &key) const;
    bool contains(const std::string &key) const { return find(key) != nullptr; }

    /// Remove `key`; returns false if it was not present.
    bool erase(const std::string &key);

    std::vector<std::string> keys() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Order-sensitive comparison.
    bool operator==(const MetadataRecord &other) const = default;

   private:
    std::vector<Entry> entries_;
};

/// Existing entries first (in their order), then incoming ones; incoming values win.
MetadataRecord merge_records(const MetadataRecord &existing, const MetadataRecord &incoming);

/// Split `text` on the first occurrence of `separator`; nullopt when it is absent.
std::optional<std::pair<std::string, std::string>> split_key_value(const std::string &text,
                                                                   char separator);

}  // namespace metasplice
