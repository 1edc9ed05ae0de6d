//
//  metasplice.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"
#include "metadata_record.hpp"

namespace metasplice {

/// @defgroup api MetaSplice Public API
/// Public, supported C++ interfaces for reading and rewriting embedded metadata.
/// @{

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to open files, unsupported container, broken fields JSON).
 */
struct Status {
    bool ok{false};
    std::string message;
};

enum class ContainerFormat { Unknown, Webp, Mp4, Flac };

/// Short lowercase name ("webp", "mp4", "flac", "unknown").
std::string format_name(ContainerFormat format);

/**
 * @brief Return the MetaSplice library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Identify the container by its signature, falling back to the file extension.
 *
 * @param buffer File contents (may be a prefix).
 * @param path_hint Optional file name; only its extension is consulted.
 */
ContainerFormat detect_format(const std::vector<uint8_t> &buffer,
                              const std::string &path_hint = {});  ///< @ingroup api

/// Dispatch to the codec's `get`. Throws InvalidContainer for ContainerFormat::Unknown.
MetadataRecord get_metadata(ContainerFormat format,
                            const std::vector<uint8_t> &buffer);  ///< @ingroup api

/// Dispatch to the codec's `set`. Throws InvalidContainer for ContainerFormat::Unknown.
std::vector<uint8_t> set_metadata(ContainerFormat format, const std::vector<uint8_t> &buffer,
                                  const MetadataRecord &fields);  ///< @ingroup api

/// Result of reading a file: status, detected container and its metadata.
struct ReadResult {
    Status status;
    ContainerFormat format{ContainerFormat::Unknown};
    MetadataRecord metadata;
};

/// Read `path`, detect its container and extract the record. Never throws.
ReadResult read_metadata(const std::string &path);  ///< @ingroup api

/**
 * @brief Merge `fields` into the metadata of `input_path` and write the result.
 *
 * @param input_path Source media file (WEBP, MP4/MOV/M4A or FLAC).
 * @param fields Entries to add or overwrite; existing entries are preserved.
 * @param output_path Destination; may equal `input_path`.
 */
Status write_metadata(const std::string &input_path, const MetadataRecord &fields,
                      const std::string &output_path);  ///< @ingroup api

/// @}

}  // namespace metasplice
