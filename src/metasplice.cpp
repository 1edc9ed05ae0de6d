//
//  metasplice.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 1/16/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//
#include "metasplice.hpp"
#include "metasplice_version.hpp"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "flac_codec.hpp"
#include "logging.hpp"
#include "mp4_codec.hpp"
#include "mp4_parser.hpp"
#include "webp_codec.hpp"

namespace metasplice {

std::string version_string() { return METASPLICE_VERSION_DISPLAY; }

}  // namespace metasplice

namespace {

bool read_file(const std::string &path, std::vector<uint8_t> &out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        MS_LOG("error", "not a regular file: " << path);
        return false;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        MS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff end = f.tellg();
    if (end < 0) {
        MS_LOG("error", "cannot determine size of " << path);
        return false;
    }
    const size_t sz = static_cast<size_t>(end);
    f.seekg(0, std::ios::beg);
    out.resize(sz);
    f.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(sz));
    return f.good() || f.eof();
}

bool write_file(const std::string &path, const std::vector<uint8_t> &data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        MS_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return false;
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return out.good();
}

std::string lowercase_extension(const std::string &path) {
    auto ext = std::filesystem::path(path).extension().string();
    for (auto &c : ext) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

}  // namespace

namespace metasplice {

namespace {
Status make_status(bool ok, std::string msg = {}) { return Status{ok, std::move(msg)}; }
}  // namespace

std::string format_name(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::Webp:
            return "webp";
        case ContainerFormat::Mp4:
            return "mp4";
        case ContainerFormat::Flac:
            return "flac";
        case ContainerFormat::Unknown:
            break;
    }
    return "unknown";
}

ContainerFormat detect_format(const std::vector<uint8_t> &buffer, const std::string &path_hint) {
    if (has_webp_signature(buffer)) {
        return ContainerFormat::Webp;
    }
    if (has_flac_signature(buffer)) {
        return ContainerFormat::Flac;
    }
    if (has_ftyp_box(buffer)) {
        return ContainerFormat::Mp4;
    }

    const std::string ext = lowercase_extension(path_hint);
    if (ext == ".webp") {
        return ContainerFormat::Webp;
    }
    if (ext == ".mp4" || ext == ".m4a" || ext == ".m4v" || ext == ".mov") {
        return ContainerFormat::Mp4;
    }
    if (ext == ".flac") {
        return ContainerFormat::Flac;
    }
    return ContainerFormat::Unknown;
}

MetadataRecord get_metadata(ContainerFormat format, const std::vector<uint8_t> &buffer) {
    switch (format) {
        case ContainerFormat::Webp:
            return webp_get(buffer);
        case ContainerFormat::Mp4:
            return mp4_get(buffer);
        case ContainerFormat::Flac:
            return flac_get(buffer);
        case ContainerFormat::Unknown:
            break;
    }
    throw InvalidContainer("unsupported container format");
}

std::vector<uint8_t> set_metadata(ContainerFormat format, const std::vector<uint8_t> &buffer,
                                  const MetadataRecord &fields) {
    switch (format) {
        case ContainerFormat::Webp:
            return webp_set(buffer, fields);
        case ContainerFormat::Mp4:
            return mp4_set(buffer, fields);
        case ContainerFormat::Flac:
            return flac_set(buffer, fields);
        case ContainerFormat::Unknown:
            break;
    }
    throw InvalidContainer("unsupported container format");
}

ReadResult read_metadata(const std::string &path) {
    ReadResult res;
    MS_LOG("debug", "read_metadata path=" << path);
    std::vector<uint8_t> bytes;
    if (!read_file(path, bytes)) {
        res.status = make_status(false, "Failed to read " + path);
        return res;
    }
    res.format = detect_format(bytes, path);
    try {
        res.metadata = get_metadata(res.format, bytes);
    } catch (const MetaSpliceError &e) {
        std::string msg = "Failed to read metadata from " + path + ": " + e.what();
        MS_LOG("error", msg);
        res.status = make_status(false, msg);
        return res;
    }
    MS_LOG("info", "read " << res.metadata.size() << " entries from " << format_name(res.format)
                           << " file " << path);
    res.status = make_status(true);
    return res;
}

Status write_metadata(const std::string &input_path, const MetadataRecord &fields,
                      const std::string &output_path) {
    MS_LOG("debug", "write_metadata input=" << input_path << " output=" << output_path
                                            << " fields=" << fields.size());
    std::vector<uint8_t> bytes;
    if (!read_file(input_path, bytes)) {
        return make_status(false, "Failed to read " + input_path);
    }
    const ContainerFormat format = detect_format(bytes, input_path);

    std::vector<uint8_t> updated;
    try {
        updated = set_metadata(format, bytes, fields);
    } catch (const MetaSpliceError &e) {
        std::string msg = "Failed to update " + input_path + ": " + e.what();
        MS_LOG("error", msg);
        return make_status(false, msg);
    } catch (const std::length_error &e) {
        std::string msg = "Metadata too large for " + input_path + ": " + e.what();
        MS_LOG("error", msg);
        return make_status(false, msg);
    }

    if (!write_file(output_path, updated)) {
        return make_status(false, "Failed to write " + output_path);
    }
    MS_LOG("info", "wrote " << format_name(format) << " file " << output_path << " ("
                            << updated.size() << " bytes)");
    return make_status(true);
}

}  // namespace metasplice
