//
//  main.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"
#include "metasplice.hpp"
#include "metasplice_version.hpp"
#include "record_json.hpp"

metasplice::LogVerbosity parse_level(const std::string &s) {
    if (s == "debug") return metasplice::LogVerbosity::Debug;
    if (s == "info") return metasplice::LogVerbosity::Info;
    if (s == "warn" || s == "warning") return metasplice::LogVerbosity::Warn;
    return metasplice::LogVerbosity::Error;
}

std::optional<std::string> read_text(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void print_usage() {
    std::cerr << "MetaSplice " << METASPLICE_VERSION_DISPLAY << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage for reading:\n"
              << "  metasplice <input.webp|input.mp4|input.flac> "
              << "[--log-level warn|info|debug]\n"
              << "usage for writing:\n"
              << "  metasplice <input> <fields.json|-> <output> [--workflow FILE] "
              << "[--log-level warn|info|debug]\n"
              << "Options:\n"
              << "  --workflow FILE     Store the raw contents of FILE under the 'workflow' key.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n"
              << "  --version, -v       Print the version and exit.\n"
              << "                      JSON is always written to stdout when reading.\n";
}

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "MetaSplice " << METASPLICE_VERSION_DISPLAY << "\n";
        return 0;
    }

    // Gather positional arguments (non-option). A lone "-" is positional (no fields file).
    std::vector<std::string> positional;
    std::string workflow_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            metasplice::set_log_verbosity(parse_level(argv[i + 1]));
            ++i;
        } else if (arg == "--workflow" && i + 1 < argc) {
            workflow_path = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    // Reading mode: one positional argument (input).
    if (positional.size() == 1) {
        if (!workflow_path.empty()) {
            std::cerr << "--workflow is only valid when writing.\n";
            return 2;
        }
        auto res = metasplice::read_metadata(positional[0]);
        if (!res.status.ok) {
            MS_LOG("error", "metasplice: failed to read metadata: " << res.status.message);
            return 1;
        }
        std::cout << metasplice::record_to_json(res.metadata) << "\n";
        return 0;
    }

    // Writing mode: three positional arguments.
    if (positional.size() != 3) {
        std::cerr << "Invalid arguments. Run without arguments for usage.\n";
        return 2;
    }
    const std::string input_path = positional[0];
    const std::string fields_path = positional[1];
    const std::string output_path = positional[2];

    metasplice::MetadataRecord fields;
    if (fields_path != "-") {
        auto text = read_text(fields_path);
        if (!text) {
            MS_LOG("error", "metasplice: cannot open fields file " << fields_path);
            return 1;
        }
        std::string error;
        if (!metasplice::record_from_json(*text, fields, error)) {
            MS_LOG("error", "metasplice: " << fields_path << ": " << error);
            return 1;
        }
    }
    if (!workflow_path.empty()) {
        auto workflow = read_text(workflow_path);
        if (!workflow) {
            MS_LOG("error", "metasplice: cannot open workflow file " << workflow_path);
            return 1;
        }
        fields.set(metasplice::kWorkflowKey, std::move(*workflow));
    }
    if (fields.empty()) {
        MS_LOG("warn", "no fields given; rewriting " << input_path << " unchanged");
    }

    auto status = metasplice::write_metadata(input_path, fields, output_path);
    if (!status.ok) {
        MS_LOG("error", "metasplice: failed to write metadata: " << status.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
