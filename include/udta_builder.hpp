//
//  udta_builder.hpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <memory>
#include <string>
#include <vector>

#include "metadata_record.hpp"
#include "mp4_atoms.hpp"

// Legacy workflow box: version/flags followed by the raw workflow text.
std::unique_ptr<Atom> build_legacy_workflow_box(const std::string &workflow);

// udta holding `kept` (foreign children, verbatim) followed by the `wflo` box when the record
// has a workflow and a keyed meta box when it is non-empty.
std::unique_ptr<Atom> build_udta(const metasplice::MetadataRecord &record,
                                 std::vector<std::unique_ptr<Atom>> kept = {});
