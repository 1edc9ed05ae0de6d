//
//  udta_builder.cpp
//  MetaSplice
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "udta_builder.hpp"

#include "meta_builder.hpp"
#include "mp4_parser.hpp"

std::unique_ptr<Atom> build_legacy_workflow_box(const std::string &workflow) {
    auto wflo = Atom::create(metasplice::kLegacyWorkflowBox);
    auto &p = wflo->payload;

    write_u8(p, 0);   // version
    write_u24(p, 0);  // flags

    p.insert(p.end(), workflow.begin(), workflow.end());
    return wflo;
}

std::unique_ptr<Atom> build_udta(const metasplice::MetadataRecord &record,
                                 std::vector<std::unique_ptr<Atom>> kept) {
    auto udta = Atom::create("udta");
    for (auto &child : kept) {
        udta->add(std::move(child));
    }
    if (const std::string *workflow = record.find(metasplice::kWorkflowKey)) {
        udta->add(build_legacy_workflow_box(*workflow));
    }
    if (!record.empty()) {
        udta->add(build_meta(record));
    }
    return udta;
}
