//
//  scan_preset.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/config.h"

#include <memory>
#include <string>
#include <vector>

namespace gapit {

class ScanPreset {
public:
    virtual ~ScanPreset() = default;
    virtual const char* name() const = 0;
    virtual void apply(ScanConfig& config) const = 0;
};

std::unique_ptr<ScanPreset> make_scan_preset(const std::string& name);
std::vector<std::string> scan_preset_names();

} // namespace gapit
