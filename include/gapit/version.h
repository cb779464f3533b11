//
//  version.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace gapit {

/// @brief Return the GapIt version display string (for example `v0.3.0`).
std::string version_string();

} // namespace gapit
