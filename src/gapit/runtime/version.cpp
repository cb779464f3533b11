//
//  version.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/version.h"
#include "gapit_version.hpp"

namespace gapit {

std::string version_string() {
    return GAPIT_VERSION_DISPLAY;
}

} // namespace gapit
