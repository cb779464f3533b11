//
//  separator.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/waveform.h"

#include <string>

namespace gapit {

struct SeparationTiming {
    double resample_ms = 0.0;
    double forward_ms = 0.0;
};

/// @brief Maps a mixture chunk to its isolated-vocal stem.
///
/// Implementations are expensive and hold model state; one instance is shared
/// by all scans of a host and must not be called concurrently.
class VocalSeparator {
public:
    virtual ~VocalSeparator() = default;

    virtual const char* name() const = 0;

    /// @brief Separate vocals from a stereo mixture.
    ///
    /// The result has the same sample rate as `mixture`. A failure affects this
    /// call only.
    virtual bool separate(const Waveform& mixture,
                          double sample_rate,
                          Waveform* vocals,
                          SeparationTiming* timing,
                          std::string* error) = 0;
};

} // namespace gapit
