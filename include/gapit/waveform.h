//
//  waveform.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

namespace gapit {

// Planar float audio: channels[c][frame].
struct Waveform {
    std::vector<std::vector<float>> channels;

    std::size_t channel_count() const {
        return channels.size();
    }

    std::size_t frame_count() const {
        return channels.empty() ? 0 : channels.front().size();
    }

    bool empty() const {
        return frame_count() == 0;
    }
};

struct AudioInfo {
    double sample_rate = 0.0;
    std::size_t channels = 0;
    unsigned long long frames = 0;

    double duration_ms() const {
        return sample_rate > 0.0 ? (static_cast<double>(frames) * 1000.0) / sample_rate : 0.0;
    }
};

} // namespace gapit
