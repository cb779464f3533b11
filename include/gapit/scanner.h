//
//  scanner.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/audio_loader.h"
#include "gapit/config.h"
#include "gapit/separator.h"
#include "gapit/vocals_cache.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace gapit {

using CancellationCheck = std::function<bool()>;
using TimeRange = std::pair<double, double>;

struct OnsetCandidate {
    double onset_ms = 0.0;
    double distance_ms = 0.0;
    std::size_t expansion_index = 0;
    double chunk_start_ms = 0.0;
};

struct DetectionOutcome {
    bool found = false;
    double onset_ms = 0.0;
    std::vector<TimeRange> voiced_periods;
    std::vector<TimeRange> silence_periods;
    std::vector<OnsetCandidate> candidates;
    std::size_t chunks_processed = 0;
    std::size_t expansion_reached = 0;
    bool cancelled = false;
    double total_duration_ms = 0.0;
};

struct ScanRequest {
    std::string audio_file;
    double expected_gap_ms = 0.0;
    const ScanConfig* config = nullptr;
    AudioChunkLoader* loader = nullptr;
    VocalSeparator* separator = nullptr;
    VocalsCache* cache = nullptr;
    const CancellationCheck* cancelled = nullptr;
};

/// @brief Expanding-window search for the vocal onset nearest the expected gap.
///
/// Walks the windows of `ExpansionStrategy`, separating each new chunk (cache
/// first) and running `detect_onset` on it. Returns as soon as a candidate
/// lies within `early_stop_tolerance_ms` of the expected gap, otherwise the
/// candidate closest to it once the search stops widening.
///
/// Returns false only for an invalid configuration or a source that cannot
/// be opened. Chunks that fail to load or separate are skipped. Cancellation
/// returns true with `outcome->cancelled` set and the best candidate so far.
bool scan_for_onset(const ScanRequest& request, DetectionOutcome* outcome, std::string* error);

} // namespace gapit
