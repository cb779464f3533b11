//
//  confidence.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/audio_loader.h"
#include "gapit/config.h"
#include "gapit/scanner.h"
#include "gapit/separator.h"
#include "gapit/vocals_cache.h"

#include <string>

namespace gapit {

inline constexpr double kFallbackConfidence = 0.7;

struct ConfidenceRequest {
    std::string audio_file;
    double onset_ms = 0.0;
    const ScanConfig* config = nullptr;
    AudioChunkLoader* loader = nullptr;
    VocalSeparator* separator = nullptr;
    VocalsCache* cache = nullptr;
    const CancellationCheck* cancelled = nullptr;
};

/// @brief SNR-derived confidence in [0, 1] for a detected onset.
///
/// Reuses a cached isolated-vocal chunk covering the onset, otherwise loads
/// and separates a segment around it. The noise reference is the first
/// 800 ms of that chunk, the signal the 300 ms following the onset; the
/// result is `sigmoid(0.1 * (snr_db - 10))`. Any failure yields
/// `kFallbackConfidence`.
double compute_confidence(const ConfidenceRequest& request);

/// @brief Maps an SNR in dB to a confidence value.
double confidence_from_snr(double snr_db);

bool is_confident(double confidence, const ScanConfig& config);

} // namespace gapit
