//
//  onset_detector.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/config.h"
#include "gapit/waveform.h"

namespace gapit {

struct OnsetDetection {
    double onset_ms = 0.0;
    // End of the sustained voiced run that confirmed the onset.
    double voiced_end_ms = 0.0;
    double noise_floor_rms = 0.0;
    double onset_rms = 0.0;
};

/// @brief Find the first sustained voiced onset in an isolated-vocal chunk.
///
/// The chunk is mixed to mono and reduced to a frame RMS envelope
/// (`frame_duration_ms` windows, `hop_duration_ms` stride). The RMS of the
/// first `noise_floor_duration_ms` serves as noise reference; shorter chunks
/// use all samples they have. When the first frame reaching
/// `onset_abs_threshold` starts inside that window, the reference shrinks to
/// the samples before it. A frame is voiced when it beats the reference
/// by `onset_snr_threshold_db` and reaches `onset_abs_threshold`. A voiced
/// run counts once it spans `min_voiced_duration_ms`, bridging dips no longer
/// than `hysteresis_ms`.
///
/// When nothing rises above the reference window in a chunk starting at 0 ms
/// and its opening frames already reach the absolute threshold, the song
/// opens voiced and the chunk start is reported as onset.
///
/// @param vocals Isolated-vocal waveform, any channel count.
/// @param sample_rate Sample rate of `vocals` in Hz.
/// @param chunk_start_ms Absolute position of the chunk's first sample.
/// @param config Detector thresholds.
/// @param result Filled with the absolute onset when one is found.
/// @return true when an onset was found.
bool detect_onset(const Waveform& vocals,
                  double sample_rate,
                  double chunk_start_ms,
                  const ScanConfig& config,
                  OnsetDetection* result);

} // namespace gapit
