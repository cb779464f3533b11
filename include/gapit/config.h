//
//  config.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>

namespace gapit {

struct ScanConfig {
    // Chunking.
    double chunk_duration_ms = 12000.0;
    double chunk_overlap_ms = 6000.0;

    // Onset detection.
    double frame_duration_ms = 25.0;
    double hop_duration_ms = 20.0;
    double noise_floor_duration_ms = 1200.0;
    double onset_snr_threshold_db = 5.5;
    double onset_abs_threshold = 0.025;
    double min_voiced_duration_ms = 100.0;
    double hysteresis_ms = 350.0;

    // Expanding search.
    double initial_radius_ms = 7500.0;
    double radius_increment_ms = 7500.0;
    std::size_t max_expansions = 3;
    double early_stop_tolerance_ms = 500.0;

    double confidence_threshold = 0.55;
    std::size_t cache_capacity = 6;

    // Vocal separation backend.
    std::string model_path;
    std::string device = "cpu";
    bool use_fp16 = false;
    std::size_t model_sample_rate = 44100;
    std::size_t vocals_source_index = 3;
    std::size_t resample_hz = 0;
    std::size_t torch_threads = 0;
    bool allow_tf32 = true;

    // Exotic container transcoding.
    std::string ffmpeg_path = "ffmpeg";

    bool verbose = false;
    bool profile = false;
};

/// @brief Check a scan configuration for values the engine cannot run with.
///
/// Returns false and fills `error` (when non-null) with the first problem
/// found, e.g. an overlap that is not shorter than the chunk duration.
bool validate_scan_config(const ScanConfig& config, std::string* error);

} // namespace gapit
