//
//  config.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/config.h"

#include "gapit/logging.hpp"

#include <sstream>

namespace gapit {
namespace {

bool fail(const std::string& message, std::string* error) {
    GAPIT_LOG_ERROR("Scan config: " << message);
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace

bool validate_scan_config(const ScanConfig& config, std::string* error) {
    if (config.chunk_duration_ms <= 0.0) {
        return fail("chunk_duration_ms must be positive.", error);
    }
    if (config.chunk_overlap_ms < 0.0) {
        return fail("chunk_overlap_ms must not be negative.", error);
    }
    if (config.chunk_overlap_ms >= config.chunk_duration_ms) {
        std::ostringstream message;
        message << "chunk_overlap_ms (" << config.chunk_overlap_ms
                << ") must be less than chunk_duration_ms (" << config.chunk_duration_ms
                << ").";
        return fail(message.str(), error);
    }
    if (config.frame_duration_ms <= 0.0 || config.hop_duration_ms <= 0.0) {
        return fail("frame_duration_ms and hop_duration_ms must be positive.", error);
    }
    if (config.noise_floor_duration_ms < 0.0) {
        return fail("noise_floor_duration_ms must not be negative.", error);
    }
    if (config.min_voiced_duration_ms < 0.0 || config.hysteresis_ms < 0.0) {
        return fail("min_voiced_duration_ms and hysteresis_ms must not be negative.", error);
    }
    if (config.onset_abs_threshold < 0.0) {
        return fail("onset_abs_threshold must not be negative.", error);
    }
    if (config.initial_radius_ms < 0.0 || config.radius_increment_ms < 0.0) {
        return fail("search radius values must not be negative.", error);
    }
    if (config.early_stop_tolerance_ms < 0.0) {
        return fail("early_stop_tolerance_ms must not be negative.", error);
    }
    if (config.confidence_threshold < 0.0 || config.confidence_threshold > 1.0) {
        return fail("confidence_threshold must be within [0, 1].", error);
    }
    if (config.cache_capacity == 0) {
        return fail("cache_capacity must be at least 1.", error);
    }
    return true;
}

} // namespace gapit
