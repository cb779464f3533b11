//
//  preset.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/scan_preset.h"

#include <algorithm>
#include <cctype>

namespace gapit {
namespace {

class MdxPreset : public ScanPreset {
public:
    const char* name() const override {
        return "mdx";
    }

    void apply(ScanConfig& config) const override {
        const ScanConfig defaults;
        config.chunk_duration_ms = defaults.chunk_duration_ms;
        config.chunk_overlap_ms = defaults.chunk_overlap_ms;
        config.frame_duration_ms = defaults.frame_duration_ms;
        config.hop_duration_ms = defaults.hop_duration_ms;
        config.noise_floor_duration_ms = defaults.noise_floor_duration_ms;
        config.onset_snr_threshold_db = defaults.onset_snr_threshold_db;
        config.onset_abs_threshold = defaults.onset_abs_threshold;
        config.min_voiced_duration_ms = defaults.min_voiced_duration_ms;
        config.hysteresis_ms = defaults.hysteresis_ms;
        config.initial_radius_ms = defaults.initial_radius_ms;
        config.radius_increment_ms = defaults.radius_increment_ms;
        config.max_expansions = defaults.max_expansions;
        config.early_stop_tolerance_ms = defaults.early_stop_tolerance_ms;
        config.resample_hz = 0;
        config.use_fp16 = false;
    }
};

// Separation is the dominant cost on CPU; run the model at a lower rate.
class CpuPreset : public ScanPreset {
public:
    const char* name() const override {
        return "cpu";
    }

    void apply(ScanConfig& config) const override {
        config.device = "cpu";
        config.use_fp16 = false;
        config.resample_hz = 32000;
        config.early_stop_tolerance_ms = 750.0;
    }
};

class WidePreset : public ScanPreset {
public:
    const char* name() const override {
        return "wide";
    }

    void apply(ScanConfig& config) const override {
        config.initial_radius_ms = 10000.0;
        config.radius_increment_ms = 10000.0;
        config.max_expansions = 5;
    }
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<ScanPreset> make_scan_preset(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "mdx") {
        return std::make_unique<MdxPreset>();
    }
    if (key == "cpu") {
        return std::make_unique<CpuPreset>();
    }
    if (key == "wide") {
        return std::make_unique<WidePreset>();
    }
    return nullptr;
}

std::vector<std::string> scan_preset_names() {
    return {"mdx", "cpu", "wide"};
}

} // namespace gapit
