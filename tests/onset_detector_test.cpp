//
//  onset_detector_test.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/onset_detector.h"
#include "synthetic_audio_test_utils.h"

#include <cmath>
#include <iostream>
#include <vector>

namespace {

namespace synth = gapit::tests::synthetic_audio;

constexpr double kSampleRate = 16000.0;

bool check_close(double actual, double expected, double tolerance, const char* label) {
    if (std::fabs(actual - expected) <= tolerance) {
        return true;
    }
    std::cerr << "Onset detector test failed: " << label << " expected " << expected
              << " got " << actual << ".\n";
    return false;
}

bool test_silence_then_tone() {
    const auto mono = synth::make_tone_segment(kSampleRate, 3000.0, 2600.0, 3000.0, 220.0, 0.5f);
    gapit::OnsetDetection detection;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, gapit::ScanConfig{},
                             &detection)) {
        std::cerr << "Onset detector test failed: tone after silence not detected.\n";
        return false;
    }
    if (!check_close(detection.onset_ms, 2590.0, 10.0, "tone onset")) {
        return false;
    }
    if (!(detection.voiced_end_ms > 2900.0)) {
        std::cerr << "Onset detector test failed: voiced run should reach the tone end.\n";
        return false;
    }
    return true;
}

bool test_step_onset_within_one_hop() {
    const gapit::ScanConfig config;
    for (double step_ms : {1500.0, 2000.0, 3700.0}) {
        for (float noise : {0.0f, 0.01f, 0.05f}) {
            auto mono = synth::make_step(kSampleRate, 5000.0, step_ms, 0.5f);
            synth::add_noise(&mono, noise, 42);
            gapit::OnsetDetection detection;
            if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 12000.0, config,
                                     &detection)) {
                std::cerr << "Onset detector test failed: step at " << step_ms
                          << "ms with noise " << noise << " not detected.\n";
                return false;
            }
            if (!check_close(detection.onset_ms, 12000.0 + step_ms, config.frame_duration_ms,
                             "step onset")) {
                return false;
            }
        }
    }
    return true;
}

// Onsets inside the reference window must not be masked by their own energy.
bool test_step_inside_reference_window() {
    const gapit::ScanConfig config;
    for (double step_ms : {300.0, 500.0, 800.0, 1100.0}) {
        for (float noise : {0.0f, 0.01f}) {
            auto mono = synth::make_step(kSampleRate, 12000.0, step_ms, 0.5f);
            synth::add_noise(&mono, noise, 11);
            gapit::OnsetDetection detection;
            if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, config,
                                     &detection)) {
                std::cerr << "Onset detector test failed: early step at " << step_ms
                          << "ms with noise " << noise << " not detected.\n";
                return false;
            }
            if (!check_close(detection.onset_ms, step_ms, config.frame_duration_ms,
                             "early step onset")) {
                return false;
            }
            if (!(detection.noise_floor_rms < config.onset_abs_threshold)) {
                std::cerr << "Onset detector test failed: reference window kept voiced "
                             "samples at step " << step_ms << "ms.\n";
                return false;
            }
        }
    }

    // Same behaviour for a chunk that starts shortly before the onset.
    const auto mono = synth::make_step(kSampleRate, 12000.0, 400.0, 0.5f);
    gapit::OnsetDetection detection;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 6000.0, config,
                             &detection) ||
        !check_close(detection.onset_ms, 6400.0, config.frame_duration_ms, "mid-song step")) {
        std::cerr << "Onset detector test failed: onset early in a later chunk missed.\n";
        return false;
    }
    return true;
}

bool test_transient_spike_is_rejected() {
    const auto mono = synth::make_tone_segment(kSampleRate, 3000.0, 2000.0, 2030.0, 1000.0, 0.8f);
    gapit::OnsetDetection detection;
    if (gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, gapit::ScanConfig{},
                            &detection)) {
        std::cerr << "Onset detector test failed: 30ms click accepted as onset at "
                  << detection.onset_ms << "ms.\n";
        return false;
    }
    return true;
}

bool test_hysteresis_bridges_short_dips() {
    auto mono = synth::make_tone_segment(kSampleRate, 3000.0, 2000.0, 2060.0, 220.0, 0.5f);
    const auto second =
        synth::make_tone_segment(kSampleRate, 3000.0, 2160.0, 2240.0, 220.0, 0.5f);
    for (std::size_t i = 0; i < mono.size(); ++i) {
        mono[i] += second[i];
    }

    gapit::OnsetDetection bridged;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, gapit::ScanConfig{},
                             &bridged) ||
        !check_close(bridged.onset_ms, 1980.0, 1.0, "bridged onset")) {
        std::cerr << "Onset detector test failed: dip within hysteresis should be bridged.\n";
        return false;
    }

    gapit::ScanConfig strict;
    strict.hysteresis_ms = 0.0;
    gapit::OnsetDetection split;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, strict, &split)) {
        std::cerr << "Onset detector test failed: second burst alone should sustain.\n";
        return false;
    }
    return check_close(split.onset_ms, 2140.0, 1.0, "onset without hysteresis");
}

bool test_near_silence_has_no_onset() {
    std::vector<float> mono(static_cast<std::size_t>(kSampleRate * 4.0), 0.0f);
    synth::add_noise(&mono, 1e-4f, 7);
    for (std::size_t i = mono.size() / 2; i < mono.size(); ++i) {
        mono[i] *= 20.0f;
    }
    gapit::OnsetDetection detection;
    if (gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 6000.0, gapit::ScanConfig{},
                            &detection)) {
        std::cerr << "Onset detector test failed: quiet rise below the absolute floor "
                     "accepted.\n";
        return false;
    }
    return true;
}

bool test_short_chunk_uses_available_noise_floor() {
    const auto mono = synth::make_tone_segment(kSampleRate, 900.0, 700.0, 900.0, 220.0, 0.5f);
    gapit::OnsetDetection detection;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 6000.0, gapit::ScanConfig{},
                             &detection)) {
        std::cerr << "Onset detector test failed: short chunk onset not detected.\n";
        return false;
    }
    if (!check_close(detection.onset_ms, 6700.0, 25.0, "short chunk onset")) {
        return false;
    }

    const std::vector<float> tiny(100, 0.5f);
    if (gapit::detect_onset(synth::make_stereo(tiny), kSampleRate, 0.0, gapit::ScanConfig{},
                            &detection)) {
        std::cerr << "Onset detector test failed: chunk shorter than a frame.\n";
        return false;
    }
    return true;
}

bool test_song_opening_voiced() {
    const auto mono = synth::make_tone_segment(kSampleRate, 3000.0, 0.0, 3000.0, 220.0, 0.5f);
    gapit::OnsetDetection detection;
    if (!gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 0.0, gapit::ScanConfig{},
                             &detection) ||
        !check_close(detection.onset_ms, 0.0, 0.0, "voiced song start")) {
        std::cerr << "Onset detector test failed: voiced song start not reported.\n";
        return false;
    }
    if (gapit::detect_onset(synth::make_stereo(mono), kSampleRate, 6000.0, gapit::ScanConfig{},
                            &detection)) {
        std::cerr << "Onset detector test failed: steady vocals mid-song are no onset.\n";
        return false;
    }
    return true;
}

bool test_channels_are_averaged() {
    const auto left = synth::make_tone_segment(kSampleRate, 3000.0, 2000.0, 3000.0, 220.0, 0.5f);
    gapit::Waveform waveform;
    waveform.channels = {left, std::vector<float>(left.size(), 0.0f)};
    gapit::OnsetDetection detection;
    if (!gapit::detect_onset(waveform, kSampleRate, 0.0, gapit::ScanConfig{}, &detection)) {
        std::cerr << "Onset detector test failed: single-channel vocals not detected.\n";
        return false;
    }
    return check_close(detection.onset_ms, 1990.0, 10.0, "single channel onset") &&
           check_close(detection.onset_rms > 0.0 ? 1.0 : 0.0, 1.0, 0.0, "onset rms");
}

} // namespace

int main() {
    if (!test_silence_then_tone()) {
        return 1;
    }
    if (!test_step_onset_within_one_hop()) {
        return 1;
    }
    if (!test_step_inside_reference_window()) {
        return 1;
    }
    if (!test_transient_spike_is_rejected()) {
        return 1;
    }
    if (!test_hysteresis_bridges_short_dips()) {
        return 1;
    }
    if (!test_near_silence_has_no_onset()) {
        return 1;
    }
    if (!test_short_chunk_uses_available_noise_floor()) {
        return 1;
    }
    if (!test_song_opening_voiced()) {
        return 1;
    }
    if (!test_channels_are_averaged()) {
        return 1;
    }

    std::cout << "Onset detector test passed.\n";
    return 0;
}
