//
//  dsp.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/waveform.h"

#include <cstddef>
#include <vector>

namespace gapit::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate);

// Resamples every channel; returns the input unchanged when rates match.
Waveform resample_linear(const Waveform &input, double input_rate,
                         std::size_t target_rate);

// Mean across channels.
std::vector<float> to_mono(const Waveform &waveform);

// Mono input is duplicated; extra channels beyond two are dropped.
Waveform to_stereo(const Waveform &waveform);

double rms_range(const std::vector<float> &samples, std::size_t begin,
                 std::size_t count);

// One RMS value per frame; frame i covers [i * hop, i * hop + frame).
std::vector<double> frame_rms_envelope(const std::vector<float> &samples,
                                       std::size_t frame_samples,
                                       std::size_t hop_samples);

std::size_t ms_to_samples(double ms, double sample_rate);

} // namespace gapit::detail
