//
//  onset_detector.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/onset_detector.h"

#include "audio/dsp.h"
#include "gapit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace gapit {
namespace {

constexpr double kEpsilon = 1e-8;

struct VoicedRun {
    std::size_t first = 0;
    std::size_t last = 0;
};

// Follows a run of voiced frames from `first`, bridging gaps of up to
// `hysteresis_frames` unvoiced frames.
template <typename IsVoiced>
VoicedRun follow_run(std::size_t first,
                     std::size_t frame_count,
                     std::size_t hysteresis_frames,
                     IsVoiced is_voiced) {
    VoicedRun run{first, first};
    for (std::size_t j = first + 1; j < frame_count; ++j) {
        if (is_voiced(j)) {
            run.last = j;
        } else if (j - run.last > hysteresis_frames) {
            break;
        }
    }
    return run;
}

} // namespace

bool detect_onset(const Waveform& vocals,
                  double sample_rate,
                  double chunk_start_ms,
                  const ScanConfig& config,
                  OnsetDetection* result) {
    if (sample_rate <= 0.0 || vocals.empty() || config.hop_duration_ms <= 0.0) {
        return false;
    }

    const std::vector<float> mono = detail::to_mono(vocals);
    const std::size_t frame_samples =
        std::max<std::size_t>(1, detail::ms_to_samples(config.frame_duration_ms, sample_rate));
    const std::size_t hop_samples =
        std::max<std::size_t>(1, detail::ms_to_samples(config.hop_duration_ms, sample_rate));
    const std::vector<double> envelope =
        detail::frame_rms_envelope(mono, frame_samples, hop_samples);
    if (envelope.empty()) {
        GAPIT_LOG_DEBUG("Onset detector: chunk at " << chunk_start_ms
                                                    << "ms shorter than one frame.");
        return false;
    }

    const std::size_t frame_count = envelope.size();
    std::size_t noise_samples =
        std::min(mono.size(), detail::ms_to_samples(config.noise_floor_duration_ms, sample_rate));

    // A reference window that already contains the onset would mask it; keep
    // only the quiet frames ahead of the first loud one.
    std::size_t first_loud = 0;
    while (first_loud < frame_count && envelope[first_loud] < config.onset_abs_threshold) {
        ++first_loud;
    }
    if (first_loud > 0 && first_loud < frame_count && first_loud * hop_samples < noise_samples) {
        noise_samples = first_loud * hop_samples;
    }
    const double noise_rms = noise_samples > 0 ? detail::rms_range(mono, 0, noise_samples) : 0.0;

    const std::size_t min_frames = std::max<std::size_t>(
        1, static_cast<std::size_t>(config.min_voiced_duration_ms / config.hop_duration_ms));
    const std::size_t hysteresis_frames =
        static_cast<std::size_t>(config.hysteresis_ms / config.hop_duration_ms);

    auto above_abs = [&](std::size_t i) {
        return envelope[i] >= config.onset_abs_threshold;
    };
    auto is_voiced = [&](std::size_t i) {
        const double snr_db = 20.0 * std::log10((envelope[i] + kEpsilon) / (noise_rms + kEpsilon));
        return snr_db >= config.onset_snr_threshold_db && above_abs(i);
    };

    GAPIT_LOG_DEBUG("Onset detector: chunk=" << chunk_start_ms << "ms frames=" << frame_count
                                             << " noise_rms=" << noise_rms
                                             << " noise_samples=" << noise_samples
                                             << " min_frames=" << min_frames
                                             << " hysteresis_frames=" << hysteresis_frames);

    auto accept = [&](const VoicedRun& run) {
        if (result) {
            result->onset_ms =
                chunk_start_ms + static_cast<double>(run.first) * config.hop_duration_ms;
            result->voiced_end_ms = chunk_start_ms +
                                    static_cast<double>(run.last) * config.hop_duration_ms +
                                    config.frame_duration_ms;
            result->noise_floor_rms = noise_rms;
            result->onset_rms = envelope[run.first];
        }
        return true;
    };

    std::size_t i = 0;
    while (i < frame_count) {
        if (!is_voiced(i)) {
            ++i;
            continue;
        }
        const VoicedRun run = follow_run(i, frame_count, hysteresis_frames, is_voiced);
        if (run.last - run.first + 1 >= min_frames) {
            return accept(run);
        }
        GAPIT_LOG_DEBUG("Onset detector: transient at "
                        << chunk_start_ms + static_cast<double>(i) * config.hop_duration_ms
                        << "ms rejected (" << (run.last - run.first + 1) << " frames).");
        i = run.last + 1;
    }

    // Nothing stands out against the reference window. At the song start that
    // window may itself be voiced.
    if (chunk_start_ms <= 0.0 && noise_rms >= config.onset_abs_threshold) {
        bool opens_voiced = min_frames <= frame_count;
        for (std::size_t k = 0; opens_voiced && k < min_frames; ++k) {
            opens_voiced = above_abs(k);
        }
        if (opens_voiced) {
            GAPIT_LOG_DEBUG("Onset detector: song opens voiced (noise_rms=" << noise_rms << ").");
            return accept(follow_run(0, frame_count, hysteresis_frames, above_abs));
        }
    }
    return false;
}

} // namespace gapit
