//
//  confidence.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/confidence.h"

#include "audio/dsp.h"
#include "gapit/logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

namespace gapit {
namespace {

constexpr double kEpsilon = 1e-8;
constexpr double kNoiseWindowMs = 800.0;
constexpr double kSignalWindowMs = 300.0;
constexpr double kSegmentPaddingMs = 1000.0;
constexpr double kSilentNoiseSnrDb = 20.0;

double fallback(const std::string& reason) {
    GAPIT_LOG_WARN("Confidence: " << reason << ", using fallback " << kFallbackConfidence);
    return kFallbackConfidence;
}

bool separate_segment(const ConfidenceRequest& request, CachedVocals* out, std::string* error) {
    if (!request.loader || !request.separator) {
        *error = "no loader or separator for a fresh segment";
        return false;
    }

    AudioInfo info;
    if (!request.loader->probe(request.audio_file, &info, error)) {
        return false;
    }
    const double total_ms = info.duration_ms();
    const double start_ms = std::max(0.0, request.onset_ms - kSegmentPaddingMs);
    const double end_ms = std::min(total_ms, request.onset_ms + kSegmentPaddingMs);
    if (end_ms <= start_ms) {
        *error = "onset outside of audio";
        return false;
    }

    Waveform mixture;
    double sample_rate = 0.0;
    if (!request.loader->load(request.audio_file,
                              static_cast<unsigned long long>(start_ms * info.sample_rate / 1000.0),
                              static_cast<unsigned long long>(
                                  std::llround((end_ms - start_ms) * info.sample_rate / 1000.0)),
                              &mixture,
                              &sample_rate,
                              error)) {
        return false;
    }

    auto vocals = std::make_shared<Waveform>();
    if (!request.separator->separate(detail::to_stereo(mixture), sample_rate, vocals.get(),
                                     nullptr, error)) {
        return false;
    }
    if (request.cache) {
        request.cache->put(request.audio_file, start_ms, end_ms, vocals, sample_rate);
    }
    out->vocals = std::move(vocals);
    out->sample_rate = sample_rate;
    out->start_ms = start_ms;
    out->end_ms = end_ms;
    return true;
}

} // namespace

double confidence_from_snr(double snr_db) {
    const double confidence = 1.0 / (1.0 + std::exp(-0.1 * (snr_db - 10.0)));
    return std::clamp(confidence, 0.0, 1.0);
}

double compute_confidence(const ConfidenceRequest& request) {
    if (request.cancelled && *request.cancelled && (*request.cancelled)()) {
        return fallback("cancelled");
    }

    CachedVocals chunk;
    if (request.cache && request.cache->get(request.audio_file, request.onset_ms, &chunk)) {
        GAPIT_LOG_DEBUG("Confidence: reusing cached chunk " << chunk.start_ms << "-"
                                                            << chunk.end_ms << "ms");
    } else {
        std::string error;
        if (!separate_segment(request, &chunk, &error)) {
            return fallback(error);
        }
    }
    if (!chunk.vocals || chunk.vocals->empty() || chunk.sample_rate <= 0.0) {
        return fallback("empty vocal chunk");
    }

    const std::vector<float> mono = detail::to_mono(*chunk.vocals);
    const std::size_t noise_samples =
        std::max<std::size_t>(1, detail::ms_to_samples(kNoiseWindowMs, chunk.sample_rate));
    const std::size_t signal_offset =
        detail::ms_to_samples(request.onset_ms - chunk.start_ms, chunk.sample_rate);
    const std::size_t signal_samples =
        std::max<std::size_t>(1, detail::ms_to_samples(kSignalWindowMs, chunk.sample_rate));
    if (signal_offset >= mono.size()) {
        return fallback("onset beyond cached chunk");
    }

    const double noise_rms = detail::rms_range(mono, 0, noise_samples);
    const double signal_rms = detail::rms_range(mono, signal_offset, signal_samples);
    const double snr_db = noise_rms <= kEpsilon
                              ? kSilentNoiseSnrDb
                              : 20.0 * std::log10((signal_rms + kEpsilon) / (noise_rms + kEpsilon));
    const double confidence = confidence_from_snr(snr_db);

    GAPIT_LOG_DEBUG("Confidence: onset=" << request.onset_ms << "ms noise_rms=" << noise_rms
                                         << " signal_rms=" << signal_rms << " snr=" << snr_db
                                         << "dB confidence=" << confidence);
    return confidence;
}

bool is_confident(double confidence, const ScanConfig& config) {
    return confidence >= config.confidence_threshold;
}

} // namespace gapit
