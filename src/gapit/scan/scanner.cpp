//
//  scanner.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/scanner.h"

#include "audio/dsp.h"
#include "gapit/chunk_iterator.h"
#include "gapit/expansion_strategy.h"
#include "gapit/logging.hpp"
#include "gapit/onset_detector.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <utility>

namespace gapit {
namespace {

// Onsets closer than this to an earlier candidate are the same onset seen
// from an overlapping chunk.
constexpr double kDuplicateOnsetMs = 1000.0;

struct ScanTiming {
    double load_ms = 0.0;
    double separate_ms = 0.0;
    double detect_ms = 0.0;
    std::size_t cache_hits = 0;
    std::size_t separations = 0;
};

bool fail(const std::string& message, std::string* error) {
    GAPIT_LOG_ERROR("Scan: " << message);
    if (error) {
        *error = message;
    }
    return false;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

bool separated_chunk(const ScanRequest& request,
                     const AudioInfo& info,
                     const ChunkBoundary& chunk,
                     VocalsCache& cache,
                     ScanTiming* timing,
                     CachedVocals* vocals) {
    if (cache.find(request.audio_file, chunk.start_ms, chunk.end_ms, vocals)) {
        ++timing->cache_hits;
        GAPIT_LOG_DEBUG("Scan: cache hit for " << chunk.start_ms << "-" << chunk.end_ms << "ms");
        return true;
    }

    const auto start_frame =
        static_cast<unsigned long long>(std::floor(chunk.start_ms * info.sample_rate / 1000.0));
    const auto frame_count = static_cast<unsigned long long>(
        std::llround(chunk.duration_ms() * info.sample_rate / 1000.0));

    Waveform mixture;
    double sample_rate = 0.0;
    std::string load_error;
    const auto load_start = std::chrono::steady_clock::now();
    if (!request.loader->load(request.audio_file, start_frame, frame_count, &mixture,
                              &sample_rate, &load_error)) {
        GAPIT_LOG_WARN("Scan: skipping chunk " << chunk.start_ms << "-" << chunk.end_ms
                                               << "ms, load failed: " << load_error);
        return false;
    }
    timing->load_ms += elapsed_ms(load_start);

    auto isolated = std::make_shared<Waveform>();
    std::string separate_error;
    const auto separate_start = std::chrono::steady_clock::now();
    const bool separated = request.separator->separate(detail::to_stereo(mixture),
                                                       sample_rate,
                                                       isolated.get(),
                                                       nullptr,
                                                       &separate_error);
    timing->separate_ms += elapsed_ms(separate_start);
    ++timing->separations;
    if (!separated) {
        GAPIT_LOG_WARN("Scan: skipping chunk " << chunk.start_ms << "-" << chunk.end_ms
                                               << "ms, separation failed: " << separate_error);
        return false;
    }

    cache.put(request.audio_file, chunk.start_ms, chunk.end_ms, isolated, sample_rate);
    vocals->vocals = std::move(isolated);
    vocals->sample_rate = sample_rate;
    vocals->start_ms = chunk.start_ms;
    vocals->end_ms = chunk.end_ms;
    return true;
}

bool is_duplicate(double onset_ms, const std::vector<OnsetCandidate>& candidates) {
    return std::any_of(candidates.begin(), candidates.end(), [&](const OnsetCandidate& c) {
        return std::fabs(onset_ms - c.onset_ms) < kDuplicateOnsetMs;
    });
}

void finish(const OnsetCandidate* best,
            const ChunkIterator& chunks,
            const ScanTiming& timing,
            DetectionOutcome* outcome) {
    outcome->chunks_processed = chunks.chunks_processed_count();
    outcome->found = best != nullptr;
    if (best) {
        outcome->onset_ms = best->onset_ms;
        if (best->onset_ms > 0.0) {
            outcome->silence_periods.emplace_back(0.0, best->onset_ms);
        }
    }
    std::sort(outcome->voiced_periods.begin(), outcome->voiced_periods.end());

    GAPIT_LOG_INFO_STREAM() << "Scan: " << (outcome->cancelled ? "cancelled" : "done")
                            << " chunks=" << outcome->chunks_processed
                            << " separations=" << timing.separations
                            << " cache_hits=" << timing.cache_hits
                            << " expansion=" << outcome->expansion_reached
                            << " load_ms=" << timing.load_ms
                            << " separate_ms=" << timing.separate_ms
                            << " detect_ms=" << timing.detect_ms;
    if (best) {
        GAPIT_LOG_INFO("Scan: onset " << best->onset_ms << "ms (distance "
                                      << best->distance_ms << "ms)");
    }
}

} // namespace

bool scan_for_onset(const ScanRequest& request, DetectionOutcome* outcome, std::string* error) {
    if (!outcome) {
        return fail("missing outcome", error);
    }
    if (!request.config || !request.loader || !request.separator) {
        return fail("scan request needs a config, a loader and a separator", error);
    }
    const ScanConfig& config = *request.config;
    if (!validate_scan_config(config, error)) {
        return false;
    }

    *outcome = DetectionOutcome{};

    AudioInfo info;
    std::string probe_error;
    if (!request.loader->probe(request.audio_file, &info, &probe_error)) {
        return fail("cannot open " + request.audio_file + ": " + probe_error, error);
    }
    if (info.sample_rate <= 0.0 || info.frames == 0) {
        return fail(request.audio_file + " contains no audio", error);
    }
    const double total_ms = info.duration_ms();
    outcome->total_duration_ms = total_ms;

    VocalsCache scratch_cache(config.cache_capacity);
    VocalsCache& cache = request.cache ? *request.cache : scratch_cache;

    ChunkIterator chunks(config.chunk_duration_ms, config.chunk_overlap_ms, total_ms);
    const ExpansionStrategy expansion(config.initial_radius_ms,
                                      config.radius_increment_ms,
                                      config.max_expansions,
                                      total_ms);

    GAPIT_LOG_INFO("Scan: " << request.audio_file << " expected=" << request.expected_gap_ms
                            << "ms duration=" << total_ms << "ms");

    ScanTiming timing;
    OnsetCandidate best;
    bool have_best = false;

    for (const SearchWindow& window : expansion.windows(request.expected_gap_ms)) {
        outcome->expansion_reached = window.expansion_index;
        GAPIT_LOG_DEBUG("Scan: expansion #" << window.expansion_index << " radius="
                                            << window.radius_ms << "ms window="
                                            << window.start_ms << "-" << window.end_ms << "ms");

        ChunkSequence sequence = chunks.generate(window.start_ms, window.end_ms);
        ChunkBoundary chunk;
        while (sequence.next(&chunk)) {
            if (request.cancelled && *request.cancelled && (*request.cancelled)()) {
                GAPIT_LOG_INFO("Scan: cancelled at chunk " << chunk.start_ms << "ms");
                outcome->cancelled = true;
                finish(have_best ? &best : nullptr, chunks, timing, outcome);
                return true;
            }

            CachedVocals vocals;
            if (!separated_chunk(request, info, chunk, cache, &timing, &vocals)) {
                continue;
            }

            OnsetDetection detection;
            const auto detect_start = std::chrono::steady_clock::now();
            const bool found =
                detect_onset(*vocals.vocals, vocals.sample_rate, chunk.start_ms, config, &detection);
            timing.detect_ms += elapsed_ms(detect_start);
            if (!found) {
                continue;
            }
            if (is_duplicate(detection.onset_ms, outcome->candidates)) {
                GAPIT_LOG_DEBUG("Scan: onset " << detection.onset_ms << "ms already recorded.");
                continue;
            }

            OnsetCandidate candidate;
            candidate.onset_ms = detection.onset_ms;
            candidate.distance_ms = std::fabs(detection.onset_ms - request.expected_gap_ms);
            candidate.expansion_index = window.expansion_index;
            candidate.chunk_start_ms = chunk.start_ms;
            outcome->candidates.push_back(candidate);
            outcome->voiced_periods.emplace_back(detection.onset_ms, detection.voiced_end_ms);
            GAPIT_LOG_DEBUG("Scan: candidate " << candidate.onset_ms << "ms distance "
                                               << candidate.distance_ms << "ms");

            // Strict comparison keeps the earlier candidate on ties.
            if (!have_best || candidate.distance_ms < best.distance_ms) {
                best = candidate;
                have_best = true;
            }
            if (candidate.distance_ms <= config.early_stop_tolerance_ms) {
                GAPIT_LOG_DEBUG("Scan: early stop within " << config.early_stop_tolerance_ms
                                                           << "ms tolerance.");
                finish(&candidate, chunks, timing, outcome);
                return true;
            }
        }

        if (!expansion.should_continue(window.expansion_index, have_best)) {
            break;
        }
    }

    finish(have_best ? &best : nullptr, chunks, timing, outcome);
    return true;
}

} // namespace gapit
