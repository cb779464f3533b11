//
//  mdx_provider.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/provider.h"

#include "audio/dsp.h"
#include "audio/wav.h"
#include "gapit/confidence.h"
#include "gapit/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace gapit {
namespace {

class MdxDetectionProvider final : public DetectionProvider {
public:
    explicit MdxDetectionProvider(ProviderContext context) : context_(std::move(context)) {}

    const char* method_name() const override {
        return "mdx";
    }

    bool get_vocals(const std::string& audio_file,
                    const std::string& destination,
                    std::string* error) override {
        if (!context_.loader || !context_.separator) {
            return fail("provider has no loader or separator", error);
        }
        AudioInfo info;
        std::string probe_error;
        if (!context_.loader->probe(audio_file, &info, &probe_error)) {
            return fail("cannot open " + audio_file + ": " + probe_error, error);
        }

        const auto segment_frames = static_cast<unsigned long long>(
            std::llround(context_.config.chunk_duration_ms * info.sample_rate / 1000.0));
        if (segment_frames == 0) {
            return fail(audio_file + " has no usable sample rate", error);
        }
        Waveform stem;
        stem.channels.assign(2, {});
        for (unsigned long long start = 0; start < info.frames; start += segment_frames) {
            if (cancelled()) {
                return fail("vocal extraction cancelled", error);
            }
            Waveform mixture;
            double sample_rate = 0.0;
            std::string segment_error;
            if (!context_.loader->load(audio_file, start, segment_frames, &mixture, &sample_rate,
                                       &segment_error)) {
                return fail("load failed at frame " + std::to_string(start) + ": " +
                                segment_error,
                            error);
            }
            Waveform vocals;
            if (!context_.separator->separate(detail::to_stereo(mixture), sample_rate, &vocals,
                                              nullptr, &segment_error)) {
                return fail("separation failed at frame " + std::to_string(start) + ": " +
                                segment_error,
                            error);
            }
            const Waveform stereo = detail::to_stereo(vocals);
            for (std::size_t c = 0; c < 2; ++c) {
                stem.channels[c].insert(stem.channels[c].end(),
                                        stereo.channels[c].begin(),
                                        stereo.channels[c].end());
            }
        }

        if (!detail::write_wav_16(destination, stem, info.sample_rate, error)) {
            GAPIT_LOG_ERROR("MDX provider: could not write " << destination);
            return false;
        }
        GAPIT_LOG_INFO("MDX provider: wrote vocals of " << audio_file << " to " << destination);
        return true;
    }

    bool detect_silence_periods(const std::string& audio_file,
                                double expected_gap_ms,
                                DetectionOutcome* outcome,
                                std::string* error) override {
        ScanRequest request;
        request.audio_file = audio_file;
        request.expected_gap_ms = expected_gap_ms;
        request.config = &context_.config;
        request.loader = context_.loader;
        request.separator = context_.separator;
        request.cache = context_.cache;
        request.cancelled = context_.cancelled ? &context_.cancelled : nullptr;
        if (!scan_for_onset(request, outcome, error)) {
            return false;
        }
        if (!outcome->found && !outcome->cancelled) {
            GAPIT_LOG_WARN("MDX provider: no vocal onset in " << audio_file
                                                               << ", assuming vocals at 0ms.");
        }
        return true;
    }

    double compute_confidence(const std::string& audio_file, double onset_ms) override {
        ConfidenceRequest request;
        request.audio_file = audio_file;
        request.onset_ms = onset_ms;
        request.config = &context_.config;
        request.loader = context_.loader;
        request.separator = context_.separator;
        request.cache = context_.cache;
        request.cancelled = context_.cancelled ? &context_.cancelled : nullptr;
        return gapit::compute_confidence(request);
    }

private:
    static bool fail(const std::string& message, std::string* error) {
        GAPIT_LOG_ERROR("MDX provider: " << message);
        if (error) {
            *error = message;
        }
        return false;
    }

    bool cancelled() const {
        return context_.cancelled && context_.cancelled();
    }

    ProviderContext context_;
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

std::unique_ptr<DetectionProvider> make_detection_provider(const std::string& method,
                                                           ProviderContext context) {
    if (to_lower(method) == "mdx") {
        return std::make_unique<MdxDetectionProvider>(std::move(context));
    }
    GAPIT_LOG_WARN("Unknown detection method '" << method << "'.");
    return nullptr;
}

std::vector<std::string> detection_provider_names() {
    return {"mdx"};
}

} // namespace gapit
