//
//  provider.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/audio_loader.h"
#include "gapit/config.h"
#include "gapit/scanner.h"
#include "gapit/separator.h"
#include "gapit/vocals_cache.h"

#include <memory>
#include <string>
#include <vector>

namespace gapit {

class DetectionProvider {
public:
    virtual ~DetectionProvider() = default;

    virtual const char* method_name() const = 0;

    /// @brief Write the isolated-vocal stem of the whole track as 16-bit WAV.
    virtual bool get_vocals(const std::string& audio_file,
                            const std::string& destination,
                            std::string* error) = 0;

    /// @brief Scan for the onset and report the leading silence.
    virtual bool detect_silence_periods(const std::string& audio_file,
                                        double expected_gap_ms,
                                        DetectionOutcome* outcome,
                                        std::string* error) = 0;

    virtual double compute_confidence(const std::string& audio_file, double onset_ms) = 0;
};

// Collaborators are borrowed; the caller keeps them alive for the provider's lifetime.
struct ProviderContext {
    ScanConfig config;
    AudioChunkLoader* loader = nullptr;
    VocalSeparator* separator = nullptr;
    VocalsCache* cache = nullptr;
    CancellationCheck cancelled;
};

/// @brief Create a provider by method name ("mdx"); nullptr when unknown.
std::unique_ptr<DetectionProvider> make_detection_provider(const std::string& method,
                                                           ProviderContext context);
std::vector<std::string> detection_provider_names();

} // namespace gapit
