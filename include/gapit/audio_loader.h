//
//  audio_loader.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/config.h"
#include "gapit/waveform.h"

#include <memory>
#include <string>

namespace gapit {

/// @brief Decodes frame ranges of an audio file.
///
/// `probe()` failing means the source is unusable and ends a scan. A failing
/// `load()` only costs the chunk it was asked for.
class AudioChunkLoader {
public:
    virtual ~AudioChunkLoader() = default;

    virtual bool probe(const std::string& path, AudioInfo* info, std::string* error) = 0;

    /// @brief Decode up to `frame_count` frames starting at `start_frame`.
    ///
    /// The returned waveform keeps the source channel layout and may be
    /// shorter than requested near the end of the file.
    virtual bool load(const std::string& path,
                      unsigned long long start_frame,
                      unsigned long long frame_count,
                      Waveform* waveform,
                      double* sample_rate,
                      std::string* error) = 0;
};

/// @brief libsndfile decoder; hands containers it cannot read to ffmpeg.
std::unique_ptr<AudioChunkLoader> make_sndfile_audio_loader(const ScanConfig& config);

/// @brief True for containers that are always transcoded before decoding.
bool requires_transcoding(const std::string& path);

} // namespace gapit
