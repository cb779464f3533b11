//
//  torch_separator.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/config.h"
#include "gapit/separator.h"

#include <memory>

namespace gapit {

/// @brief TorchScript source-separation model (Demucs layout).
///
/// The module takes `[1, 2, samples]` at `config.model_sample_rate` (or
/// `config.resample_hz` when set) and returns `[1, sources, 2, samples]`;
/// source `config.vocals_source_index` is the vocal stem. The model is loaded
/// and warmed up on first use.
std::unique_ptr<VocalSeparator> make_torch_vocal_separator(const ScanConfig& config);

} // namespace gapit
