//
//  wav.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/waveform.h"

#include <string>

namespace gapit::detail {

// Interleaved 16-bit PCM.
bool write_wav_16(const std::string& path,
                  const Waveform& waveform,
                  double sample_rate,
                  std::string* error);

} // namespace gapit::detail
