//
//  transcode.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace gapit::detail {

std::string shell_quote(const std::string& value);

// Converts `input` to 16-bit PCM WAV at `sample_rate` using the ffmpeg CLI.
bool transcode_to_wav(const std::string& ffmpeg_path,
                      const std::string& input,
                      const std::string& output,
                      int sample_rate,
                      std::string* error);

std::string make_transcode_path(const std::string& input);

} // namespace gapit::detail
