//
//  wav.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "wav.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>

namespace gapit::detail {
namespace {

template <typename T>
void write_le(std::ofstream& out, T value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

} // namespace

bool write_wav_16(const std::string& path,
                  const Waveform& waveform,
                  double sample_rate,
                  std::string* error) {
    const std::size_t frames = waveform.frame_count();
    if (frames == 0 || sample_rate <= 0.0) {
        if (error) {
            *error = "Empty waveform or invalid sample rate.";
        }
        return false;
    }

    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        if (error) {
            *error = "Failed to open WAV output: " + path;
        }
        return false;
    }

    const std::uint16_t channels = static_cast<std::uint16_t>(waveform.channel_count());
    const std::uint16_t bits_per_sample = 16;
    const std::uint32_t sample_rate_u = static_cast<std::uint32_t>(std::lround(sample_rate));
    const std::uint16_t block_align = channels * (bits_per_sample / 8);
    const std::uint32_t byte_rate = sample_rate_u * block_align;
    const std::uint32_t data_size = static_cast<std::uint32_t>(frames * block_align);

    out.write("RIFF", 4);
    write_le<std::uint32_t>(out, 36 + data_size);
    out.write("WAVE", 4);

    out.write("fmt ", 4);
    write_le<std::uint32_t>(out, 16);
    write_le<std::uint16_t>(out, 1);
    write_le(out, channels);
    write_le(out, sample_rate_u);
    write_le(out, byte_rate);
    write_le(out, block_align);
    write_le(out, bits_per_sample);

    out.write("data", 4);
    write_le(out, data_size);

    for (std::size_t i = 0; i < frames; ++i) {
        for (const auto& channel : waveform.channels) {
            const float sample = i < channel.size() ? channel[i] : 0.0f;
            const float clamped = std::max(-1.0f, std::min(1.0f, sample));
            write_le(out, static_cast<std::int16_t>(std::lround(clamped * 32767.0f)));
        }
    }

    if (!out.good()) {
        if (error) {
            *error = "Failed to write WAV data.";
        }
        return false;
    }

    return true;
}

} // namespace gapit::detail
