//
//  dsp.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "dsp.h"

#include <algorithm>
#include <cmath>

namespace gapit::detail {

std::vector<float> resample_linear_mono(const std::vector<float> &input,
                                        double input_rate,
                                        std::size_t target_rate) {
  if (input_rate <= 0.0 || target_rate == 0 || input.empty()) {
    return {};
  }
  if (static_cast<std::size_t>(std::lround(input_rate)) == target_rate) {
    return input;
  }

  const double ratio = static_cast<double>(target_rate) / input_rate;
  const std::size_t output_size =
      static_cast<std::size_t>(std::lround(input.size() * ratio));
  std::vector<float> output(output_size, 0.0f);

  for (std::size_t i = 0; i < output_size; ++i) {
    const double position = static_cast<double>(i) / ratio;
    const std::size_t index = static_cast<std::size_t>(position);
    const double frac = position - static_cast<double>(index);
    if (index + 1 < input.size()) {
      output[i] = static_cast<float>((1.0 - frac) * input[index] +
                                     frac * input[index + 1]);
    } else if (index < input.size()) {
      output[i] = input[index];
    }
  }

  return output;
}

Waveform resample_linear(const Waveform &input, double input_rate,
                         std::size_t target_rate) {
  if (static_cast<std::size_t>(std::lround(input_rate)) == target_rate) {
    return input;
  }
  Waveform output;
  output.channels.reserve(input.channel_count());
  for (const auto &channel : input.channels) {
    output.channels.push_back(
        resample_linear_mono(channel, input_rate, target_rate));
  }
  return output;
}

std::vector<float> to_mono(const Waveform &waveform) {
  const std::size_t frames = waveform.frame_count();
  const std::size_t channels = waveform.channel_count();
  if (channels == 1) {
    return waveform.channels.front();
  }
  std::vector<float> mono(frames, 0.0f);
  if (channels == 0) {
    return mono;
  }
  const float scale = 1.0f / static_cast<float>(channels);
  for (const auto &channel : waveform.channels) {
    const std::size_t limit = std::min(frames, channel.size());
    for (std::size_t i = 0; i < limit; ++i) {
      mono[i] += channel[i] * scale;
    }
  }
  return mono;
}

Waveform to_stereo(const Waveform &waveform) {
  if (waveform.channel_count() == 2) {
    return waveform;
  }
  Waveform stereo;
  if (waveform.channels.empty()) {
    stereo.channels.assign(2, {});
    return stereo;
  }
  stereo.channels.push_back(waveform.channels[0]);
  stereo.channels.push_back(waveform.channel_count() > 1 ? waveform.channels[1]
                                                         : waveform.channels[0]);
  return stereo;
}

double rms_range(const std::vector<float> &samples, std::size_t begin,
                 std::size_t count) {
  if (begin >= samples.size() || count == 0) {
    return 0.0;
  }
  const std::size_t end = std::min(samples.size(), begin + count);
  double sum = 0.0;
  for (std::size_t i = begin; i < end; ++i) {
    const double value = samples[i];
    sum += value * value;
  }
  return std::sqrt(sum / static_cast<double>(end - begin));
}

std::vector<double> frame_rms_envelope(const std::vector<float> &samples,
                                       std::size_t frame_samples,
                                       std::size_t hop_samples) {
  if (frame_samples == 0 || hop_samples == 0 || samples.size() < frame_samples) {
    return {};
  }
  const std::size_t frames = 1 + (samples.size() - frame_samples) / hop_samples;
  std::vector<double> envelope(frames, 0.0);
  for (std::size_t i = 0; i < frames; ++i) {
    envelope[i] = rms_range(samples, i * hop_samples, frame_samples);
  }
  return envelope;
}

std::size_t ms_to_samples(double ms, double sample_rate) {
  if (ms <= 0.0 || sample_rate <= 0.0) {
    return 0;
  }
  return static_cast<std::size_t>(std::lround(ms * sample_rate / 1000.0));
}

} // namespace gapit::detail
