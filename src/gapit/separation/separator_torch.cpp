//
//  separator_torch.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/torch_separator.h"

#include "audio/dsp.h"
#include "gapit/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

#include <ATen/Context.h>
#include <c10/core/InferenceMode.h>
#include <torch/cuda.h>
#include <torch/script.h>

namespace gapit {
namespace {

std::string first_line(const std::string& message) {
    const std::size_t newline = message.find('\n');
    return newline == std::string::npos ? message : message.substr(0, newline);
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
        .count();
}

class TorchVocalSeparator final : public VocalSeparator {
public:
    explicit TorchVocalSeparator(const ScanConfig& config) : config_(config) {}

    const char* name() const override {
        return "torch";
    }

    bool separate(const Waveform& mixture,
                  double sample_rate,
                  Waveform* vocals,
                  SeparationTiming* timing,
                  std::string* error) override {
        if (!vocals) {
            return fail("missing output waveform", error);
        }
        if (mixture.empty() || sample_rate <= 0.0) {
            return fail("empty mixture or invalid sample rate", error);
        }
        if (!ensure_state(error)) {
            return false;
        }

        const auto resample_start = std::chrono::steady_clock::now();
        const Waveform stereo = detail::to_stereo(mixture);
        const Waveform model_input = detail::resample_linear(stereo, sample_rate, run_rate());
        if (timing) {
            timing->resample_ms += elapsed_ms(resample_start);
        }

        const std::size_t samples = model_input.frame_count();
        if (samples == 0) {
            return fail("resampled mixture is empty", error);
        }
        std::vector<float> planar(2 * samples, 0.0f);
        std::copy(model_input.channels[0].begin(), model_input.channels[0].end(), planar.begin());
        std::copy(model_input.channels[1].begin(),
                  model_input.channels[1].end(),
                  planar.begin() + static_cast<long>(samples));

        torch::Tensor stem;
        try {
            c10::InferenceMode inference_guard(true);
            torch::Tensor input =
                torch::from_blob(planar.data(), {1, 2, static_cast<long long>(samples)},
                                 torch::kFloat32)
                    .to(state_->device)
                    .clone();
            if (state_->half) {
                input = input.to(torch::kHalf);
            }

            const auto forward_start = std::chrono::steady_clock::now();
            torch::IValue output = state_->module.forward({input});
            if (timing) {
                timing->forward_ms += elapsed_ms(forward_start);
            }

            if (!output.isTensor()) {
                return fail("unexpected model output signature", error);
            }
            torch::Tensor sources = output.toTensor();
            if (sources.dim() != 4 || sources.size(0) < 1 ||
                sources.size(1) <= static_cast<long long>(config_.vocals_source_index)) {
                return fail("unexpected source tensor shape", error);
            }
            stem = sources[0][static_cast<long long>(config_.vocals_source_index)]
                       .to(torch::kCPU)
                       .to(torch::kFloat32)
                       .contiguous();
        } catch (const c10::Error& err) {
            return fail(std::string("forward failed: ") + first_line(err.what()), error);
        } catch (const std::exception& err) {
            return fail(std::string("forward exception: ") + first_line(err.what()), error);
        }

        if (stem.dim() != 2 || stem.size(0) < 1) {
            return fail("unexpected vocal stem shape", error);
        }
        const auto stem_channels = static_cast<std::size_t>(stem.size(0));
        const auto stem_samples = static_cast<std::size_t>(stem.size(1));
        const auto accessor = stem.accessor<float, 2>();
        Waveform model_vocals;
        model_vocals.channels.assign(stem_channels, std::vector<float>(stem_samples, 0.0f));
        for (std::size_t c = 0; c < stem_channels; ++c) {
            for (std::size_t i = 0; i < stem_samples; ++i) {
                model_vocals.channels[c][i] =
                    accessor[static_cast<long long>(c)][static_cast<long long>(i)];
            }
        }

        const auto back_start = std::chrono::steady_clock::now();
        *vocals = detail::resample_linear(model_vocals,
                                          static_cast<double>(run_rate()),
                                          static_cast<std::size_t>(std::lround(sample_rate)));
        for (auto& channel : vocals->channels) {
            channel.resize(mixture.frame_count(), 0.0f);
        }
        if (timing) {
            timing->resample_ms += elapsed_ms(back_start);
        }
        return true;
    }

private:
    struct TorchState {
        torch::jit::script::Module module;
        torch::Device device = torch::kCPU;
        bool half = false;
    };

    static bool fail(const std::string& message, std::string* error) {
        GAPIT_LOG_ERROR("Torch separator: " << message);
        if (error) {
            *error = message;
        }
        return false;
    }

    std::size_t run_rate() const {
        return config_.resample_hz > 0 ? config_.resample_hz : config_.model_sample_rate;
    }

    void configure_runtime(bool cuda) const {
        if (cuda) {
            at::globalContext().setBenchmarkCuDNN(true);
            if (config_.allow_tf32) {
                at::globalContext().setAllowTF32CuBLAS(true);
                at::globalContext().setAllowTF32CuDNN(true);
            }
            return;
        }
        std::size_t threads = config_.torch_threads;
        if (threads == 0) {
            const unsigned int cores = std::thread::hardware_concurrency();
            threads = cores > 1 ? cores - 1 : 1;
        }
        torch::set_num_threads(static_cast<int>(threads));
        GAPIT_LOG_DEBUG("Torch separator: cpu threads=" << threads);
    }

    void warm_up() {
        try {
            c10::InferenceMode inference_guard(true);
            torch::Tensor dummy = torch::zeros(
                {1, 2, static_cast<long long>(run_rate())},
                torch::TensorOptions().dtype(torch::kFloat32).device(state_->device));
            if (state_->half) {
                dummy = dummy.to(torch::kHalf);
            }
            const auto start = std::chrono::steady_clock::now();
            state_->module.forward({dummy});
            GAPIT_LOG_INFO("Torch separator: warm-up took " << elapsed_ms(start) << "ms");
        } catch (const c10::Error& err) {
            GAPIT_LOG_WARN("Torch separator: warm-up failed: " << first_line(err.what()));
        } catch (const std::exception& err) {
            GAPIT_LOG_WARN("Torch separator: warm-up exception: " << first_line(err.what()));
        }
    }

    bool ensure_state(std::string* error) {
        if (state_) {
            return true;
        }
        if (config_.model_path.empty()) {
            return fail("missing model path", error);
        }

        auto state = std::make_unique<TorchState>();
        if (config_.device == "cuda") {
            if (torch::cuda::is_available()) {
                state->device = torch::Device(torch::kCUDA);
            } else {
                GAPIT_LOG_WARN("Torch separator: CUDA unavailable, falling back to cpu.");
            }
        } else if (config_.device != "cpu") {
            GAPIT_LOG_WARN("Torch separator: unknown device '" << config_.device
                                                                << "', using cpu.");
        }

        try {
            state->module = torch::jit::load(config_.model_path, torch::kCPU);
            state->module.eval();
            state->module.to(torch::kFloat32);
            if (state->device.type() != torch::kCPU) {
                try {
                    state->module.to(state->device);
                } catch (const c10::Error& err) {
                    GAPIT_LOG_WARN("Torch separator: device move failed, falling back to cpu: "
                                   << first_line(err.what()));
                    state->device = torch::kCPU;
                }
            }
            if (config_.use_fp16) {
                if (state->device.is_cuda()) {
                    state->module.to(torch::kHalf);
                    state->half = true;
                } else {
                    GAPIT_LOG_WARN("Torch separator: fp16 requires cuda, running fp32.");
                }
            }
            configure_runtime(state->device.is_cuda());
        } catch (const c10::Error& err) {
            return fail("failed to load model " + config_.model_path + ": " +
                            first_line(err.what()),
                        error);
        } catch (const std::exception& err) {
            return fail("failed to load model " + config_.model_path + ": " + err.what(), error);
        }

        GAPIT_LOG_INFO("Torch separator: loaded " << config_.model_path << " on "
                                                  << state->device.str()
                                                  << (state->half ? " (fp16)" : ""));
        state_ = std::move(state);
        warm_up();
        return true;
    }

    ScanConfig config_;
    std::unique_ptr<TorchState> state_;
};

} // namespace

std::unique_ptr<VocalSeparator> make_torch_vocal_separator(const ScanConfig& config) {
    return std::make_unique<TorchVocalSeparator>(config);
}

} // namespace gapit
