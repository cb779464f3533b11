//
//  torch_separator_test.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/logging.hpp"
#include "gapit/torch_separator.h"

#include <torch/script.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

gapit::Waveform make_mixture(std::size_t frames) {
    gapit::Waveform mixture;
    mixture.channels.assign(2, std::vector<float>(frames, 0.1f));
    return mixture;
}

bool test_missing_model_path() {
    gapit::ScanConfig config;
    auto separator = gapit::make_torch_vocal_separator(config);
    if (!separator || std::string(separator->name()) != "torch") {
        std::cerr << "Torch separator test failed: factory.\n";
        return false;
    }
    gapit::Waveform vocals;
    std::string error;
    if (separator->separate(make_mixture(4410), 44100.0, &vocals, nullptr, &error)) {
        std::cerr << "Torch separator test failed: separation without a model succeeded.\n";
        return false;
    }
    if (error.find("model path") == std::string::npos) {
        std::cerr << "Torch separator test failed: unexpected error '" << error << "'.\n";
        return false;
    }
    return true;
}

bool test_unreadable_model() {
    gapit::ScanConfig config;
    config.model_path = "/nonexistent/gapit/vocals.pt";
    auto separator = gapit::make_torch_vocal_separator(config);
    gapit::Waveform vocals;
    std::string error;
    if (separator->separate(make_mixture(4410), 44100.0, &vocals, nullptr, &error) ||
        error.find("failed to load model") == std::string::npos) {
        std::cerr << "Torch separator test failed: unreadable model not reported.\n";
        return false;
    }
    if (separator->separate(gapit::Waveform{}, 44100.0, &vocals, nullptr, &error)) {
        std::cerr << "Torch separator test failed: empty mixture accepted.\n";
        return false;
    }
    return true;
}

// Saves a scripted module with the given forward body.
std::filesystem::path save_scripted_model(const char* file_name, const std::string& forward) {
    const auto path = std::filesystem::temp_directory_path() / file_name;
    torch::jit::Module module("GapItTestModel");
    module.define(forward);
    module.save(path.string());
    return path;
}

bool test_scripted_four_source_model() {
    // Every source is a copy of the mixture; source 3 comes back as vocals.
    const auto path = save_scripted_model("gapit_four_source_model.pt",
                                          "def forward(self, x):\n"
                                          "    return x.unsqueeze(1).repeat([1, 4, 1, 1])\n");
    gapit::ScanConfig config;
    config.model_path = path.string();
    config.torch_threads = 1;
    auto separator = gapit::make_torch_vocal_separator(config);

    gapit::Waveform mixture;
    mixture.channels.assign(2, std::vector<float>(44100, 0.0f));
    for (std::size_t i = 0; i < mixture.channels[0].size(); ++i) {
        mixture.channels[0][i] = 0.25f * std::sin(static_cast<float>(i) * 0.01f);
        mixture.channels[1][i] = -0.5f * std::sin(static_cast<float>(i) * 0.02f);
    }

    gapit::Waveform vocals;
    gapit::SeparationTiming timing;
    std::string error;
    const bool ok = separator->separate(mixture, 44100.0, &vocals, &timing, &error);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (!ok) {
        std::cerr << "Torch separator test failed: scripted model: " << error << "\n";
        return false;
    }
    if (vocals.channel_count() != 2 || vocals.frame_count() != mixture.frame_count()) {
        std::cerr << "Torch separator test failed: scripted model stem shape.\n";
        return false;
    }
    for (std::size_t c = 0; c < 2; ++c) {
        for (std::size_t i = 0; i < vocals.frame_count(); i += 997) {
            if (std::fabs(vocals.channels[c][i] - mixture.channels[c][i]) > 1e-5f) {
                std::cerr << "Torch separator test failed: vocals differ from source 3 at "
                          << c << ":" << i << ".\n";
                return false;
            }
        }
    }
    return true;
}

bool test_model_errors_are_returned() {
    const auto path = save_scripted_model("gapit_raising_model.pt",
                                          "def forward(self, x):\n"
                                          "    if x.size(2) > 0:\n"
                                          "        raise Exception(\"unsupported input\")\n"
                                          "    return x\n");
    gapit::ScanConfig config;
    config.model_path = path.string();
    config.torch_threads = 1;
    auto separator = gapit::make_torch_vocal_separator(config);

    gapit::Waveform vocals;
    std::string error;
    bool separated = true;
    try {
        separated = separator->separate(make_mixture(4410), 44100.0, &vocals, nullptr, &error);
    } catch (const std::exception& err) {
        std::cerr << "Torch separator test failed: exception escaped: " << err.what() << "\n";
        return false;
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (separated || error.find("forward") == std::string::npos) {
        std::cerr << "Torch separator test failed: raising model not reported, error '"
                  << error << "'.\n";
        return false;
    }
    return true;
}

// Runs a real model when GAPIT_TEST_MODEL points at a TorchScript export.
bool test_model_forward() {
    const char* model = std::getenv("GAPIT_TEST_MODEL");
    if (!model || !*model) {
        return true;
    }
    gapit::ScanConfig config;
    config.model_path = model;
    auto separator = gapit::make_torch_vocal_separator(config);
    gapit::Waveform vocals;
    gapit::SeparationTiming timing;
    std::string error;
    const std::size_t frames = 44100 * 2;
    if (!separator->separate(make_mixture(frames), 44100.0, &vocals, &timing, &error)) {
        std::cerr << "Torch separator test failed: forward: " << error << "\n";
        return false;
    }
    if (vocals.channel_count() != 2 || vocals.frame_count() != frames) {
        std::cerr << "Torch separator test failed: vocal stem shape.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    gapit::set_log_verbosity(gapit::LogVerbosity::Error);
    if (!test_missing_model_path()) {
        return 1;
    }
    if (!test_unreadable_model()) {
        return 1;
    }
    if (!test_scripted_four_source_model()) {
        return 1;
    }
    if (!test_model_errors_are_returned()) {
        return 1;
    }
    if (!test_model_forward()) {
        return 1;
    }

    std::cout << "Torch separator test passed.\n";
    return 0;
}
