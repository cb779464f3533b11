//
//  scan_test_utils.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/audio_loader.h"
#include "gapit/separator.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gapit::tests {

// Serves waveforms registered under a path.
class MemoryAudioLoader final : public AudioChunkLoader {
public:
    void add(const std::string& path, Waveform waveform, double sample_rate) {
        files_[path] = {std::move(waveform), sample_rate};
    }

    // Loads starting at this frame fail.
    void fail_load_at(unsigned long long start_frame) {
        failing_starts_.insert(start_frame);
    }

    bool probe(const std::string& path, AudioInfo* info, std::string* error) override {
        ++probe_calls;
        const auto it = files_.find(path);
        if (it == files_.end()) {
            if (error) {
                *error = "no such file";
            }
            return false;
        }
        if (info) {
            info->sample_rate = it->second.second;
            info->channels = it->second.first.channel_count();
            info->frames = it->second.first.frame_count();
        }
        return true;
    }

    bool load(const std::string& path,
              unsigned long long start_frame,
              unsigned long long frame_count,
              Waveform* waveform,
              double* sample_rate,
              std::string* error) override {
        const auto it = files_.find(path);
        if (it == files_.end() || failing_starts_.count(start_frame) > 0) {
            if (error) {
                *error = "load refused";
            }
            return false;
        }
        const Waveform& source = it->second.first;
        const std::size_t total = source.frame_count();
        if (start_frame >= total) {
            if (error) {
                *error = "start beyond end";
            }
            return false;
        }
        const std::size_t end =
            std::min<std::size_t>(total, static_cast<std::size_t>(start_frame + frame_count));
        waveform->channels.clear();
        for (const auto& channel : source.channels) {
            waveform->channels.emplace_back(channel.begin() + static_cast<long>(start_frame),
                                            channel.begin() + static_cast<long>(end));
        }
        *sample_rate = it->second.second;
        loaded_starts.push_back(start_frame);
        return true;
    }

    std::size_t probe_calls = 0;
    std::vector<unsigned long long> loaded_starts;

private:
    std::map<std::string, std::pair<Waveform, double>> files_;
    std::set<unsigned long long> failing_starts_;
};

// Treats the whole mixture as vocals.
class PassthroughSeparator final : public VocalSeparator {
public:
    const char* name() const override {
        return "passthrough";
    }

    bool separate(const Waveform& mixture,
                  double sample_rate,
                  Waveform* vocals,
                  SeparationTiming* timing,
                  std::string* error) override {
        (void)sample_rate;
        (void)timing;
        ++calls;
        if (fail_all || (fail_call > 0 && calls == fail_call)) {
            if (error) {
                *error = "model error";
            }
            return false;
        }
        *vocals = mixture;
        return true;
    }

    std::size_t calls = 0;
    std::size_t fail_call = 0;
    bool fail_all = false;
};

} // namespace gapit::tests
