//
//  vocals_cache.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/vocals_cache.h"

#include "gapit/logging.hpp"

#include <utility>

namespace gapit {

VocalsCache::VocalsCache(std::size_t capacity) : capacity_(capacity) {}

bool VocalsCache::get(const std::string& file, double position_ms, CachedVocals* out) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->file != file) {
            continue;
        }
        if (position_ms >= it->value.start_ms && position_ms <= it->value.end_ms) {
            if (out) {
                *out = it->value;
            }
            return true;
        }
    }
    return false;
}

bool VocalsCache::find(const std::string& file,
                       double start_ms,
                       double end_ms,
                       CachedVocals* out) const {
    const long long start_key = static_cast<long long>(start_ms);
    const long long end_key = static_cast<long long>(end_ms);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->file == file &&
            static_cast<long long>(it->value.start_ms) == start_key &&
            static_cast<long long>(it->value.end_ms) == end_key) {
            if (out) {
                *out = it->value;
            }
            return true;
        }
    }
    return false;
}

void VocalsCache::put(const std::string& file,
                      double start_ms,
                      double end_ms,
                      std::shared_ptr<const Waveform> vocals,
                      double sample_rate) {
    if (capacity_ == 0 || !vocals) {
        return;
    }
    while (entries_.size() >= capacity_) {
        GAPIT_LOG_DEBUG("Vocals cache: evicting " << entries_.front().value.start_ms << "-"
                                                  << entries_.front().value.end_ms << "ms");
        entries_.pop_front();
    }

    Entry entry;
    entry.file = file;
    entry.value.vocals = std::move(vocals);
    entry.value.sample_rate = sample_rate;
    entry.value.start_ms = start_ms;
    entry.value.end_ms = end_ms;
    entries_.push_back(std::move(entry));
}

void VocalsCache::clear() {
    entries_.clear();
}

} // namespace gapit
