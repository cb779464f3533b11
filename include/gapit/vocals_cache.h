//
//  vocals_cache.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "gapit/waveform.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

namespace gapit {

struct CachedVocals {
    std::shared_ptr<const Waveform> vocals;
    double sample_rate = 0.0;
    double start_ms = 0.0;
    double end_ms = 0.0;
};

/// @brief Bounded store of isolated-vocal chunks keyed by (file, start, end).
///
/// Eviction is by insertion order, not by access. Entries are immutable once
/// inserted. Not synchronized; one cache instance serves one song at a time.
class VocalsCache {
public:
    static constexpr std::size_t kDefaultCapacity = 6;

    explicit VocalsCache(std::size_t capacity = kDefaultCapacity);

    /// @brief Find an entry for `file` whose range covers `position_ms`.
    ///
    /// Entries are scanned newest first, so a lookup right after `put()` with
    /// a covered position returns the waveform just inserted.
    bool get(const std::string& file, double position_ms, CachedVocals* out) const;

    /// @brief Exact-key lookup on whole-millisecond start and end.
    bool find(const std::string& file, double start_ms, double end_ms, CachedVocals* out) const;

    void put(const std::string& file,
             double start_ms,
             double end_ms,
             std::shared_ptr<const Waveform> vocals,
             double sample_rate);

    void clear();

    std::size_t size() const {
        return entries_.size();
    }

    std::size_t capacity() const {
        return capacity_;
    }

private:
    struct Entry {
        std::string file;
        CachedVocals value;
    };

    std::size_t capacity_ = kDefaultCapacity;
    std::deque<Entry> entries_;
};

} // namespace gapit
