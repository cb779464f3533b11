//
//  chunk_iterator.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <set>
#include <utility>

namespace gapit {

struct ChunkBoundary {
    double start_ms = 0.0;
    double end_ms = 0.0;

    double duration_ms() const {
        return end_ms - start_ms;
    }
};

/// @brief Boundaries compare by their whole-millisecond values.
bool operator==(const ChunkBoundary& lhs, const ChunkBoundary& rhs);
bool operator!=(const ChunkBoundary& lhs, const ChunkBoundary& rhs);

class ChunkIterator;

/// @brief Lazy boundary sequence for one search window.
///
/// Each `next()` call emits the next boundary not yet emitted by the owning
/// iterator and records it there. The sequence must not outlive its iterator.
class ChunkSequence {
public:
    bool next(ChunkBoundary* boundary);

private:
    friend class ChunkIterator;

    ChunkSequence(ChunkIterator* owner, double start_ms, double end_ms);

    ChunkIterator* owner_ = nullptr;
    double current_ms_ = 0.0;
    double end_ms_ = 0.0;
};

/// @brief Overlapping chunk boundaries with deduplication across windows.
///
/// Consecutive chunks start `chunk_duration_ms - chunk_overlap_ms` apart and
/// are clamped to the total duration. The dedup set persists across
/// `generate()` calls until `reset()`, so a boundary is emitted at most once
/// per scan even when search windows overlap.
class ChunkIterator {
public:
    ChunkIterator(double chunk_duration_ms, double chunk_overlap_ms, double total_duration_ms);

    ChunkSequence generate(double start_ms, double end_ms);
    void reset();

    std::size_t chunks_processed_count() const {
        return emitted_.size();
    }

    double hop_ms() const {
        return chunk_duration_ms_ - chunk_overlap_ms_;
    }

private:
    friend class ChunkSequence;

    using Key = std::pair<long long, long long>;

    static Key key_for(const ChunkBoundary& boundary);

    double chunk_duration_ms_ = 0.0;
    double chunk_overlap_ms_ = 0.0;
    double total_duration_ms_ = 0.0;
    std::set<Key> emitted_;
};

} // namespace gapit
