//
//  chunk_iterator.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/chunk_iterator.h"

#include "gapit/logging.hpp"

#include <algorithm>

namespace gapit {

bool operator==(const ChunkBoundary& lhs, const ChunkBoundary& rhs) {
    return static_cast<long long>(lhs.start_ms) == static_cast<long long>(rhs.start_ms) &&
           static_cast<long long>(lhs.end_ms) == static_cast<long long>(rhs.end_ms);
}

bool operator!=(const ChunkBoundary& lhs, const ChunkBoundary& rhs) {
    return !(lhs == rhs);
}

ChunkSequence::ChunkSequence(ChunkIterator* owner, double start_ms, double end_ms)
    : owner_(owner), current_ms_(start_ms), end_ms_(end_ms) {}

bool ChunkSequence::next(ChunkBoundary* boundary) {
    if (!owner_ || !boundary) {
        return false;
    }
    const double hop = owner_->hop_ms();
    if (hop <= 0.0) {
        return false;
    }

    while (current_ms_ < end_ms_ && current_ms_ < owner_->total_duration_ms_) {
        ChunkBoundary candidate;
        candidate.start_ms = current_ms_;
        candidate.end_ms =
            std::min(current_ms_ + owner_->chunk_duration_ms_, owner_->total_duration_ms_);
        current_ms_ += hop;

        if (!owner_->emitted_.insert(ChunkIterator::key_for(candidate)).second) {
            GAPIT_LOG_DEBUG("Chunk " << candidate.start_ms << "-" << candidate.end_ms
                                     << "ms already scanned, skipping.");
            continue;
        }
        *boundary = candidate;
        return true;
    }
    return false;
}

ChunkIterator::ChunkIterator(double chunk_duration_ms,
                             double chunk_overlap_ms,
                             double total_duration_ms)
    : chunk_duration_ms_(chunk_duration_ms),
      chunk_overlap_ms_(chunk_overlap_ms),
      total_duration_ms_(total_duration_ms) {}

ChunkSequence ChunkIterator::generate(double start_ms, double end_ms) {
    return ChunkSequence(this, std::max(0.0, start_ms), end_ms);
}

void ChunkIterator::reset() {
    emitted_.clear();
}

ChunkIterator::Key ChunkIterator::key_for(const ChunkBoundary& boundary) {
    return {static_cast<long long>(boundary.start_ms), static_cast<long long>(boundary.end_ms)};
}

} // namespace gapit
