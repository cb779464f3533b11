//
//  expansion_strategy.h
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <vector>

namespace gapit {

struct SearchWindow {
    double start_ms = 0.0;
    double end_ms = 0.0;
    double radius_ms = 0.0;
    std::size_t expansion_index = 0;
};

/// @brief Widening search windows around an expected onset.
///
/// Window `i` has radius `initial_radius + i * radius_increment`. Window 0
/// always starts at 0 ms so vocals at the very start of a song are reachable
/// on the first pass; later windows start at `expected - radius`. All windows
/// end at `expected + radius`, clamped to the total duration.
class ExpansionStrategy {
public:
    ExpansionStrategy(double initial_radius_ms,
                      double radius_increment_ms,
                      std::size_t max_expansions,
                      double total_duration_ms);

    /// @brief Returns `max_expansions + 1` windows, narrowest first.
    std::vector<SearchWindow> windows(double expected_ms) const;

    bool should_continue(std::size_t expansion_index, bool found) const;

    std::size_t max_expansions() const {
        return max_expansions_;
    }

private:
    double initial_radius_ms_ = 0.0;
    double radius_increment_ms_ = 0.0;
    std::size_t max_expansions_ = 0;
    double total_duration_ms_ = 0.0;
};

} // namespace gapit
