//
//  expansion_strategy.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/expansion_strategy.h"

#include <algorithm>

namespace gapit {

ExpansionStrategy::ExpansionStrategy(double initial_radius_ms,
                                     double radius_increment_ms,
                                     std::size_t max_expansions,
                                     double total_duration_ms)
    : initial_radius_ms_(initial_radius_ms),
      radius_increment_ms_(radius_increment_ms),
      max_expansions_(max_expansions),
      total_duration_ms_(std::max(0.0, total_duration_ms)) {}

std::vector<SearchWindow> ExpansionStrategy::windows(double expected_ms) const {
    std::vector<SearchWindow> result;
    result.reserve(max_expansions_ + 1);
    for (std::size_t i = 0; i <= max_expansions_; ++i) {
        SearchWindow window;
        window.expansion_index = i;
        window.radius_ms = initial_radius_ms_ + static_cast<double>(i) * radius_increment_ms_;
        window.start_ms = (i == 0) ? 0.0 : std::max(0.0, expected_ms - window.radius_ms);
        window.end_ms =
            std::clamp(expected_ms + window.radius_ms, 0.0, total_duration_ms_);
        // An expected position past the end would invert the window.
        window.start_ms = std::min(window.start_ms, window.end_ms);
        result.push_back(window);
    }
    return result;
}

bool ExpansionStrategy::should_continue(std::size_t expansion_index, bool found) const {
    if (found) {
        return false;
    }
    return expansion_index < max_expansions_;
}

} // namespace gapit
