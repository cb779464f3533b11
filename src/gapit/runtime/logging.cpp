//
//  logging.cpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "gapit/logging.hpp"

#include "gapit/config.h"

#include <atomic>
#include <iostream>

namespace gapit {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

const char* level_tag(LogVerbosity level) {
    switch (level) {
    case LogVerbosity::Error:
        return "error";
    case LogVerbosity::Warn:
        return "warn";
    case LogVerbosity::Info:
        return "info";
    case LogVerbosity::Debug:
        return "debug";
    }
    return "debug";
}

} // namespace

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_verbosity_from_config(const ScanConfig& config) {
    if (config.verbose) {
        set_log_verbosity(LogVerbosity::Debug);
        return;
    }
    if (config.profile) {
        set_log_verbosity(LogVerbosity::Info);
        return;
    }
    set_log_verbosity(LogVerbosity::Warn);
}

namespace detail {

void write_log(LogVerbosity level, const std::string& message, const char* file, int line) {
    std::ostringstream prefix;
    prefix << "[GapIt][" << level_tag(level) << "]";
    if (level == LogVerbosity::Error) {
        prefix << "[" << file << ":" << line << "]";
    }
    prefix << " ";

    std::size_t start = 0;
    do {
        const std::size_t end = message.find('\n', start);
        const std::string text =
            message.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!text.empty() || start == 0) {
            std::cerr << prefix.str() << text << "\n";
        }
        start = end == std::string::npos ? message.size() + 1 : end + 1;
    } while (start <= message.size());
}

} // namespace detail

} // namespace gapit
