//
//  logging.hpp
//  GapIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <sstream>
#include <string>

namespace gapit {

struct ScanConfig;

/// @brief Logging level policy for GapIt.
///
/// - `Error`: the requested scan or export cannot complete (unreadable
///   source, invalid configuration, model that cannot be loaded).
/// - `Warn`: a skipped chunk, a confidence fallback, a device fallback.
/// - `Info`: per-scan summaries and timing lines.
/// - `Debug`: per-chunk traces, cache hits, detector thresholds.
enum class LogVerbosity {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

/// @brief Debug when `verbose`, Info when `profile`, Warn otherwise.
void set_log_verbosity_from_config(const ScanConfig& config);

inline bool log_enabled(LogVerbosity level) {
    return static_cast<int>(level) <= static_cast<int>(get_log_verbosity());
}

namespace detail {

// Writes `message` to stderr, one prefixed line per text line. Errors carry
// their source location.
void write_log(LogVerbosity level, const std::string& message, const char* file, int line);

} // namespace detail

/// @brief Collects a message over several `<<` and writes it on destruction.
class LogStream {
public:
    LogStream(LogVerbosity level, const char* file, int line)
        : level_(level), file_(file), line_(line), enabled_(log_enabled(level)) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

    ~LogStream() {
        if (enabled_) {
            detail::write_log(level_, stream_.str(), file_, line_);
        }
    }

private:
    LogVerbosity level_;
    const char* file_;
    int line_;
    bool enabled_;
    std::ostringstream stream_;
};

} // namespace gapit

#define GAPIT_LOG(level, message)                                                   \
    do {                                                                            \
        if (::gapit::log_enabled(level)) {                                          \
            std::ostringstream _gapit_log_stream;                                   \
            _gapit_log_stream << message;                                           \
            ::gapit::detail::write_log(level, _gapit_log_stream.str(), __FILE__,    \
                                       __LINE__);                                   \
        }                                                                           \
    } while (0)

#define GAPIT_LOG_ERROR(message) GAPIT_LOG(::gapit::LogVerbosity::Error, message)
#define GAPIT_LOG_WARN(message) GAPIT_LOG(::gapit::LogVerbosity::Warn, message)
#define GAPIT_LOG_INFO(message) GAPIT_LOG(::gapit::LogVerbosity::Info, message)
#define GAPIT_LOG_DEBUG(message) GAPIT_LOG(::gapit::LogVerbosity::Debug, message)

#define GAPIT_LOG_INFO_STREAM() \
    ::gapit::LogStream(::gapit::LogVerbosity::Info, __FILE__, __LINE__)
