// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stage_pipe {

inline constexpr const char* kLoggerName = "stage_pipe";

namespace detail {

inline std::mutex& LoggerMutex() {
    static std::mutex mutex;
    return mutex;
}

inline std::shared_ptr<spdlog::logger>& LoggerSlot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

}  // namespace detail

/// Library logger. Reuses a logger registered as "stage_pipe" if the host
/// created one, otherwise creates a stderr color logger on first use.
inline std::shared_ptr<spdlog::logger> Logger() {
    std::lock_guard<std::mutex> lock(detail::LoggerMutex());
    auto& slot = detail::LoggerSlot();
    if (!slot) {
        slot = spdlog::get(kLoggerName);
        if (!slot) slot = spdlog::stderr_color_mt(kLoggerName);
    }
    return slot;
}

/// Route library logging to `logger` (e.g. a null or test sink).
inline void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(detail::LoggerMutex());
    detail::LoggerSlot() = std::move(logger);
}

}  // namespace stage_pipe
