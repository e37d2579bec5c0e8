// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"
#include "src/cookie.hpp"

namespace stage_pipe {

/// `middlewares.live_reload`
struct LiveReloadConfig {
    bool enabled = false;
};

/// `middlewares.session`
struct SessionConfig {
    std::string cookie_name = "id";
    std::string path = "/";
    bool secure = true;
    bool http_only = true;
    SameSite same_site = SameSite::Strict;
    std::optional<std::chrono::seconds> expiry;   ///< Inactivity expiry; unset = browser session
};

struct MiddlewareConfig {
    LiveReloadConfig live_reload;
    SessionConfig session;
};

/// Options consumed while building a pipeline.
///
/// Read once at construction time; nothing re-reads configuration per
/// request.
struct ProjectConfig {
    bool debug = false;
    MiddlewareConfig middlewares;
};

/// Parse a JSON configuration document.
///
/// Fails with ErrorCode::ConfigParse when the text is not JSON or the root
/// is not an object. Missing keys take their defaults; a key holding a
/// value of the wrong type is logged and also takes its default, so an
/// optional feature such as live reload stays disabled.
std::expected<ProjectConfig, Error> ParseConfig(std::string_view json);

/// Read and parse a configuration file (ErrorCode::ConfigIo if unreadable).
std::expected<ProjectConfig, Error> LoadConfig(const std::string& path);

}  // namespace stage_pipe
