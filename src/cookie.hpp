// SPDX-License-Identifier: MIT

// src/cookie.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "lib/stream/message.hpp"

namespace stage_pipe {

enum class SameSite { Strict, Lax, None };

constexpr std::string_view to_string(SameSite same_site) {
    switch (same_site) {
        case SameSite::Strict: return "Strict";
        case SameSite::Lax: return "Lax";
        case SameSite::None: return "None";
    }
    return "Strict";
}

/// Case-insensitive "strict" / "lax" / "none".
std::optional<SameSite> ParseSameSite(std::string_view text);

/// Value of cookie `name` from the request's Cookie headers.
/// The first occurrence wins; surrounding quotes are stripped.
std::optional<std::string> FindCookie(const Headers& headers, std::string_view name);

/// A Set-Cookie header value.
struct SetCookie {
    std::string name;
    std::string value;
    std::string path = "/";
    bool http_only = true;
    bool secure = true;
    SameSite same_site = SameSite::Strict;
    std::optional<std::chrono::seconds> max_age;

    /// Same cookie with an empty value and Max-Age=0, instructing the
    /// client to drop it. Path and attributes must match the original.
    SetCookie Removal() const;

    std::string ToString() const;
};

}  // namespace stage_pipe
