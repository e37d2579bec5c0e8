// SPDX-License-Identifier: MIT

// src/cookie.cpp
#include "src/cookie.hpp"

#include <fmt/format.h>

namespace stage_pipe {

namespace {

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

}  // namespace

std::optional<SameSite> ParseSameSite(std::string_view text) {
    if (EqualsIgnoreCase(text, "strict")) return SameSite::Strict;
    if (EqualsIgnoreCase(text, "lax")) return SameSite::Lax;
    if (EqualsIgnoreCase(text, "none")) return SameSite::None;
    return std::nullopt;
}

std::optional<std::string> FindCookie(const Headers& headers, std::string_view name) {
    for (const auto& header : headers.GetAll("Cookie")) {
        std::string_view rest(header);
        while (!rest.empty()) {
            auto semi = rest.find(';');
            std::string_view pair = Trim(rest.substr(0, semi));
            rest = semi == std::string_view::npos ? std::string_view() : rest.substr(semi + 1);

            auto eq = pair.find('=');
            if (eq == std::string_view::npos) continue;
            if (Trim(pair.substr(0, eq)) != name) continue;

            std::string_view value = Trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return std::string(value);
        }
    }
    return std::nullopt;
}

SetCookie SetCookie::Removal() const {
    SetCookie cookie = *this;
    cookie.value.clear();
    cookie.max_age = std::chrono::seconds(0);
    return cookie;
}

std::string SetCookie::ToString() const {
    std::string out = fmt::format("{}={}", name, value);
    if (!path.empty()) out += fmt::format("; Path={}", path);
    if (max_age) out += fmt::format("; Max-Age={}", max_age->count());
    if (http_only) out += "; HttpOnly";
    if (secure) out += "; Secure";
    out += fmt::format("; SameSite={}", to_string(same_site));
    return out;
}

}  // namespace stage_pipe
