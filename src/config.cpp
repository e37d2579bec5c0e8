// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "lib/stream/log.hpp"

namespace stage_pipe {

namespace {

using rapidjson::Value;

const Value* Member(const Value& object, const char* key) {
    auto it = object.FindMember(key);
    return it == object.MemberEnd() ? nullptr : &it->value;
}

// Nested object, nullptr when absent or not an object.
const Value* Section(const Value& parent, const char* key, std::string_view path) {
    const Value* value = Member(parent, key);
    if (!value) return nullptr;
    if (!value->IsObject()) {
        Logger()->warn("config: {}{} must be an object, ignoring it", path, key);
        return nullptr;
    }
    return value;
}

void ReadBool(const Value& object, const char* key, std::string_view path, bool& out) {
    const Value* value = Member(object, key);
    if (!value) return;
    if (!value->IsBool()) {
        Logger()->warn("config: {}{} must be a boolean, using {}", path, key, out);
        return;
    }
    out = value->GetBool();
}

void ReadString(const Value& object, const char* key, std::string_view path, std::string& out) {
    const Value* value = Member(object, key);
    if (!value) return;
    if (!value->IsString() || value->GetStringLength() == 0) {
        Logger()->warn("config: {}{} must be a non-empty string, using \"{}\"", path, key, out);
        return;
    }
    out.assign(value->GetString(), value->GetStringLength());
}

void ReadSessionConfig(const Value& object, SessionConfig& out) {
    constexpr std::string_view kPath = "middlewares.session.";
    ReadString(object, "cookie_name", kPath, out.cookie_name);
    ReadString(object, "path", kPath, out.path);
    ReadBool(object, "secure", kPath, out.secure);
    ReadBool(object, "http_only", kPath, out.http_only);

    if (const Value* value = Member(object, "same_site")) {
        std::optional<SameSite> parsed;
        if (value->IsString()) {
            parsed = ParseSameSite(std::string_view(value->GetString(), value->GetStringLength()));
        }
        if (parsed) {
            out.same_site = *parsed;
        } else {
            Logger()->warn("config: {}same_site must be one of strict, lax, none; using {}",
                           kPath, to_string(out.same_site));
        }
    }

    if (const Value* value = Member(object, "expiry_seconds")) {
        if (value->IsUint64() && value->GetUint64() > 0) {
            out.expiry = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(value->GetUint64()));
        } else if (!value->IsNull()) {
            Logger()->warn("config: {}expiry_seconds must be a positive integer, ignoring it", kPath);
        }
    }
}

}  // namespace

std::expected<ProjectConfig, Error> ParseConfig(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{
            ErrorCode::ConfigParse,
            fmt::format("config: {} at offset {}",
                        rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset())});
    }
    if (!doc.IsObject()) {
        return std::unexpected(Error{ErrorCode::ConfigParse, "config: root must be an object"});
    }

    ProjectConfig config;
    ReadBool(doc, "debug", "", config.debug);

    if (const Value* middlewares = Section(doc, "middlewares", "")) {
        if (const Value* live_reload = Section(*middlewares, "live_reload", "middlewares.")) {
            ReadBool(*live_reload, "enabled", "middlewares.live_reload.",
                     config.middlewares.live_reload.enabled);
        }
        if (const Value* session = Section(*middlewares, "session", "middlewares.")) {
            ReadSessionConfig(*session, config.middlewares.session);
        }
    }
    return config;
}

std::expected<ProjectConfig, Error> LoadConfig(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{ErrorCode::ConfigIo,
                                     fmt::format("config: cannot open {}", path)});
    }
    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(Error{ErrorCode::ConfigIo,
                                     fmt::format("config: failed reading {}", path)});
    }
    return ParseConfig(text.str());
}

}  // namespace stage_pipe
