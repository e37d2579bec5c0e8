// SPDX-License-Identifier: MIT

// lib/stream/message.hpp
#pragma once

#include <algorithm>
#include <any>
#include <cctype>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lib/stream/body.hpp"
#include "lib/stream/cancel.hpp"

namespace stage_pipe {

/// ASCII case-insensitive comparison used for header names.
inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Ordered header multimap with case-insensitive names.
class Headers {
public:
    using Entry = std::pair<std::string, std::string>;

    Headers() = default;
    Headers(std::initializer_list<Entry> entries) : entries_(entries) {}

    /// First value for `name`, std::nullopt if absent.
    std::optional<std::string> Get(std::string_view name) const {
        for (const auto& [key, value] : entries_) {
            if (EqualsIgnoreCase(key, name)) return value;
        }
        return std::nullopt;
    }

    std::vector<std::string> GetAll(std::string_view name) const {
        std::vector<std::string> out;
        for (const auto& [key, value] : entries_) {
            if (EqualsIgnoreCase(key, name)) out.push_back(value);
        }
        return out;
    }

    bool Contains(std::string_view name) const { return Get(name).has_value(); }

    /// Replace every value of `name` with a single one.
    void Set(std::string name, std::string value) {
        Remove(name);
        entries_.emplace_back(std::move(name), std::move(value));
    }

    void Append(std::string name, std::string value) {
        entries_.emplace_back(std::move(name), std::move(value));
    }

    /// Remove every value of `name`. Returns the number removed.
    std::size_t Remove(std::string_view name) {
        auto it = std::remove_if(entries_.begin(), entries_.end(), [&](const Entry& e) {
            return EqualsIgnoreCase(e.first, name);
        });
        std::size_t removed = static_cast<std::size_t>(std::distance(it, entries_.end()));
        entries_.erase(it, entries_.end());
        return removed;
    }

    std::size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    bool operator==(const Headers&) const = default;

private:
    std::vector<Entry> entries_;
};

/// Type-keyed request context. Holds at most one value per type.
class Extensions {
public:
    template<typename T>
    void Insert(T value) {
        values_[std::type_index(typeid(T))] = std::move(value);
    }

    /// Pointer to the stored T, nullptr if none.
    template<typename T>
    T* Get() {
        auto it = values_.find(std::type_index(typeid(T)));
        return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    template<typename T>
    const T* Get() const {
        auto it = values_.find(std::type_index(typeid(T)));
        return it == values_.end() ? nullptr : std::any_cast<T>(&it->second);
    }

    template<typename T>
    std::optional<T> Remove() {
        auto it = values_.find(std::type_index(typeid(T)));
        if (it == values_.end()) return std::nullopt;
        std::optional<T> out(std::move(*std::any_cast<T>(&it->second)));
        values_.erase(it);
        return out;
    }

    std::size_t Size() const { return values_.size(); }

private:
    std::unordered_map<std::type_index, std::any> values_;
};

/// Canonical inbound message.
struct Request {
    std::string method = "GET";
    std::string target = "/";      ///< Path with optional query string
    Headers headers;
    Bytes body;
    Extensions extensions;
    CancelToken cancel;             ///< Fired when the host drops the request

    /// Target without its query string.
    std::string_view Path() const {
        std::string_view t(target);
        return t.substr(0, t.find('?'));
    }

    /// Query string without the leading '?', empty if none.
    std::string_view Query() const {
        std::string_view t(target);
        auto pos = t.find('?');
        return pos == std::string_view::npos ? std::string_view() : t.substr(pos + 1);
    }
};

/// Outbound message generic over its body representation.
///
/// Foreign stages produce BasicResponse<B> for their own body types;
/// IntoResponse converts those into the canonical Response.
template<typename B>
struct BasicResponse {
    int status = 200;
    Headers headers;
    B body;

    /// Replace the body, keeping status and headers.
    template<typename F>
    auto MapBody(F&& f) && -> BasicResponse<std::invoke_result_t<F, B>> {
        return {status, std::move(headers), std::invoke(std::forward<F>(f), std::move(body))};
    }
};

using Response = BasicResponse<Body>;

template<typename R>
struct IsBasicResponse : std::false_type {};

template<typename B>
struct IsBasicResponse<BasicResponse<B>> : std::true_type {
    using BodyType = B;
};

/// Canonical response with a fixed body.
inline Response MakeResponse(int status, Bytes body = {}, std::string content_type = "text/plain") {
    Response response{status, {}, Body::Fixed(std::move(body))};
    if (!content_type.empty()) response.headers.Set("Content-Type", std::move(content_type));
    return response;
}

}  // namespace stage_pipe
