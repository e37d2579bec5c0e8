// SPDX-License-Identifier: MIT

// src/session.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stage_pipe {

/// Opaque session identifier: 128 random bits as 32 lowercase hex digits.
class SessionId {
public:
    static constexpr std::size_t kLength = 32;

    /// Fresh identifier from the system CSPRNG.
    /// @return std::nullopt if no secure randomness is available.
    static std::optional<SessionId> Generate();

    /// Validate untrusted input (e.g. a cookie value).
    /// @return std::nullopt unless `text` is exactly 32 lowercase hex digits.
    static std::optional<SessionId> Parse(std::string_view text);

    const std::string& str() const { return value_; }

    bool operator==(const SessionId&) const = default;

private:
    explicit SessionId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

struct SessionIdHash {
    std::size_t operator()(const SessionId& id) const {
        return std::hash<std::string>{}(id.str());
    }
};

using SessionData = std::map<std::string, std::string, std::less<>>;

/// Persistent form of a session as held by an ISessionStore.
struct SessionRecord {
    std::optional<SessionId> id;   ///< Unset until the first save
    SessionData data;
    std::optional<std::chrono::system_clock::time_point> expires_at;

    bool operator==(const SessionRecord&) const = default;
};

/// Request-scoped session handle.
///
/// Copies share state: the copy attached to the request extensions and the
/// copy held by SessionStage observe the same data. All members are
/// thread-safe because the inner chain may complete on another thread.
///
/// Mutations mark the session modified; SessionStage persists modified
/// sessions once the inner chain has produced a response.
class Session {
public:
    /// What SessionStage has to write back after the inner chain ran.
    struct Changes {
        bool modified = false;
        SessionRecord record;                ///< id unset when a new id is needed
        std::optional<SessionId> stale_id;   ///< Record to delete (flushed or cycled)
    };

    /// New, empty session without an id.
    Session();

    /// Session loaded from a store.
    explicit Session(SessionRecord record);

    std::optional<SessionId> Id() const;

    std::optional<std::string> Get(std::string_view key) const;

    /// Set `key`. Writing the value already stored is not a modification.
    void Insert(std::string key, std::string value);

    /// Erase `key`, returning its previous value.
    std::optional<std::string> Remove(std::string_view key);

    /// Drop all data. A stored session that ends up empty is deleted.
    void Clear();

    /// Drop all data and detach from the stored record, which is deleted.
    /// Data inserted afterwards is saved under a new id.
    void Flush();

    /// Keep the data but move it to a new id (e.g. after login).
    void CycleId();

    bool IsEmpty() const;
    bool IsModified() const;
    std::size_t Size() const;

    /// Snapshot the pending changes and reset the modified state.
    Changes TakeChanges();

    /// Record the id assigned by the store after a save.
    void Bind(SessionId id);

private:
    struct State {
        mutable std::mutex mutex;
        SessionRecord record;
        std::optional<SessionId> stale_id;
        bool modified = false;
    };

    void Detach(State& state);

    std::shared_ptr<State> state_;
};

}  // namespace stage_pipe
