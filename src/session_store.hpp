// SPDX-License-Identifier: MIT

// src/session_store.hpp
#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <stdexcept>

#include "src/session.hpp"

namespace stage_pipe {

/// Failure reported by a session store backend.
class SessionStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Abstract session storage.
///
/// Shared by every request flowing through a SessionStage, so
/// implementations must tolerate concurrent calls. Operations on distinct
/// ids must not interfere; no cross-id transactions are required.
/// See MemoryStore for the in-process implementation.
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /// Look up a session.
    /// @return The record, std::nullopt if unknown or expired.
    virtual std::expected<std::optional<SessionRecord>, SessionStoreError>
    Load(const SessionId& id) = 0;

    /// Insert or replace a record. A record without id gets a fresh,
    /// unused one.
    /// @return The id the record is stored under.
    virtual std::expected<SessionId, SessionStoreError> Save(const SessionRecord& record) = 0;

    /// Remove a record. Removing an unknown id is not an error.
    virtual std::expected<void, SessionStoreError> Delete(const SessionId& id) = 0;

    /// Clock that record expiry is measured against. SessionStage stamps
    /// SessionRecord::expires_at from it.
    virtual std::chrono::system_clock::time_point Now() const {
        return std::chrono::system_clock::now();
    }
};

}  // namespace stage_pipe
