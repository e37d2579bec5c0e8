// SPDX-License-Identifier: MIT

// src/memory_store.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "src/session_store.hpp"

namespace stage_pipe {

/// In-process session store.
///
/// Process lifetime only: nothing survives a restart. Used by SessionLayer
/// when no store is injected, as a placeholder until a durable store is
/// configured. A single mutex guards the map.
///
/// Expired records are dropped when loaded, and by a sweep over the whole
/// map every kSweepInterval saves, so ids that never come back do not
/// accumulate.
class MemoryStore : public ISessionStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr std::size_t kSweepInterval = 64;

    MemoryStore();
    explicit MemoryStore(Clock clock);

    std::expected<std::optional<SessionRecord>, SessionStoreError>
    Load(const SessionId& id) override;

    std::expected<SessionId, SessionStoreError> Save(const SessionRecord& record) override;

    std::expected<void, SessionStoreError> Delete(const SessionId& id) override;

    std::chrono::system_clock::time_point Now() const override { return clock_(); }

    /// Drop every expired record.
    /// @return Number of records removed.
    std::size_t PurgeExpired();

    /// Number of records currently held, expired ones included.
    std::size_t Size() const;

private:
    std::size_t PurgeExpiredLocked(std::chrono::system_clock::time_point now);

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<SessionId, SessionRecord, SessionIdHash> records_;
    std::size_t saves_since_sweep_ = 0;
};

}  // namespace stage_pipe
