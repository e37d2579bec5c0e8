// SPDX-License-Identifier: MIT

// src/memory_store.cpp
#include "src/memory_store.hpp"

#include <utility>

#include "lib/stream/log.hpp"

namespace stage_pipe {

namespace {

bool IsExpired(const SessionRecord& record, std::chrono::system_clock::time_point now) {
    return record.expires_at && *record.expires_at <= now;
}

}  // namespace

MemoryStore::MemoryStore()
    : MemoryStore([] { return std::chrono::system_clock::now(); }) {}

MemoryStore::MemoryStore(Clock clock) : clock_(std::move(clock)) {}

std::expected<std::optional<SessionRecord>, SessionStoreError>
MemoryStore::Load(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) return std::optional<SessionRecord>{};
    if (IsExpired(it->second, clock_())) {
        records_.erase(it);
        return std::optional<SessionRecord>{};
    }
    return std::optional<SessionRecord>(it->second);
}

std::expected<SessionId, SessionStoreError> MemoryStore::Save(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (++saves_since_sweep_ >= kSweepInterval) {
        saves_since_sweep_ = 0;
        PurgeExpiredLocked(clock_());
    }

    SessionRecord stored = record;
    if (!stored.id) {
        std::optional<SessionId> id;
        do {
            id = SessionId::Generate();
            if (!id) return std::unexpected(SessionStoreError("no secure randomness for session id"));
        } while (records_.contains(*id));
        stored.id = std::move(id);
    }
    SessionId id = *stored.id;
    records_.insert_or_assign(id, std::move(stored));
    return id;
}

std::expected<void, SessionStoreError> MemoryStore::Delete(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(id);
    return {};
}

std::size_t MemoryStore::PurgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    saves_since_sweep_ = 0;
    return PurgeExpiredLocked(clock_());
}

std::size_t MemoryStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::size_t MemoryStore::PurgeExpiredLocked(std::chrono::system_clock::time_point now) {
    std::size_t removed = std::erase_if(records_, [now](const auto& entry) {
        return IsExpired(entry.second, now);
    });
    if (removed > 0) Logger()->debug("session: purged {} expired record(s)", removed);
    return removed;
}

}  // namespace stage_pipe
