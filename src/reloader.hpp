// SPDX-License-Identifier: MIT

// src/reloader.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace stage_pipe {

/// Where the live-reload endpoint lives and how clients reconnect.
struct ReloadOptions {
    std::string prefix = "/_stage_pipe/live-reload";
    std::chrono::milliseconds retry_interval{1000};   ///< Client retry delay after a failed poll

    std::string LongPollPath() const { return prefix + "/long-poll"; }
};

/// Reload signal shared between the host and every ReloadStage.
///
/// Clients long-poll with the version they were served. A poll carrying a
/// version that is no longer current is answered at once; any other poll
/// is parked until Reload(). The version embeds a per-process random
/// instance id, so clients reconnecting after a server restart reload too.
///
/// Thread-safe. Notifications run on the thread calling Reload(), outside
/// the internal lock.
class Reloader {
public:
    using Notify = std::function<void(const std::string& version)>;
    using Ticket = std::uint64_t;   ///< Handle of a parked poll; 0 means none

    Reloader();

    Reloader(const Reloader&) = delete;
    Reloader& operator=(const Reloader&) = delete;

    /// Bump the generation and notify every parked poll.
    /// @return Number of polls notified.
    std::size_t Reload();

    /// Current version, "<instance>-<generation>".
    std::string Version() const;

    /// Number of parked polls.
    std::size_t Pending() const;

    /// Reloads since construction.
    std::uint64_t Generation() const;

    /// Park `notify` until the next Reload(), or call it right away when
    /// `seen_version` is set and stale.
    /// @return Ticket for Cancel(), or 0 if `notify` already ran.
    Ticket Wait(std::optional<std::string_view> seen_version, Notify notify);

    /// Drop a parked poll without notifying it.
    /// @return false if it was already notified or cancelled.
    bool Cancel(Ticket ticket);

private:
    std::string VersionLocked() const;

    const std::string instance_;
    mutable std::mutex mutex_;
    std::uint64_t generation_ = 0;
    Ticket next_ticket_ = 1;
    std::map<Ticket, Notify> waiters_;
};

/// Client script appended to HTML pages. Polls the long-poll endpoint with
/// `version` and reloads the page once it answers.
std::string ReloadScript(const ReloadOptions& options, std::string_view version);

}  // namespace stage_pipe
