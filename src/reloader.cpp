// SPDX-License-Identifier: MIT

// src/reloader.cpp
#include "src/reloader.hpp"

#include <utility>

#include <fmt/format.h>

#include "lib/stream/log.hpp"
#include "src/random.hpp"

namespace stage_pipe {

Reloader::Reloader() : instance_(RandomHex<8>()) {}

std::size_t Reloader::Reload() {
    std::map<Ticket, Notify> waiters;
    std::string version;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        waiters.swap(waiters_);
        version = VersionLocked();
    }

    Logger()->info("live reload: version {}, notifying {} client(s)", version, waiters.size());
    for (auto& entry : waiters) {
        entry.second(version);
    }
    return waiters.size();
}

std::string Reloader::Version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return VersionLocked();
}

std::size_t Reloader::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

std::uint64_t Reloader::Generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

Reloader::Ticket Reloader::Wait(std::optional<std::string_view> seen_version, Notify notify) {
    std::string version;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        version = VersionLocked();
        if (!seen_version || *seen_version == version) {
            Ticket ticket = next_ticket_++;
            waiters_.emplace(ticket, std::move(notify));
            return ticket;
        }
    }
    Logger()->debug("live reload: client saw {}, current is {}", *seen_version, version);
    notify(version);
    return 0;
}

bool Reloader::Cancel(Ticket ticket) {
    Notify dropped;   // released outside the lock
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(ticket);
        if (it == waiters_.end()) return false;
        dropped = std::move(it->second);
        waiters_.erase(it);
    }
    Logger()->debug("live reload: client went away");
    return true;
}

std::string Reloader::VersionLocked() const {
    return fmt::format("{}-{}", instance_, generation_);
}

std::string ReloadScript(const ReloadOptions& options, std::string_view version) {
    return fmt::format(
        "<script>\n"
        "(function () {{\n"
        "  var url = \"{}?version={}\";\n"
        "  function poll() {{\n"
        "    fetch(url, {{ cache: \"no-store\" }}).then(function (res) {{\n"
        "      if (res.ok) {{ window.location.reload(); }}\n"
        "      else {{ setTimeout(poll, {}); }}\n"
        "    }}, function () {{ setTimeout(poll, {}); }});\n"
        "  }}\n"
        "  poll();\n"
        "}})();\n"
        "</script>\n",
        options.LongPollPath(), version,
        options.retry_interval.count(), options.retry_interval.count());
}

}  // namespace stage_pipe
