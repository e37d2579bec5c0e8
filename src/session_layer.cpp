// SPDX-License-Identifier: MIT

// src/session_layer.cpp
#include "src/session_layer.hpp"

#include "lib/stream/log.hpp"
#include "src/memory_store.hpp"

namespace stage_pipe {

namespace detail {

namespace {

SetCookie CookieFor(const SessionConfig& config, std::string value) {
    SetCookie cookie;
    cookie.name = config.cookie_name;
    cookie.value = std::move(value);
    cookie.path = config.path;
    cookie.http_only = config.http_only;
    cookie.secure = config.secure;
    cookie.same_site = config.same_site;
    return cookie;
}

}  // namespace

std::expected<Session, Error> ResolveSession(ISessionStore& store,
                                             const std::optional<std::string>& cookie) {
    if (!cookie) return Session();

    std::optional<SessionId> id = SessionId::Parse(*cookie);
    if (!id) {
        Logger()->debug("session: ignoring malformed session cookie");
        return Session();
    }

    auto loaded = store.Load(*id);
    if (!loaded) {
        Logger()->error("session: failed to load session: {}", loaded.error().what());
        return std::unexpected(WrapError(std::move(loaded.error())));
    }
    if (!*loaded) return Session();
    return Session(std::move(**loaded));
}

std::expected<void, Error> PersistSession(ISessionStore& store, const SessionConfig& config,
                                          Session& session, bool had_cookie,
                                          Response& response) {
    Session::Changes changes = session.TakeChanges();

    // With an inactivity expiry every request that sees a stored session
    // pushes its deadline out, so it is re-saved even when unmodified.
    bool refresh = !changes.modified && config.expiry && changes.record.id &&
                   !changes.record.data.empty();
    if (!changes.modified && !refresh) return {};

    if (changes.stale_id) {
        Logger()->debug("session: dropping detached session record");
        if (auto deleted = store.Delete(*changes.stale_id); !deleted) {
            Logger()->error("session: failed to delete session: {}", deleted.error().what());
            return std::unexpected(WrapError(std::move(deleted.error())));
        }
    }

    if (changes.record.data.empty()) {
        if (changes.record.id) {
            if (auto deleted = store.Delete(*changes.record.id); !deleted) {
                Logger()->error("session: failed to delete session: {}", deleted.error().what());
                return std::unexpected(WrapError(std::move(deleted.error())));
            }
        }
        if (changes.record.id || changes.stale_id || had_cookie) {
            response.headers.Append("Set-Cookie", CookieFor(config, "").Removal().ToString());
        }
        return {};
    }

    if (config.expiry) {
        changes.record.expires_at = store.Now() + *config.expiry;
    }
    auto saved = store.Save(changes.record);
    if (!saved) {
        Logger()->error("session: failed to save session: {}", saved.error().what());
        return std::unexpected(WrapError(std::move(saved.error())));
    }
    if (!changes.record.id) Logger()->debug("session: stored new session");
    session.Bind(*saved);

    SetCookie cookie = CookieFor(config, saved->str());
    cookie.max_age = config.expiry;
    response.headers.Append("Set-Cookie", cookie.ToString());
    return {};
}

}  // namespace detail

SessionLayer::SessionLayer()
    : SessionLayer(std::make_shared<MemoryStore>()) {}

SessionLayer::SessionLayer(std::shared_ptr<ISessionStore> store, SessionConfig config)
    : store_(std::move(store)),
      config_(std::make_shared<const SessionConfig>(std::move(config))) {
    if (!store_) store_ = std::make_shared<MemoryStore>();
}

SessionLayer SessionLayer::FromConfig(const ProjectConfig& config,
                                      std::shared_ptr<ISessionStore> store) {
    return SessionLayer(std::move(store), config.middlewares.session);
}

}  // namespace stage_pipe
