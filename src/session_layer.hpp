// SPDX-License-Identifier: MIT

// src/session_layer.hpp
#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/message.hpp"
#include "lib/stream/stage.hpp"
#include "src/config.hpp"
#include "src/cookie.hpp"
#include "src/session.hpp"
#include "src/session_store.hpp"

namespace stage_pipe {

namespace detail {

/// Session for an incoming session cookie value.
///
/// A missing or malformed id, or one the store does not know, yields a new
/// empty session. Store failures come back as MiddlewareWrapped errors.
std::expected<Session, Error> ResolveSession(ISessionStore& store,
                                             const std::optional<std::string>& cookie);

/// Write back a session after the inner chain produced `response`.
///
/// Unmodified sessions cost nothing unless an inactivity expiry is set, in
/// which case a stored session is re-saved to push its deadline out.
/// Otherwise the stale record is deleted, an emptied session is removed
/// together with its cookie, and anything else is saved and its id sent in
/// a Set-Cookie header. Deadlines come from ISessionStore::Now().
std::expected<void, Error> PersistSession(ISessionStore& store, const SessionConfig& config,
                                          Session& session, bool had_cookie,
                                          Response& response);

}  // namespace detail

// SessionStage<S> - attaches a store-backed Session to every request.
//
// On the way in the session is resolved from the cookie and inserted into
// request.extensions; on the way out a modified session is persisted and
// its id set on the response. Failed inner calls are forwarded without
// touching the store.
template<CanonicalStage S>
class SessionStage {
public:
    using Response = ::stage_pipe::Response;
    using Error = ::stage_pipe::Error;

    SessionStage(S inner, std::shared_ptr<ISessionStore> store,
                 std::shared_ptr<const SessionConfig> config)
        : inner_(std::move(inner)), store_(std::move(store)), config_(std::move(config)) {}

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        return inner_.PollReady(waker);
    }

    void Call(Request request, Completion<Response, Error> done) {
        std::optional<std::string> cookie = FindCookie(request.headers, config_->cookie_name);
        auto session = detail::ResolveSession(*store_, cookie);
        if (!session) {
            done(std::unexpected(std::move(session.error())));
            return;
        }
        request.extensions.Insert(*session);

        inner_.Call(std::move(request),
            [store = store_, config = config_, session = *session,
             had_cookie = cookie.has_value(), done = std::move(done)](
                std::expected<Response, Error> result) mutable {
                if (!result) {
                    done(std::move(result));
                    return;
                }
                auto persisted = detail::PersistSession(*store, *config, session, had_cookie, *result);
                if (!persisted) {
                    done(std::unexpected(std::move(persisted.error())));
                    return;
                }
                done(std::move(result));
            });
    }

private:
    S inner_;
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<const SessionConfig> config_;
};

/// Layer producing SessionStage<S>.
///
/// Every stage built from one layer shares the layer's store.
class SessionLayer {
public:
    /// Backed by a fresh MemoryStore: in-process and lost on restart.
    SessionLayer();

    explicit SessionLayer(std::shared_ptr<ISessionStore> store, SessionConfig config = {});

    /// Cookie and expiry settings from `middlewares.session`.
    static SessionLayer FromConfig(const ProjectConfig& config,
                                   std::shared_ptr<ISessionStore> store = nullptr);

    template<CanonicalStage S>
    SessionStage<S> Layer(S inner) const {
        return SessionStage<S>(std::move(inner), store_, config_);
    }

    const std::shared_ptr<ISessionStore>& store() const { return store_; }
    const SessionConfig& config() const { return *config_; }

private:
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<const SessionConfig> config_;
};

}  // namespace stage_pipe
