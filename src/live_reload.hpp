// SPDX-License-Identifier: MIT

// src/live_reload.hpp
#pragma once

#ifndef STAGE_PIPE_LIVE_RELOAD
#error "live reload is disabled in this build (configure with -DSTAGE_PIPE_LIVE_RELOAD=ON)"
#endif

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lib/stream/body.hpp"
#include "lib/stream/into_error.hpp"
#include "lib/stream/into_response.hpp"
#include "lib/stream/layer.hpp"
#include "lib/stream/message.hpp"
#include "lib/stream/stage.hpp"
#include "src/config.hpp"
#include "src/reloader.hpp"

namespace stage_pipe {

// ReloadBody<B> - body of responses leaving a ReloadStage.
//
// Either the inner body untouched, the inner body followed by the client
// script, or a short text produced by the stage itself. The script is only
// emitted after the inner body reached its end; an inner error stops the
// stream before it.
template<HttpBody B>
class ReloadBody {
public:
    using Error = typename B::Error;

    static ReloadBody Text(Bytes text) {
        return ReloadBody(std::nullopt, std::move(text));
    }

    static ReloadBody Passthrough(B inner) {
        return ReloadBody(std::move(inner), std::nullopt);
    }

    static ReloadBody Injected(B inner, Bytes script) {
        return ReloadBody(std::move(inner), std::move(script));
    }

    bool IsInjected() const { return inner_.has_value() && tail_.has_value(); }

    std::expected<std::optional<Bytes>, Error> NextChunk() {
        if (inner_) {
            auto chunk = inner_->NextChunk();
            if (!chunk) {
                inner_.reset();
                tail_.reset();
                return std::unexpected(std::move(chunk.error()));
            }
            if (*chunk) return std::move(*chunk);
            inner_.reset();
        }
        if (tail_) {
            std::optional<Bytes> out = std::move(tail_);
            tail_.reset();
            if (!out->empty()) return out;
        }
        return std::optional<Bytes>{};
    }

private:
    ReloadBody(std::optional<B> inner, std::optional<Bytes> tail)
        : inner_(std::move(inner)), tail_(std::move(tail)) {}

    std::optional<B> inner_;
    std::optional<Bytes> tail_;
};

namespace detail {

inline bool IsHtml(const Headers& headers) {
    auto type = headers.Get("Content-Type");
    if (!type || type->size() < 9) return false;
    return EqualsIgnoreCase(std::string_view(*type).substr(0, 9), "text/html");
}

/// Value of `version` in a query string, if present.
inline std::optional<std::string_view> QueryVersion(std::string_view query) {
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
        if (pair.starts_with("version=")) return pair.substr(8);
    }
    return std::nullopt;
}

}  // namespace detail

// ReloadStage<S> - serves the long-poll endpoint and injects the client
// script into HTML pages produced by S.
//
// Long polls never reach S; they stay parked in the Reloader until the
// next reload or until the request's CancelToken fires. Everything else
// does; successful text/html responses without Content-Encoding get the
// script appended and lose their Content-Length. Readiness and errors are
// those of S.
template<HttpStage S>
class ReloadStage {
public:
    using InnerBody = BodyOf<S>;
    using Response = BasicResponse<ReloadBody<InnerBody>>;
    using Error = typename S::Error;

    ReloadStage(S inner, std::shared_ptr<Reloader> reloader,
                std::shared_ptr<const ReloadOptions> options)
        : inner_(std::move(inner)), reloader_(std::move(reloader)), options_(std::move(options)) {}

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        return inner_.PollReady(waker);
    }

    void Call(Request request, Completion<Response, Error> done) {
        if (request.method == "GET" && request.Path() == options_->LongPollPath()) {
            Reloader::Ticket ticket = reloader_->Wait(detail::QueryVersion(request.Query()),
                [done = std::move(done)](const std::string& version) {
                    Response response{200, {}, ReloadBody<InnerBody>::Text(version)};
                    response.headers.Set("Content-Type", "text/plain");
                    response.headers.Set("Cache-Control", "no-store");
                    done(std::move(response));
                });
            if (ticket != 0) {
                std::weak_ptr<Reloader> weak = reloader_;
                request.cancel.OnCancel([weak, ticket] {
                    if (auto reloader = weak.lock()) reloader->Cancel(ticket);
                });
            }
            return;
        }

        std::string script = ReloadScript(*options_, reloader_->Version());
        inner_.Call(std::move(request),
            [script = std::move(script), done = std::move(done)](
                std::expected<typename S::Response, Error> result) mutable {
                if (!result) {
                    done(std::unexpected(std::move(result.error())));
                    return;
                }
                bool inject = result->status >= 200 && result->status < 300 &&
                              detail::IsHtml(result->headers) &&
                              !result->headers.Contains("Content-Encoding");
                if (inject) result->headers.Remove("Content-Length");
                done(std::move(*result).MapBody([&](InnerBody body) {
                    if (inject) return ReloadBody<InnerBody>::Injected(std::move(body), std::move(script));
                    return ReloadBody<InnerBody>::Passthrough(std::move(body));
                }));
            });
    }

private:
    S inner_;
    std::shared_ptr<Reloader> reloader_;
    std::shared_ptr<const ReloadOptions> options_;
};

/// Layer producing ReloadStage<S>. Stages built from one layer share its
/// Reloader.
class ReloadLayer {
public:
    explicit ReloadLayer(std::shared_ptr<Reloader> reloader, ReloadOptions options = {})
        : reloader_(std::move(reloader)),
          options_(std::make_shared<const ReloadOptions>(std::move(options))) {}

    template<HttpStage S>
    ReloadStage<S> Layer(S inner) const {
        return ReloadStage<S>(std::move(inner), reloader_, options_);
    }

    const std::shared_ptr<Reloader>& reloader() const { return reloader_; }

private:
    std::shared_ptr<Reloader> reloader_;
    std::shared_ptr<const ReloadOptions> options_;
};

// LiveReloadLayer - the live-reload middleware, switched on or off once.
//
// Enabled, it wraps the next stage in ReloadStage and adapts the result
// back to the canonical Response and Error. Disabled, the next stage is
// used as is.
class LiveReloadLayer {
public:
    using Chain = Stack<IntoErrorLayer, IntoResponseLayer, ReloadLayer>;

    LiveReloadLayer() : LiveReloadLayer(true, ReloadOptions{}) {}

    LiveReloadLayer(bool enabled, ReloadOptions options)
        : reloader_(std::make_shared<Reloader>()),
          options_(std::move(options)),
          layer_(enabled, MakeChain(reloader_, options_)) {}

    /// Enabled iff `middlewares.live_reload.enabled` is true.
    static LiveReloadLayer FromConfig(const ProjectConfig& config, ReloadOptions options = {}) {
        return LiveReloadLayer(config.middlewares.live_reload.enabled, std::move(options));
    }

    LiveReloadLayer WithEnabled(bool enabled) const {
        LiveReloadLayer copy = *this;
        if (enabled != copy.IsEnabled()) {
            copy.layer_ = OptionLayer<Chain>(enabled, MakeChain(reloader_, options_));
        }
        return copy;
    }

    bool IsEnabled() const { return layer_.IsEnabled(); }

    const ReloadOptions& options() const { return options_; }

    /// Handle to trigger reloads. Valid whether or not the layer is enabled.
    const std::shared_ptr<Reloader>& reloader() const { return reloader_; }

    template<CanonicalStage S>
    auto Layer(S inner) const {
        return layer_.Layer(std::move(inner));
    }

private:
    static Chain MakeChain(std::shared_ptr<Reloader> reloader, ReloadOptions options) {
        return Chain(IntoErrorLayer{}, IntoResponseLayer{},
                     ReloadLayer(std::move(reloader), std::move(options)));
    }

    std::shared_ptr<Reloader> reloader_;
    ReloadOptions options_;
    OptionLayer<Chain> layer_;
};

}  // namespace stage_pipe
