// SPDX-License-Identifier: MIT

// lib/stream/stage.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/message.hpp"

namespace stage_pipe {

/// Outcome of a readiness check.
enum class Readiness {
    Ready,    ///< Exactly one Call() may follow
    Pending,  ///< No capacity yet; the waker fires once there is
};

/// Invoked by a pending stage when it may have become ready.
using Waker = std::function<void()>;

/// One-shot result callback delivered exactly once per Call().
template<typename T, typename E = Error>
using Completion = std::function<void(std::expected<T, E>)>;

// Stage interface - the processing-unit contract.
//
// - PollReady(waker): non-blocking capacity check. Pending keeps the waker and
//   invokes it later. A failure is reported in the error alternative.
// - Call(request, done): consumes the request and eventually invokes `done`
//   with the response or error, exactly once, possibly on another thread.
//
// Call() must follow a Ready from PollReady(); one call per readiness check.
// This is a contract, not runtime-checked.
template<typename S>
concept Stage = std::move_constructible<S> &&
    requires {
        typename S::Response;
        typename S::Error;
    } &&
    requires(S& s, const Waker& waker, Request request,
             Completion<typename S::Response, typename S::Error> done) {
        { s.PollReady(waker) } -> std::same_as<std::expected<Readiness, typename S::Error>>;
        { s.Call(std::move(request), std::move(done)) } -> std::same_as<void>;
    };

// CanonicalStage - a stage the host can execute without adaptation.
template<typename S>
concept CanonicalStage = Stage<S> &&
    std::same_as<typename S::Response, Response> &&
    std::same_as<typename S::Error, Error>;

// HttpStage - responds with BasicResponse<B> for some HttpBody B.
template<typename S>
concept HttpStage = Stage<S> &&
    IsBasicResponse<typename S::Response>::value &&
    HttpBody<typename IsBasicResponse<typename S::Response>::BodyType>;

template<HttpStage S>
using BodyOf = typename IsBasicResponse<typename S::Response>::BodyType;

// LayerFor - a stage factory applicable to S.
template<typename L, typename S>
concept LayerFor = Stage<S> && requires(const L& layer, S inner) {
    { layer.Layer(std::move(inner)) } -> Stage;
};

template<typename L, typename S>
    requires LayerFor<L, S>
using Layered = decltype(std::declval<const L&>().Layer(std::declval<S>()));

namespace detail {

template<Stage S>
class OneshotCall : public std::enable_shared_from_this<OneshotCall<S>> {
public:
    using Done = Completion<typename S::Response, typename S::Error>;

    OneshotCall(S& stage, Request request, Done done)
        : stage_(stage), request_(std::move(request)), done_(std::move(done)) {}

    void Poll() {
        if (called_) return;
        std::weak_ptr<OneshotCall> weak = this->weak_from_this();
        auto ready = stage_.PollReady([weak] {
            if (auto self = weak.lock()) self->Poll();
        });
        if (called_) return;  // reentrant wake already dispatched the call
        if (!ready) {
            called_ = true;
            done_(std::unexpected(std::move(ready.error())));
            return;
        }
        if (*ready == Readiness::Pending) {
            parked_ = this->shared_from_this();
            return;
        }
        called_ = true;
        auto keep = std::move(parked_);
        stage_.Call(std::move(request_), std::move(done_));
    }

private:
    S& stage_;
    Request request_;
    Done done_;
    bool called_ = false;
    std::shared_ptr<OneshotCall> parked_;  // self-reference while waiting for a wake
};

}  // namespace detail

/// Drive one request through a stage, honouring readiness.
///
/// Polls `stage`; when ready, calls it. When pending, the call is dispatched
/// from the waker. A readiness failure is delivered to `done`.
/// The stage must outlive the call, and wakers must run on the thread that
/// drives the stage.
template<Stage S>
void Oneshot(S& stage, Request request,
             Completion<typename S::Response, typename S::Error> done) {
    auto call = std::make_shared<detail::OneshotCall<S>>(stage, std::move(request), std::move(done));
    call->Poll();
}

}  // namespace stage_pipe
