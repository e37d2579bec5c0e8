// SPDX-License-Identifier: MIT

// lib/stream/sink.hpp
#pragma once

#include <atomic>
#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <utility>

#include "lib/stream/cancel.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/stage.hpp"

namespace stage_pipe {

/// Concept for the minimal sink lifecycle: result delivery and invalidation.
template<typename S>
concept SingleResultSink = requires(S& s) {
    typename S::ResultType;
    { s.OnResult(std::declval<std::expected<typename S::ResultType, Error>>()) } -> std::same_as<void>;
    { s.Invalidate() } -> std::same_as<void>;
};

/// Host-side receiver of one pipeline outcome.
///
/// Bind() hands out a Completion that forwards into the sink. Delivery
/// happens at most once; later deliveries and anything arriving after
/// Invalidate() are dropped, so a host that loses interest in a request
/// (connection closed, timeout) invalidates the sink and the pipeline's
/// eventual completion becomes a no-op. The bound completion holds only a
/// weak reference: destroying the sink has the same effect.
///
/// Bind(request) also ties the request's CancelToken to the sink, so stages
/// holding the request parked are told when either happens.
template<typename Result>
class ResultSink : public std::enable_shared_from_this<ResultSink<Result>> {
public:
    using ResultType = Result;
    using Callback = std::function<void(std::expected<Result, Error>)>;

    static std::shared_ptr<ResultSink> Create(Callback on_result) {
        return std::shared_ptr<ResultSink>(new ResultSink(std::move(on_result)));
    }

    ~ResultSink() {
        if (!IsDelivered()) cancel_.Cancel();
    }

    void OnResult(std::expected<Result, Error> result) {
        if (!valid_.load(std::memory_order_acquire)) return;
        if (delivered_.exchange(true, std::memory_order_acq_rel)) return;
        on_result_(std::move(result));
    }

    /// Completion bound to this sink.
    Completion<Result, Error> Bind() {
        std::weak_ptr<ResultSink> weak = this->weak_from_this();
        return [weak](std::expected<Result, Error> result) {
            if (auto self = weak.lock()) self->OnResult(std::move(result));
        };
    }

    /// Completion bound to this sink, with `request` cancelled whenever the
    /// sink is invalidated or destroyed before delivery.
    Completion<Result, Error> Bind(Request& request) {
        request.cancel = cancel_;
        return Bind();
    }

    /// Atomically disable all future deliveries and cancel bound requests.
    void Invalidate() {
        valid_.store(false, std::memory_order_release);
        cancel_.Cancel();
    }

    bool IsDelivered() const { return delivered_.load(std::memory_order_acquire); }

private:
    explicit ResultSink(Callback on_result) : on_result_(std::move(on_result)) {}

    Callback on_result_;
    CancelToken cancel_;
    std::atomic<bool> valid_{true};
    std::atomic<bool> delivered_{false};
};

static_assert(SingleResultSink<ResultSink<Response>>, "ResultSink must satisfy SingleResultSink");

}  // namespace stage_pipe
