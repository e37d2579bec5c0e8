// SPDX-License-Identifier: MIT

// lib/stream/stage_fn.hpp
#pragma once

#include <concepts>
#include <expected>
#include <type_traits>
#include <utility>

#include "lib/stream/stage.hpp"

namespace stage_pipe {

// StageFn<F> - terminal canonical stage backed by a callable.
//
// F is either
//   expected<Response, Error> f(Request)             (synchronous), or
//   void f(Request, Completion<Response>)            (asynchronous).
// Always ready.
template<typename F>
class StageFn {
public:
    using Response = ::stage_pipe::Response;
    using Error = ::stage_pipe::Error;

    static constexpr bool kAsync = std::is_invocable_v<F&, Request, Completion<Response, Error>>;
    static_assert(kAsync || std::is_invocable_r_v<std::expected<Response, Error>, F&, Request>,
                  "StageFn callable must be f(Request) -> expected<Response, Error> "
                  "or f(Request, Completion<Response>)");

    explicit StageFn(F fn) : fn_(std::move(fn)) {}

    std::expected<Readiness, Error> PollReady(const Waker&) { return Readiness::Ready; }

    void Call(Request request, Completion<Response, Error> done) {
        if constexpr (kAsync) {
            fn_(std::move(request), std::move(done));
        } else {
            done(fn_(std::move(request)));
        }
    }

private:
    F fn_;
};

template<typename F>
StageFn<std::decay_t<F>> MakeStage(F&& fn) {
    return StageFn<std::decay_t<F>>(std::forward<F>(fn));
}

}  // namespace stage_pipe
