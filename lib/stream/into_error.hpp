// SPDX-License-Identifier: MIT

// lib/stream/into_error.hpp
#pragma once

#include <expected>
#include <utility>

#include "lib/stream/error.hpp"
#include "lib/stream/stage.hpp"

namespace stage_pipe {

// IntoError<S> - stage whose error type is the canonical Error.
//
// Failures from PollReady() and Call() go through WrapError, which boxes a
// foreign error as the cause of ErrorCode::MiddlewareWrapped and returns an
// already canonical Error unchanged. Success paths are not touched.
template<Stage S>
    requires ForeignError<typename S::Error>
class IntoError {
public:
    using Response = typename S::Response;
    using Error = ::stage_pipe::Error;

    explicit IntoError(S inner) : inner_(std::move(inner)) {}

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        auto ready = inner_.PollReady(waker);
        if (!ready) return std::unexpected(WrapError(std::move(ready.error())));
        return *ready;
    }

    void Call(Request request, Completion<Response, Error> done) {
        inner_.Call(std::move(request),
            [done = std::move(done)](std::expected<Response, typename S::Error> result) {
                if (!result) {
                    done(std::unexpected(WrapError(std::move(result.error()))));
                    return;
                }
                done(std::move(*result));
            });
    }

    const S& inner() const { return inner_; }

private:
    S inner_;
};

/// Layer producing IntoError<S>.
struct IntoErrorLayer {
    template<Stage S>
        requires ForeignError<typename S::Error>
    IntoError<S> Layer(S inner) const {
        return IntoError<S>(std::move(inner));
    }
};

}  // namespace stage_pipe
