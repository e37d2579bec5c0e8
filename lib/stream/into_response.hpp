// SPDX-License-Identifier: MIT

// lib/stream/into_response.hpp
#pragma once

#include <expected>
#include <utility>

#include "lib/stream/body.hpp"
#include "lib/stream/message.hpp"
#include "lib/stream/stage.hpp"

namespace stage_pipe {

/// Convert a response with any HttpBody into the canonical Response.
///
/// Only the body changes. Body errors are routed through WrapError, the same
/// normalization IntoError applies to stage errors.
template<HttpBody B>
Response IntoCanonicalResponse(BasicResponse<B> response) {
    return std::move(response).MapBody([](B body) { return ToBody(std::move(body)); });
}

// IntoResponse<S> - stage whose response body is the canonical Body.
//
// Readiness and errors pass through untouched. Structural conversion only:
// nothing here can fail and nothing is retained across calls.
template<HttpStage S>
class IntoResponse {
public:
    using Response = ::stage_pipe::Response;
    using Error = typename S::Error;

    explicit IntoResponse(S inner) : inner_(std::move(inner)) {}

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        return inner_.PollReady(waker);
    }

    void Call(Request request, Completion<Response, Error> done) {
        inner_.Call(std::move(request),
            [done = std::move(done)](std::expected<typename S::Response, Error> result) {
                if (!result) {
                    done(std::unexpected(std::move(result.error())));
                    return;
                }
                done(IntoCanonicalResponse(std::move(*result)));
            });
    }

    const S& inner() const { return inner_; }

private:
    S inner_;
};

/// Layer producing IntoResponse<S>.
struct IntoResponseLayer {
    template<HttpStage S>
    IntoResponse<S> Layer(S inner) const {
        return IntoResponse<S>(std::move(inner));
    }
};

}  // namespace stage_pipe
