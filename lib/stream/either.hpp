// SPDX-License-Identifier: MIT

// lib/stream/either.hpp
#pragma once

#include <concepts>
#include <expected>
#include <utility>
#include <variant>

#include "lib/stream/stage.hpp"

namespace stage_pipe {

// Either<A, B> - a stage that is exactly one of two stages.
//
// The active alternative is chosen at construction and never changes, so
// both readiness and call dispatch on immutable state. A and B must agree
// on Response and Error; that is what keeps the composed type stable
// whichever branch is taken.
template<Stage A, Stage B>
    requires std::same_as<typename A::Response, typename B::Response> &&
             std::same_as<typename A::Error, typename B::Error>
class Either {
public:
    using Response = typename A::Response;
    using Error = typename A::Error;

    static Either Left(A stage) { return Either(std::in_place_index<0>, std::move(stage)); }
    static Either Right(B stage) { return Either(std::in_place_index<1>, std::move(stage)); }

    bool IsLeft() const { return inner_.index() == 0; }
    bool IsRight() const { return inner_.index() == 1; }

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        return std::visit([&](auto& stage) { return stage.PollReady(waker); }, inner_);
    }

    void Call(Request request, Completion<Response, Error> done) {
        std::visit([&](auto& stage) { stage.Call(std::move(request), std::move(done)); }, inner_);
    }

private:
    template<std::size_t I, typename S>
    Either(std::in_place_index_t<I> tag, S stage) : inner_(tag, std::move(stage)) {}

    std::variant<A, B> inner_;
};

}  // namespace stage_pipe
