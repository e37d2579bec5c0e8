// SPDX-License-Identifier: MIT

// lib/stream/boxed_stage.hpp
#pragma once

#include <concepts>
#include <expected>
#include <memory>
#include <type_traits>
#include <utility>

#include "lib/stream/stage.hpp"

namespace stage_pipe {

/// Type-erased canonical stage.
///
/// Costs one virtual call per PollReady()/Call(). Used where a pipeline has
/// to be stored or rebuilt without spelling out its full static type.
/// Move-only; a moved-from BoxedStage must not be polled or called.
class BoxedStage {
public:
    using Response = ::stage_pipe::Response;
    using Error = ::stage_pipe::Error;

    template<typename S>
        requires (!std::same_as<std::remove_cvref_t<S>, BoxedStage>) &&
                 CanonicalStage<std::remove_cvref_t<S>>
    explicit BoxedStage(S&& stage)
        : impl_(std::make_unique<Model<std::remove_cvref_t<S>>>(std::forward<S>(stage))) {}

    BoxedStage(BoxedStage&&) noexcept = default;
    BoxedStage& operator=(BoxedStage&&) noexcept = default;
    BoxedStage(const BoxedStage&) = delete;
    BoxedStage& operator=(const BoxedStage&) = delete;

    std::expected<Readiness, Error> PollReady(const Waker& waker) {
        return impl_->PollReady(waker);
    }

    void Call(Request request, Completion<Response, Error> done) {
        impl_->Call(std::move(request), std::move(done));
    }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual std::expected<Readiness, Error> PollReady(const Waker& waker) = 0;
        virtual void Call(Request request, Completion<Response, Error> done) = 0;
    };

    template<typename S>
    struct Model final : Concept {
        template<typename U>
        explicit Model(U&& s) : stage(std::forward<U>(s)) {}

        std::expected<Readiness, Error> PollReady(const Waker& waker) override {
            return stage.PollReady(waker);
        }
        void Call(Request request, Completion<Response, Error> done) override {
            stage.Call(std::move(request), std::move(done));
        }

        S stage;
    };

    std::unique_ptr<Concept> impl_;
};

static_assert(CanonicalStage<BoxedStage>, "BoxedStage must satisfy CanonicalStage");

}  // namespace stage_pipe
