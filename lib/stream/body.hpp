// SPDX-License-Identifier: MIT

// lib/stream/body.hpp
#pragma once

#include <concepts>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "lib/stream/error.hpp"

namespace stage_pipe {

using Bytes = std::string;

// HttpBody interface - pull-based byte producer.
//
// NextChunk() yields the next chunk, std::nullopt at end of stream, or the
// body's own error. After end of stream or an error the body is not polled
// again.
template<typename B>
concept HttpBody = std::movable<B> && requires(B& b) {
    typename B::Error;
    requires ForeignError<typename B::Error>;
    { b.NextChunk() } -> std::same_as<std::expected<std::optional<Bytes>, typename B::Error>>;
};

/// Error type of bodies that cannot fail. Never constructed.
struct Infallible {
    const char* what() const noexcept { return "infallible"; }
};

/// Single-chunk body.
class FullBody {
public:
    using Error = Infallible;

    FullBody() = default;
    explicit FullBody(Bytes data) : data_(std::move(data)) {}

    std::expected<std::optional<Bytes>, Error> NextChunk() {
        if (!data_ || data_->empty()) {
            data_.reset();
            return std::optional<Bytes>{};
        }
        std::optional<Bytes> out = std::move(data_);
        data_.reset();
        return out;
    }

private:
    std::optional<Bytes> data_;
};

/// Body yielding a fixed sequence of chunks, optionally failing at the end.
template<typename E = Infallible>
    requires ForeignError<E>
class ChunkedBody {
public:
    using Error = E;

    ChunkedBody() = default;
    explicit ChunkedBody(std::deque<Bytes> chunks) : chunks_(std::move(chunks)) {}
    ChunkedBody(std::deque<Bytes> chunks, E failure)
        : chunks_(std::move(chunks)), failure_(std::move(failure)) {}

    std::expected<std::optional<Bytes>, Error> NextChunk() {
        if (!chunks_.empty()) {
            Bytes chunk = std::move(chunks_.front());
            chunks_.pop_front();
            return std::optional<Bytes>(std::move(chunk));
        }
        if (failure_) {
            E failure = std::move(*failure_);
            failure_.reset();
            return std::unexpected(std::move(failure));
        }
        return std::optional<Bytes>{};
    }

private:
    std::deque<Bytes> chunks_;
    std::optional<E> failure_;
};

/// Body adapter rewriting the error channel of another body.
template<HttpBody B, typename F>
    requires std::invocable<F&, typename B::Error>
class MapErrBody {
public:
    using Error = std::invoke_result_t<F&, typename B::Error>;

    MapErrBody(B body, F map) : body_(std::move(body)), map_(std::move(map)) {}

    std::expected<std::optional<Bytes>, Error> NextChunk() {
        auto chunk = body_.NextChunk();
        if (!chunk) return std::unexpected(std::invoke(map_, std::move(chunk.error())));
        return std::move(*chunk);
    }

private:
    B body_;
    F map_;
};

/// Canonical, type-erased response body.
///
/// Move-only; exclusively owned by the response that carries it.
/// A moved-from or default-constructed Body is empty.
class Body {
public:
    using Error = ::stage_pipe::Error;

    Body() = default;
    Body(Body&&) noexcept = default;
    Body& operator=(Body&&) noexcept = default;
    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;

    static Body Empty() { return Body(); }

    static Body Fixed(Bytes data) { return Wrap(MapErrBody(FullBody(std::move(data)), Unreachable)); }

    /// Box a body that already reports canonical errors.
    template<typename B>
        requires (!std::same_as<std::remove_cvref_t<B>, Body>) && HttpBody<B> &&
                 std::same_as<typename B::Error, Error>
    static Body Wrap(B body) {
        Body out;
        out.impl_ = std::make_unique<Model<B>>(std::move(body));
        return out;
    }

    std::expected<std::optional<Bytes>, Error> NextChunk() {
        if (!impl_) return std::optional<Bytes>{};
        return impl_->NextChunk();
    }

    /// Drain the remaining chunks into one buffer.
    std::expected<Bytes, Error> Collect() {
        Bytes out;
        for (;;) {
            auto chunk = NextChunk();
            if (!chunk) return std::unexpected(std::move(chunk.error()));
            if (!*chunk) return out;
            out += **chunk;
        }
    }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual std::expected<std::optional<Bytes>, Error> NextChunk() = 0;
    };

    template<typename B>
    struct Model final : Concept {
        explicit Model(B b) : body(std::move(b)) {}
        std::expected<std::optional<Bytes>, Error> NextChunk() override { return body.NextChunk(); }
        B body;
    };

    static Error Unreachable(Infallible) {
        return Error{ErrorCode::Internal, "infallible body reported an error"};
    }

    std::unique_ptr<Concept> impl_;
};

/// Convert any HttpBody into the canonical Body.
///
/// Body passes through untouched; a body already reporting canonical errors
/// is boxed as is; any other body has its errors normalized by WrapError.
template<HttpBody B>
Body ToBody(B body) {
    if constexpr (std::same_as<B, Body>) {
        return body;
    } else if constexpr (std::same_as<typename B::Error, Error>) {
        return Body::Wrap(std::move(body));
    } else {
        return Body::Wrap(MapErrBody(std::move(body), [](typename B::Error e) {
            return WrapError(std::move(e));
        }));
    }
}

static_assert(HttpBody<FullBody>, "FullBody must satisfy HttpBody");
static_assert(HttpBody<Body>, "Body must satisfy HttpBody");

}  // namespace stage_pipe
