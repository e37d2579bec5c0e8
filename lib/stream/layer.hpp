// SPDX-License-Identifier: MIT

// lib/stream/layer.hpp
#pragma once

#include <optional>
#include <utility>

#include "lib/stream/either.hpp"
#include "lib/stream/stage.hpp"

namespace stage_pipe {

/// Layer that returns its input unchanged.
struct Identity {
    template<Stage S>
    S Layer(S inner) const {
        return inner;
    }
};

// Stack<L1, L2, ..., Ln> - composition of layers.
//
// L1 ends up outermost: Stack(L1, L2).Layer(s) == L1.Layer(L2.Layer(s)).
// A request therefore meets L1 first on the way in and last on the way out.
template<typename... Ls>
class Stack;

template<>
class Stack<> : public Identity {};

template<typename Outer, typename... Rest>
class Stack<Outer, Rest...> {
public:
    explicit Stack(Outer outer, Rest... rest)
        : outer_(std::move(outer)), rest_(std::move(rest)...) {}

    template<Stage S>
    auto Layer(S inner) const {
        return outer_.Layer(rest_.Layer(std::move(inner)));
    }

private:
    Outer outer_;
    Stack<Rest...> rest_;
};

template<typename... Ls>
Stack(Ls...) -> Stack<Ls...>;

// OptionLayer<L> - applies L or nothing, decided once at construction.
//
// Layer(inner) always returns Either<Layered<L, S>, S>:
// - enabled:  Left, the wrapped chain built by L around `inner`
// - disabled: Right, `inner` itself; requests go straight to the next stage
//   and the chain L would build is never constructed.
template<typename L>
class OptionLayer {
public:
    explicit OptionLayer(std::optional<L> layer) : layer_(std::move(layer)) {}

    OptionLayer(bool enabled, L layer)
        : layer_(enabled ? std::optional<L>(std::move(layer)) : std::nullopt) {}

    bool IsEnabled() const { return layer_.has_value(); }

    template<Stage S>
        requires LayerFor<L, S>
    Either<Layered<L, S>, S> Layer(S inner) const {
        using Result = Either<Layered<L, S>, S>;
        if (layer_) return Result::Left(layer_->Layer(std::move(inner)));
        return Result::Right(std::move(inner));
    }

private:
    std::optional<L> layer_;
};

}  // namespace stage_pipe
