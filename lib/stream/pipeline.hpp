// SPDX-License-Identifier: MIT

// lib/stream/pipeline.hpp
#pragma once

#include <utility>

#include "lib/stream/boxed_stage.hpp"
#include "lib/stream/into_error.hpp"
#include "lib/stream/into_response.hpp"
#include "lib/stream/layer.hpp"
#include "lib/stream/stage.hpp"

namespace stage_pipe {

// PipelineBuilder - assembles a canonical pipeline around a handler.
//
// Each Middleware(layer) call wraps the current pipeline as
//   IntoError(IntoResponse(layer(current)))
// and boxes the result, so a layer may produce any body and any foreign
// error type while the pipeline keeps a single canonical type. The last
// middleware added is the outermost one.
//
// @code
// auto pipeline = PipelineBuilder(MakeStage(handler))
//                     .Middleware(SessionLayer())
//                     .Middleware(LiveReloadLayer::FromConfig(config))
//                     .Build();
// @endcode
class PipelineBuilder {
public:
    template<typename H>
        requires CanonicalStage<H>
    explicit PipelineBuilder(H handler) : stage_(std::move(handler)) {}

    template<typename L>
        requires LayerFor<L, BoxedStage>
    PipelineBuilder& Middleware(L layer) & {
        Apply(std::move(layer));
        return *this;
    }

    template<typename L>
        requires LayerFor<L, BoxedStage>
    PipelineBuilder&& Middleware(L layer) && {
        Apply(std::move(layer));
        return std::move(*this);
    }

    BoxedStage Build() && { return std::move(stage_); }

private:
    template<typename L>
    void Apply(L layer) {
        auto stack = Stack(IntoErrorLayer{}, IntoResponseLayer{}, std::move(layer));
        stage_ = BoxedStage(stack.Layer(std::move(stage_)));
    }

    BoxedStage stage_;
};

}  // namespace stage_pipe
