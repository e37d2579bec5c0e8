// SPDX-License-Identifier: MIT

// tests/layer_test.cpp
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "lib/stream/into_error.hpp"
#include "lib/stream/into_response.hpp"
#include "lib/stream/layer.hpp"
#include "tests/test_stages.hpp"

using namespace stage_pipe;
using namespace stage_pipe::testing;

namespace {

std::expected<Response, Error> Drive(auto& stage, std::string target = "/") {
    std::optional<std::expected<Response, Error>> result;
    Request request;
    request.target = std::move(target);
    stage.Call(std::move(request), Capture(result));
    return std::move(*result);
}

}  // namespace

TEST(StackTest, FirstLayerIsOutermost) {
    auto stage = Stack(TagLayer{"outer"}, TagLayer{"inner"}).Layer(SeenStage());
    auto response = Drive(stage);
    ASSERT_TRUE(response.has_value());

    // Request path: outer first. Response path: inner first.
    EXPECT_EQ(BodyText(*response), "outer,inner");
    EXPECT_EQ(response->headers.GetAll("X-Trace"), (std::vector<std::string>{"inner", "outer"}));
}

TEST(StackTest, EmptyStackIsIdentity) {
    auto stage = Stack<>().Layer(SeenStage());
    static_assert(std::same_as<decltype(stage), decltype(SeenStage())>);
    auto response = Drive(stage);
    EXPECT_EQ(BodyText(*response), "");
}

TEST(OptionLayerTest, EnabledAppliesLayer) {
    OptionLayer<TagLayer> layer(true, TagLayer{"opt"});
    EXPECT_TRUE(layer.IsEnabled());

    auto stage = layer.Layer(SeenStage());
    EXPECT_TRUE(stage.IsLeft());
    auto response = Drive(stage);
    EXPECT_EQ(BodyText(*response), "opt");
    EXPECT_EQ(response->headers.Get("X-Trace"), "opt");
}

TEST(OptionLayerTest, DisabledBehavesLikeInnerStage) {
    OptionLayer<TagLayer> layer(false, TagLayer{"opt"});
    EXPECT_FALSE(layer.IsEnabled());

    auto wrapped = layer.Layer(SeenStage());
    auto plain = SeenStage();
    EXPECT_TRUE(wrapped.IsRight());

    auto a = Drive(wrapped, "/x");
    auto b = Drive(plain, "/x");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->status, b->status);
    EXPECT_EQ(a->headers, b->headers);
    EXPECT_EQ(BodyText(*a), BodyText(*b));
}

TEST(OptionLayerTest, DisabledDelegatesReadiness) {
    ForeignStage foreign;
    foreign.state->pending = true;
    using Inner = IntoError<IntoResponse<ForeignStage>>;

    OptionLayer<TagLayer> layer(std::nullopt);
    auto stage = layer.Layer(Inner(IntoResponse<ForeignStage>(foreign)));

    bool woken = false;
    EXPECT_EQ(*stage.PollReady([&] { woken = true; }), Readiness::Pending);
    foreign.Wake();
    EXPECT_TRUE(woken);
}

TEST(OptionLayerTest, StackedOptionLayersCompose) {
    auto stage = Stack(OptionLayer<TagLayer>(true, TagLayer{"a"}),
                       OptionLayer<TagLayer>(false, TagLayer{"b"}),
                       OptionLayer<TagLayer>(true, TagLayer{"c"}))
                     .Layer(SeenStage());
    auto response = Drive(stage);
    EXPECT_EQ(BodyText(*response), "a,c");
}
