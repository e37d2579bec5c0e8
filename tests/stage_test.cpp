// SPDX-License-Identifier: MIT

// tests/stage_test.cpp
#include <expected>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "lib/stream/stage.hpp"
#include "lib/stream/stage_fn.hpp"
#include "tests/test_stages.hpp"

using namespace stage_pipe;
using namespace stage_pipe::testing;

static_assert(Stage<ForeignStage>);
static_assert(!CanonicalStage<ForeignStage>);
static_assert(CanonicalStage<decltype(EchoStage())>);

TEST(StageFnTest, SynchronousHandler) {
    auto stage = EchoStage();
    auto ready = stage.PollReady([] {});
    ASSERT_TRUE(ready.has_value());
    EXPECT_EQ(*ready, Readiness::Ready);

    std::optional<std::expected<Response, Error>> result;
    Request request;
    request.target = "/hello";
    stage.Call(std::move(request), Capture(result));

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ(BodyText(**result), "/hello");
}

TEST(StageFnTest, AsynchronousHandler) {
    Completion<Response, Error> parked;
    auto stage = MakeStage([&](Request, Completion<Response, Error> done) {
        parked = std::move(done);
    });

    std::optional<std::expected<Response, Error>> result;
    stage.Call(Request{}, Capture(result));
    EXPECT_FALSE(result.has_value());

    parked(MakeResponse(204));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)->status, 204);
}

TEST(StageFnTest, HandlerErrorIsDelivered) {
    auto stage = MakeStage([](Request) -> std::expected<Response, Error> {
        return std::unexpected(Error{ErrorCode::Internal, "nope"});
    });
    std::optional<std::expected<Response, Error>> result;
    stage.Call(Request{}, Capture(result));
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_EQ(result->error().message, "nope");
}

TEST(OneshotTest, ReadyStageIsCalledImmediately) {
    ForeignStage stage;
    std::optional<std::expected<ForeignStage::Response, std::runtime_error>> result;
    Oneshot(stage, Request{}, Capture(result));

    EXPECT_EQ(stage.state->polls, 1);
    EXPECT_EQ(stage.state->calls, 1);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->has_value());
}

TEST(OneshotTest, PendingStageIsCalledAfterWake) {
    ForeignStage stage;
    stage.state->pending = true;

    std::optional<std::expected<ForeignStage::Response, std::runtime_error>> result;
    Request request;
    request.target = "/later";
    Oneshot(stage, std::move(request), Capture(result));

    EXPECT_EQ(stage.state->calls, 0);
    EXPECT_FALSE(result.has_value());

    stage.Wake();
    EXPECT_EQ(stage.state->polls, 2);
    EXPECT_EQ(stage.state->calls, 1);
    EXPECT_EQ(stage.state->last_target, "/later");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->has_value());
}

TEST(OneshotTest, ReadinessFailureSkipsCall) {
    ForeignStage stage;
    stage.state->fail_ready = true;

    std::optional<std::expected<ForeignStage::Response, std::runtime_error>> result;
    Oneshot(stage, Request{}, Capture(result));

    EXPECT_EQ(stage.state->calls, 0);
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(result->has_value());
    EXPECT_STREQ(result->error().what(), "not ready");
}
