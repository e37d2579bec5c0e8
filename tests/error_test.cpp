// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace stage_pipe;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ConfigParse, "bad config"};
    EXPECT_EQ(err.code, ErrorCode::ConfigParse);
    EXPECT_EQ(err.message, "bad config");
    EXPECT_FALSE(err.source);
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::MiddlewareWrapped), "middleware");
    EXPECT_EQ(error_category(ErrorCode::BodyStream), "body");
    EXPECT_EQ(error_category(ErrorCode::SessionStore), "session");
    EXPECT_EQ(error_category(ErrorCode::InvalidSessionData), "session");
    EXPECT_EQ(error_category(ErrorCode::ConfigParse), "config");
    EXPECT_EQ(error_category(ErrorCode::ConfigIo), "config");
    EXPECT_EQ(error_category(ErrorCode::Internal), "internal");
}

TEST(ErrorTest, FormatPrintsMessage) {
    Error err{ErrorCode::Internal, "boom"};
    EXPECT_EQ(fmt::format("{}", err), "boom");
}

TEST(WrapErrorTest, ForeignExceptionBecomesMiddlewareWrapped) {
    Error err = WrapError(std::runtime_error("connection reset"));
    EXPECT_EQ(err.code, ErrorCode::MiddlewareWrapped);
    EXPECT_EQ(err.message, "error while executing middleware: connection reset");
    ASSERT_TRUE(err.source);
    const auto* original = err.source.As<std::runtime_error>();
    ASSERT_NE(original, nullptr);
    EXPECT_STREQ(original->what(), "connection reset");
}

TEST(WrapErrorTest, ErrorCodeUsesMessage) {
    auto ec = std::make_error_code(std::errc::timed_out);
    Error err = WrapError(ec);
    EXPECT_EQ(err.code, ErrorCode::MiddlewareWrapped);
    EXPECT_EQ(err.message, "error while executing middleware: " + ec.message());
    ASSERT_NE(err.source.As<std::error_code>(), nullptr);
    EXPECT_EQ(*err.source.As<std::error_code>(), ec);
}

TEST(WrapErrorTest, CanonicalErrorIsNotNested) {
    Error inner = WrapError(std::runtime_error("disk full"));
    Error outer = WrapError(inner);
    EXPECT_EQ(outer.code, ErrorCode::MiddlewareWrapped);
    EXPECT_EQ(outer.message, inner.message);
    EXPECT_EQ(outer.source.Depth(), 1u);
    EXPECT_NE(outer.source.As<std::runtime_error>(), nullptr);
}

TEST(WrapErrorTest, UnwrappedCanonicalErrorPassesThrough) {
    Error err = WrapError(Error{ErrorCode::SessionStore, "store down"});
    EXPECT_EQ(err.code, ErrorCode::SessionStore);
    EXPECT_EQ(err.message, "store down");
    EXPECT_FALSE(err.source);
}

TEST(WrapErrorTest, DescribeChainListsCauses) {
    Error err = WrapError(std::runtime_error("timeout"));
    EXPECT_EQ(DescribeChain(err),
              "error while executing middleware: timeout\n  caused by: timeout");
}

TEST(WrapErrorTest, CopiesShareTheCause) {
    Error err = WrapError(std::logic_error("bad state"));
    Error copy = err;
    EXPECT_EQ(copy.source.As<std::logic_error>(), err.source.As<std::logic_error>());
}
