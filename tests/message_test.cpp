// SPDX-License-Identifier: MIT

// tests/message_test.cpp
#include <string>

#include <gtest/gtest.h>

#include "lib/stream/message.hpp"

using namespace stage_pipe;

TEST(HeadersTest, LookupIsCaseInsensitive) {
    Headers headers{{"Content-Type", "text/html"}};
    EXPECT_EQ(headers.Get("content-type"), "text/html");
    EXPECT_TRUE(headers.Contains("CONTENT-TYPE"));
    EXPECT_FALSE(headers.Get("Content-Length").has_value());
}

TEST(HeadersTest, AppendKeepsEveryValue) {
    Headers headers;
    headers.Append("Set-Cookie", "a=1");
    headers.Append("set-cookie", "b=2");
    EXPECT_EQ(headers.GetAll("Set-Cookie"), (std::vector<std::string>{"a=1", "b=2"}));
    EXPECT_EQ(headers.Get("Set-Cookie"), "a=1");
}

TEST(HeadersTest, SetReplacesAllValues) {
    Headers headers{{"Accept", "a"}, {"accept", "b"}, {"Host", "x"}};
    headers.Set("Accept", "c");
    EXPECT_EQ(headers.GetAll("Accept"), (std::vector<std::string>{"c"}));
    EXPECT_EQ(headers.Size(), 2u);
}

TEST(HeadersTest, RemoveReportsCount) {
    Headers headers{{"X-A", "1"}, {"x-a", "2"}};
    EXPECT_EQ(headers.Remove("X-A"), 2u);
    EXPECT_TRUE(headers.Empty());
    EXPECT_EQ(headers.Remove("X-A"), 0u);
}

TEST(ExtensionsTest, OneValuePerType) {
    Extensions ext;
    ext.Insert(42);
    ext.Insert(std::string("user"));
    ext.Insert(7);

    ASSERT_NE(ext.Get<int>(), nullptr);
    EXPECT_EQ(*ext.Get<int>(), 7);
    EXPECT_EQ(*ext.Get<std::string>(), "user");
    EXPECT_EQ(ext.Size(), 2u);
    EXPECT_EQ(ext.Get<double>(), nullptr);
}

TEST(ExtensionsTest, RemoveReturnsValue) {
    Extensions ext;
    ext.Insert(std::string("token"));
    auto removed = ext.Remove<std::string>();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, "token");
    EXPECT_EQ(ext.Get<std::string>(), nullptr);
    EXPECT_FALSE(ext.Remove<std::string>().has_value());
}

TEST(RequestTest, PathAndQuery) {
    Request request;
    request.target = "/items/3?version=abc&x=1";
    EXPECT_EQ(request.Path(), "/items/3");
    EXPECT_EQ(request.Query(), "version=abc&x=1");

    request.target = "/plain";
    EXPECT_EQ(request.Path(), "/plain");
    EXPECT_EQ(request.Query(), "");
}

TEST(ResponseTest, MakeResponseSetsContentType) {
    Response response = MakeResponse(404, "missing");
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.headers.Get("Content-Type"), "text/plain");
    auto body = response.body.Collect();
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "missing");
}

TEST(ResponseTest, MapBodyKeepsStatusAndHeaders) {
    BasicResponse<std::string> response{201, {{"X-Id", "9"}}, "raw"};
    Response mapped = std::move(response).MapBody([](std::string s) { return Body::Fixed(s + "!"); });
    EXPECT_EQ(mapped.status, 201);
    EXPECT_EQ(mapped.headers.Get("X-Id"), "9");
    EXPECT_EQ(*mapped.body.Collect(), "raw!");
}
