// SPDX-License-Identifier: MIT

// tests/cookie_test.cpp
#include <chrono>

#include <gtest/gtest.h>

#include "src/cookie.hpp"

using namespace stage_pipe;

TEST(CookieTest, FindsNamedCookie) {
    Headers headers{{"Cookie", "theme=dark; id=abc123; lang=en"}};
    EXPECT_EQ(FindCookie(headers, "id"), "abc123");
    EXPECT_EQ(FindCookie(headers, "lang"), "en");
    EXPECT_FALSE(FindCookie(headers, "missing").has_value());
}

TEST(CookieTest, SearchesEveryCookieHeader) {
    Headers headers{{"Cookie", "a=1"}, {"cookie", "id=\"quoted\""}};
    EXPECT_EQ(FindCookie(headers, "id"), "quoted");
}

TEST(CookieTest, FirstOccurrenceWins) {
    Headers headers{{"Cookie", "id=first; id=second"}};
    EXPECT_EQ(FindCookie(headers, "id"), "first");
}

TEST(CookieTest, IgnoresMalformedPairs) {
    Headers headers{{"Cookie", "garbage; ; id=ok"}};
    EXPECT_EQ(FindCookie(headers, "id"), "ok");
}

TEST(CookieTest, ParseSameSite) {
    EXPECT_EQ(ParseSameSite("strict"), SameSite::Strict);
    EXPECT_EQ(ParseSameSite("Lax"), SameSite::Lax);
    EXPECT_EQ(ParseSameSite("NONE"), SameSite::None);
    EXPECT_FALSE(ParseSameSite("sometimes").has_value());
}

TEST(SetCookieTest, DefaultsAreStrict) {
    SetCookie cookie;
    cookie.name = "id";
    cookie.value = "v";
    EXPECT_EQ(cookie.ToString(), "id=v; Path=/; HttpOnly; Secure; SameSite=Strict");
}

TEST(SetCookieTest, MaxAgeAndRelaxedFlags) {
    SetCookie cookie;
    cookie.name = "sid";
    cookie.value = "x";
    cookie.path = "/app";
    cookie.secure = false;
    cookie.same_site = SameSite::Lax;
    cookie.max_age = std::chrono::seconds(3600);
    EXPECT_EQ(cookie.ToString(), "sid=x; Path=/app; Max-Age=3600; HttpOnly; SameSite=Lax");
}

TEST(SetCookieTest, RemovalExpiresImmediately) {
    SetCookie cookie;
    cookie.name = "id";
    cookie.value = "abc";
    EXPECT_EQ(cookie.Removal().ToString(),
              "id=; Path=/; Max-Age=0; HttpOnly; Secure; SameSite=Strict");
}

TEST(SetCookieTest, RemovalKeepsAttributes) {
    SetCookie cookie;
    cookie.name = "sid";
    cookie.value = "abc";
    cookie.path = "/app";
    cookie.secure = false;
    cookie.same_site = SameSite::Lax;
    cookie.max_age = std::chrono::seconds(3600);
    EXPECT_EQ(cookie.Removal().ToString(), "sid=; Path=/app; Max-Age=0; HttpOnly; SameSite=Lax");
}
