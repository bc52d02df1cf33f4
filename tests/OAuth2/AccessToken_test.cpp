/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit OAuth2 Library Tests Library
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <gtest/gtest.h>

#include <cstdint>

#include <nlohmann/json.hpp>

#include <OAuthKit/OAuth2/AccessToken.hpp>

using namespace OAuthKit::OAuth2;
using nlohmann::json;

TEST(AccessTokenTest, DecodesMinimalResponse)
{
	const auto token = json::parse(R"({"access_token":"tok1","token_type":"bearer"})").get<AccessToken>();

	EXPECT_EQ(token.access_token, "tok1");
	EXPECT_EQ(token.token_type, "bearer");
	EXPECT_FALSE(token.refresh_token.has_value());
	EXPECT_FALSE(token.expires_in.has_value());
	EXPECT_FALSE(token.scope.has_value());
	EXPECT_FALSE(token.id_token.has_value());
}

TEST(AccessTokenTest, DecodesFullResponse)
{
	const auto token = json::parse(R"({
		"access_token": "ya29.a0",
		"expires_in": 3599,
		"refresh_token": "1//0g",
		"scope": "openid email",
		"token_type": "Bearer",
		"id_token": "eyJhbGciOi"
	})").get<AccessToken>();

	EXPECT_EQ(token.access_token, "ya29.a0");
	EXPECT_EQ(token.expires_in, 3599);
	EXPECT_EQ(token.refresh_token, "1//0g");
	EXPECT_EQ(token.scope, "openid email");
	EXPECT_EQ(token.token_type, "Bearer");
	EXPECT_EQ(token.id_token, "eyJhbGciOi");
}

TEST(AccessTokenTest, TreatsNullOptionalsAsAbsent)
{
	const auto token =
		json::parse(R"({"access_token":"t","refresh_token":null,"expires_in":null})").get<AccessToken>();

	EXPECT_FALSE(token.refresh_token.has_value());
	EXPECT_FALSE(token.expires_in.has_value());
}

TEST(AccessTokenTest, KeepsExpiryBeyondThirtyTwoBits)
{
	const auto token = json::parse(R"({"access_token":"t","expires_in":5000000000})").get<AccessToken>();

	ASSERT_TRUE(token.expires_in.has_value());
	EXPECT_EQ(*token.expires_in, std::int64_t{5000000000});
}

TEST(AccessTokenTest, IgnoresUnknownFields)
{
	const auto token = json::parse(R"({"access_token":"t","ext_expires_in":3600})").get<AccessToken>();
	EXPECT_EQ(token.access_token, "t");
}

TEST(AccessTokenTest, MissingAccessTokenThrows)
{
	EXPECT_THROW(json::parse(R"({"token_type":"bearer"})").get<AccessToken>(), json::exception);
}

TEST(AccessTokenTest, RoundTripsWithoutOptionalFields)
{
	const AccessToken original{.access_token = "only"};
	const json j = original;

	EXPECT_EQ(j.size(), 1u);
	EXPECT_EQ(j.get<AccessToken>(), original);
}

TEST(AccessTokenTest, RoundTripsWithAllFields)
{
	const AccessToken original{
		.access_token = "a",
		.refresh_token = "r",
		.expires_in = 60,
		.token_type = "bearer",
		.scope = "read write",
		.id_token = "i",
	};
	const json j = original;

	EXPECT_EQ(j.get<AccessToken>(), original);
}
