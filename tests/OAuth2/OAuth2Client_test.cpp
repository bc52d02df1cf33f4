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

#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <OAuthKit/Logger/PrintLogger.hpp>
#include <OAuthKit/OAuth2/OAuth2Client.hpp>

using namespace OAuthKit;
using namespace OAuthKit::OAuth2;

namespace {

/// Records every request and answers with a scripted result.
class FakeTransport final : public IHttpTransport {
public:
	explicit FakeTransport(Result<HttpResponse> reply) : reply_(std::move(reply)) {}

	Result<HttpResponse> perform(const HttpRequest &request) const override
	{
		std::lock_guard<std::mutex> lock(mutex_);
		requests_.push_back(request);
		return reply_;
	}

	HttpRequest lastRequest() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (requests_.empty())
			throw std::logic_error("NoRequestRecordedError(FakeTransport::lastRequest)");
		return requests_.back();
	}

	std::size_t requestCount() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return requests_.size();
	}

private:
	const Result<HttpResponse> reply_;
	mutable std::mutex mutex_;
	mutable std::vector<HttpRequest> requests_;
};

std::shared_ptr<FakeTransport> replyWith(long status, std::string body)
{
	return std::make_shared<FakeTransport>(HttpResponse{status, {}, std::move(body)});
}

OAuth2Config makeConfig()
{
	return OAuth2Config{
		.client_id = "client-1",
		.client_secret = "s3cret",
		.authorize_endpoint = "https://example.com/authorize",
		.token_endpoint = "https://example.com/token",
		.redirect_uri = std::nullopt,
	};
}

bool hasParam(const ParamList &params, const std::string &name, const std::string &value)
{
	for (const auto &[n, v] : params) {
		if (n == name && v == value)
			return true;
	}
	return false;
}

} // anonymous namespace

TEST(OAuth2ClientTest, NullTransportThrows)
{
	EXPECT_THROW(OAuth2Client(makeConfig(), nullptr), std::invalid_argument);
}

TEST(OAuth2ClientTest, FetchAccessTokenSucceedsOn200)
{
	auto transport = replyWith(200, R"({"access_token":"tok1","token_type":"bearer"})");
	const OAuth2Client client(makeConfig(), transport);

	const Result<AccessToken> result = client.fetchAccessToken("abc123");

	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().access_token, "tok1");
	EXPECT_EQ(result.value().token_type, "bearer");

	const HttpRequest sent = transport->lastRequest();
	EXPECT_EQ(sent.method, HttpMethod::Post);
	EXPECT_EQ(sent.url, "https://example.com/token");
	ASSERT_TRUE(std::holds_alternative<FormBody>(sent.body));
	EXPECT_TRUE(hasParam(std::get<FormBody>(sent.body).params, "code", "abc123"));
	EXPECT_TRUE(hasParam(std::get<FormBody>(sent.body).params, "grant_type", "authorization_code"));
}

TEST(OAuth2ClientTest, FetchAccessTokenRejectedGrant)
{
	const OAuth2Client client(makeConfig(), replyWith(401, R"({"error":"invalid_grant"})"));

	const Result<AccessToken> result = client.fetchAccessToken("abc123");

	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error().kind, OAuth2ErrorKind::HttpStatus);
	EXPECT_EQ(result.error().statusCode, 401);
	EXPECT_NE(result.error().message.find("invalid_grant"), std::string::npos);
}

TEST(OAuth2ClientTest, FetchAccessTokenUndecodableBody)
{
	const OAuth2Client client(makeConfig(), replyWith(200, "not-json"));

	const Result<AccessToken> result = client.fetchAccessToken("abc123");

	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error().kind, OAuth2ErrorKind::Decode);
	EXPECT_NE(result.error().message.find("not-json"), std::string::npos);
}

TEST(OAuth2ClientTest, TransportFailureIsNotAnHttpError)
{
	const OAuth2Error refused{OAuth2ErrorKind::Transport, "CurlPerformError: Couldn't connect to server", {}};
	const OAuth2Client client(makeConfig(), std::make_shared<FakeTransport>(refused));

	const Result<AccessToken> result = client.fetchAccessToken("abc123");

	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error(), refused);
}

TEST(OAuth2ClientTest, FetchRefreshTokenSendsRefreshGrant)
{
	auto transport = replyWith(200, R"({"access_token":"tok2","expires_in":3600})");
	const OAuth2Client client(makeConfig(), transport);

	const Result<AccessToken> result = client.fetchRefreshToken("rt-9");

	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().access_token, "tok2");
	EXPECT_EQ(result.value().expires_in, 3600);

	const ParamList params = std::get<FormBody>(transport->lastRequest().body).params;
	EXPECT_TRUE(hasParam(params, "grant_type", "refresh_token"));
	EXPECT_TRUE(hasParam(params, "refresh_token", "rt-9"));
}

TEST(OAuth2ClientTest, AuthGetJsonSendsBearerAndQueryToken)
{
	auto transport = replyWith(200, R"({"id":"u1","name":"Ada"})");
	const OAuth2Client client(makeConfig(), transport);
	const AccessToken token{.access_token = "tok1"};

	const Result<nlohmann::json> result = client.authGetJson<nlohmann::json>(token, "https://api.example.com/me");

	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().at("name"), "Ada");

	const HttpRequest sent = transport->lastRequest();
	EXPECT_EQ(sent.method, HttpMethod::Get);
	EXPECT_TRUE(hasParam(sent.query, "access_token", "tok1"));
	EXPECT_EQ(findHeader(sent.headers, "Authorization"), "Bearer tok1");
}

TEST(OAuth2ClientTest, AuthGetBytesReturnsRawBody)
{
	const OAuth2Client client(makeConfig(), replyWith(200, "plain text"));

	const Result<ByteString> result = client.authGetBytes(AccessToken{.access_token = "t"}, "https://x.example/");

	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value(), "plain text");
}

TEST(OAuth2ClientTest, AuthPostJsonSendsFormWithToken)
{
	auto transport = replyWith(200, R"({"ok":true})");
	const OAuth2Client client(makeConfig(), transport);

	const Result<nlohmann::json> result = client.authPostJson<nlohmann::json>(
		AccessToken{.access_token = "tok1"}, "https://api.example.com/post", {{"message", "hello"}});

	ASSERT_TRUE(result.ok());
	const ParamList params = std::get<FormBody>(transport->lastRequest().body).params;
	EXPECT_TRUE(hasParam(params, "message", "hello"));
	EXPECT_TRUE(hasParam(params, "access_token", "tok1"));
}

TEST(OAuth2ClientTest, AuthPostJsonWithBodySendsRawPayload)
{
	auto transport = replyWith(200, R"({"id":"b1"})");
	const OAuth2Client client(makeConfig(), transport);

	const Result<nlohmann::json> result = client.authPostJsonWithBody<nlohmann::json>(
		AccessToken{.access_token = "tok1"}, "https://api.example.com/items", {{"part", "snippet"}},
		R"({"title":"x"})");

	ASSERT_TRUE(result.ok());
	EXPECT_EQ(result.value().at("id"), "b1");

	const HttpRequest sent = transport->lastRequest();
	ASSERT_TRUE(std::holds_alternative<RawBody>(sent.body));
	EXPECT_EQ(std::get<RawBody>(sent.body).bytes, R"({"title":"x"})");
	EXPECT_TRUE(hasParam(sent.query, "part", "snippet"));
	EXPECT_TRUE(hasParam(sent.query, "access_token", "tok1"));
}

TEST(OAuth2ClientTest, AuthPostBytesWithBodyPropagatesStatusError)
{
	const OAuth2Client client(makeConfig(), replyWith(403, "forbidden"));

	const Result<ByteString> result = client.authPostBytesWithBody(AccessToken{.access_token = "t"},
									"https://api.example.com/items", {}, "{}");

	ASSERT_FALSE(result.ok());
	EXPECT_EQ(result.error().message, std::string(kHttpStatusErrorLabel) + "forbidden");
}

TEST(OAuth2ClientTest, DoJsonPostRequestHasNoAuthorization)
{
	auto transport = replyWith(200, R"({"device_code":"d"})");
	const OAuth2Client client(makeConfig(), transport);

	const Result<nlohmann::json> result =
		client.doJsonPostRequest<nlohmann::json>("https://example.com/device", {{"client_id", "client-1"}});

	ASSERT_TRUE(result.ok());
	EXPECT_FALSE(findHeader(transport->lastRequest().headers, "Authorization").has_value());
}

TEST(OAuth2ClientTest, EachCallIsOneRoundTrip)
{
	auto transport = replyWith(500, "oops");
	const OAuth2Client client(makeConfig(), transport);

	(void)client.fetchAccessToken("a");
	(void)client.fetchRefreshToken("b");
	(void)client.authGetBytes(AccessToken{.access_token = "t"}, "https://x.example/");

	EXPECT_EQ(transport->requestCount(), 3u);
}

TEST(OAuth2ClientTest, LogsTokenExchangeOutcome)
{
	std::ostringstream out;
	auto logger = std::make_shared<Logger::PrintLogger>(out);
	const OAuth2Client client(makeConfig(), replyWith(401, R"({"error":"invalid_grant"})"), logger);

	(void)client.fetchAccessToken("abc123");

	const std::string text = out.str();
	EXPECT_NE(text.find("name=TokenExchangeFailed"), std::string::npos);
	EXPECT_NE(text.find("kind=HttpStatus"), std::string::npos);
	EXPECT_NE(text.find("status=401"), std::string::npos);
}

TEST(OAuth2ClientTest, AuthorizationUrlUsesConfig)
{
	const OAuth2Client client(makeConfig(), replyWith(200, "{}"));

	const std::string url = client.authorizationUrl({{"scope", "read"}});

	EXPECT_EQ(url.rfind("https://example.com/authorize?", 0), 0u);
	EXPECT_NE(url.find("client_id=client-1"), std::string::npos);
	EXPECT_NE(url.find("scope=read"), std::string::npos);
}
