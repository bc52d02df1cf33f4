/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit OAuth2 Library
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

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <OAuthKit/Logger/ILogger.hpp>

#include "AccessToken.hpp"
#include "HttpTypes.hpp"
#include "IHttpTransport.hpp"
#include "OAuth2Config.hpp"
#include "RequestBuilder.hpp"
#include "ResponseInterpreter.hpp"
#include "Result.hpp"

namespace OAuthKit::OAuth2 {

/**
 * @brief Token acquisition and bearer-authenticated calls against one provider.
 *
 * Every operation is a single request/response cycle: build the request,
 * hand it to the transport, classify the status, and (for the *Json
 * variants) decode the body. Nothing is cached between calls, so the client
 * is safe to share between threads as long as the transport is.
 *
 * The *Bytes variants stop after status classification and return the body
 * verbatim.
 */
class OAuth2Client {
public:
	OAuth2Client(OAuth2Config config, std::shared_ptr<const IHttpTransport> transport,
		     std::shared_ptr<const Logger::ILogger> logger = nullptr);

	~OAuth2Client() noexcept;

	OAuth2Client(const OAuth2Client &) = delete;
	OAuth2Client &operator=(const OAuth2Client &) = delete;
	OAuth2Client(OAuth2Client &&) = delete;
	OAuth2Client &operator=(OAuth2Client &&) = delete;

	[[nodiscard]]
	const OAuth2Config &config() const noexcept
	{
		return config_;
	}

	[[nodiscard]]
	std::string authorizationUrl(const ParamList &extraParams = {}) const;

	/// Exchanges an authorization code at the token endpoint.
	[[nodiscard]]
	Result<AccessToken> fetchAccessToken(std::string code) const;

	/// Obtains a new access token with a refresh token.
	[[nodiscard]]
	Result<AccessToken> fetchRefreshToken(std::string refreshToken) const;

	template<typename T> [[nodiscard]] Result<T> doJsonPostRequest(std::string url, ParamList body) const
	{
		return decodeJson<T>(doSimplePostRequest(std::move(url), std::move(body)));
	}

	[[nodiscard]]
	Result<ByteString> doSimplePostRequest(std::string url, ParamList body) const;

	template<typename T> [[nodiscard]] Result<T> authGetJson(const AccessToken &token, std::string url) const
	{
		return decodeJson<T>(authGetBytes(token, std::move(url)));
	}

	[[nodiscard]]
	Result<ByteString> authGetBytes(const AccessToken &token, std::string url) const;

	template<typename T>
	[[nodiscard]] Result<T> authPostJson(const AccessToken &token, std::string url, ParamList params) const
	{
		return decodeJson<T>(authPostBytes(token, std::move(url), std::move(params)));
	}

	/// Form-encoded POST; the token travels as an `access_token` form field.
	[[nodiscard]]
	Result<ByteString> authPostBytes(const AccessToken &token, std::string url, ParamList params) const;

	template<typename T>
	[[nodiscard]] Result<T> authPostJsonWithBody(const AccessToken &token, std::string url, ParamList params,
						     ByteString body) const
	{
		return decodeJson<T>(authPostBytesWithBody(token, std::move(url), std::move(params), std::move(body)));
	}

	/// POST with a caller-supplied body; `params` and the token go in the query.
	[[nodiscard]]
	Result<ByteString> authPostBytesWithBody(const AccessToken &token, std::string url, ParamList params,
						 ByteString body) const;

private:
	[[nodiscard]]
	Result<ByteString> execute(const HttpRequest &request) const;

	[[nodiscard]]
	Result<AccessToken> fetchToken(const HttpRequest &request, std::string_view operation) const;

	const OAuth2Config config_;
	const std::shared_ptr<const IHttpTransport> transport_;
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace OAuthKit::OAuth2
