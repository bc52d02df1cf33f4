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

#include "OAuth2Client.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <OAuthKit/Logger/NullLogger.hpp>

namespace OAuthKit::OAuth2 {

OAuth2Client::OAuth2Client(OAuth2Config config, std::shared_ptr<const IHttpTransport> transport,
			   std::shared_ptr<const Logger::ILogger> logger)
	: config_(std::move(config)),
	  transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(OAuth2Client::OAuth2Client)")),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
}

OAuth2Client::~OAuth2Client() noexcept = default;

std::string OAuth2Client::authorizationUrl(const ParamList &extraParams) const
{
	return OAuth2::authorizationUrl(config_, extraParams);
}

Result<AccessToken> OAuth2Client::fetchAccessToken(std::string code) const
{
	return fetchToken(buildTokenExchangeRequest(config_, std::move(code)), "fetchAccessToken");
}

Result<AccessToken> OAuth2Client::fetchRefreshToken(std::string refreshToken) const
{
	return fetchToken(buildRefreshRequest(config_, std::move(refreshToken)), "fetchRefreshToken");
}

Result<ByteString> OAuth2Client::doSimplePostRequest(std::string url, ParamList body) const
{
	return execute(buildFormPostRequest(std::move(url), std::move(body)));
}

Result<ByteString> OAuth2Client::authGetBytes(const AccessToken &token, std::string url) const
{
	return execute(buildAuthGetRequest(token, std::move(url)));
}

Result<ByteString> OAuth2Client::authPostBytes(const AccessToken &token, std::string url, ParamList params) const
{
	return execute(buildAuthPostRequest(token, std::move(url), std::move(params)));
}

Result<ByteString> OAuth2Client::authPostBytesWithBody(const AccessToken &token, std::string url, ParamList params,
							ByteString body) const
{
	return execute(buildAuthPostWithBodyRequest(token, std::move(url), std::move(params), std::move(body)));
}

Result<ByteString> OAuth2Client::execute(const HttpRequest &request) const
{
	return transport_->perform(request).andThen(classify);
}

Result<AccessToken> OAuth2Client::fetchToken(const HttpRequest &request, std::string_view operation) const
{
	Result<AccessToken> result = decodeJson<AccessToken>(execute(request));

	if (result) {
		logger_->info("TokenExchanged", {{"operation", operation}});
	} else {
		const OAuth2Error &error = result.error();
		const std::string status = error.statusCode ? std::to_string(*error.statusCode) : std::string("none");
		logger_->warn("TokenExchangeFailed",
			      {{"operation", operation}, {"kind", toString(error.kind)}, {"status", status}});
	}

	return result;
}

} // namespace OAuthKit::OAuth2
