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

#include <string>
#include <string_view>
#include <utility>

#include "AccessToken.hpp"
#include "HttpTypes.hpp"
#include "OAuth2Config.hpp"

namespace OAuthKit::OAuth2 {

inline constexpr std::string_view kAccessTokenParam = "access_token";
inline constexpr std::string_view kFormContentType = "application/x-www-form-urlencoded";

/// Target URL and form parameters of a token endpoint call.
struct TokenEndpointRequest {
	std::string url;
	ParamList body;

	bool operator==(const TokenEndpointRequest &) const = default;
};

/// `client_id`, `client_secret`, `code`, `redirect_uri` (when configured) and
/// `grant_type=authorization_code`, addressed to the token endpoint.
[[nodiscard]]
TokenEndpointRequest accessTokenUrl(const OAuth2Config &config, std::string code);

/// `client_id`, `client_secret`, `grant_type=refresh_token` and
/// `refresh_token`, addressed to the token endpoint.
[[nodiscard]]
TokenEndpointRequest refreshAccessTokenUrl(const OAuth2Config &config, std::string refreshToken);

[[nodiscard]]
ParamList accessTokenToParam(const AccessToken &token);

/// Unauthenticated form POST, as used against the token endpoint.
[[nodiscard]]
HttpRequest buildFormPostRequest(std::string url, ParamList body);

[[nodiscard]]
HttpRequest buildTokenExchangeRequest(const OAuth2Config &config, std::string code);

[[nodiscard]]
HttpRequest buildRefreshRequest(const OAuth2Config &config, std::string refreshToken);

/// Common path for every request carrying a bearer token. The URL is not
/// validated here; the transport reports malformed URLs.
[[nodiscard]]
HttpRequest buildAuthenticatedRequest(const AccessToken &token, HttpMethod method, std::string url, ParamList query,
				      RequestBody body);

/// GET with the token appended as the `access_token` query parameter.
[[nodiscard]]
HttpRequest buildAuthGetRequest(const AccessToken &token, std::string url);

/// POST whose form body is `params` followed by `access_token`.
[[nodiscard]]
HttpRequest buildAuthPostRequest(const AccessToken &token, std::string url, ParamList params);

/// POST sending `body` verbatim. `params` and `access_token` go into the
/// query string.
[[nodiscard]]
HttpRequest buildAuthPostWithBodyRequest(const AccessToken &token, std::string url, ParamList params,
					 ByteString body);

/// URL of the provider's consent page: `client_id`, `response_type=code`,
/// `redirect_uri` when configured, then `extraParams` (scope, state, ...).
/// The parameters extend any query already on the endpoint and precede its
/// fragment. Throws std::invalid_argument if the endpoint does not parse.
[[nodiscard]]
std::string authorizationUrl(const OAuth2Config &config, const ParamList &extraParams = {});

} // namespace OAuthKit::OAuth2
