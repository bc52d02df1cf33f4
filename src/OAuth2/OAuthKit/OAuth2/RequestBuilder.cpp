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

#include "RequestBuilder.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <OAuthKit/CurlHelper/CurlHandle.hpp>
#include <OAuthKit/CurlHelper/CurlUrlHandle.hpp>
#include <OAuthKit/CurlHelper/CurlUrlSearchParams.hpp>

#include "HeaderPolicy.hpp"

namespace OAuthKit::OAuth2 {

TokenEndpointRequest accessTokenUrl(const OAuth2Config &config, std::string code)
{
	ParamList body;
	body.emplace_back("client_id", config.client_id);
	body.emplace_back("client_secret", config.client_secret);
	body.emplace_back("code", std::move(code));
	if (config.redirect_uri.has_value()) {
		body.emplace_back("redirect_uri", *config.redirect_uri);
	}
	body.emplace_back("grant_type", "authorization_code");

	return {config.token_endpoint, std::move(body)};
}

TokenEndpointRequest refreshAccessTokenUrl(const OAuth2Config &config, std::string refreshToken)
{
	ParamList body;
	body.emplace_back("client_id", config.client_id);
	body.emplace_back("client_secret", config.client_secret);
	body.emplace_back("grant_type", "refresh_token");
	body.emplace_back("refresh_token", std::move(refreshToken));

	return {config.token_endpoint, std::move(body)};
}

ParamList accessTokenToParam(const AccessToken &token)
{
	return {{std::string(kAccessTokenParam), token.access_token}};
}

HttpRequest buildFormPostRequest(std::string url, ParamList body)
{
	HttpRequest request;
	request.method = HttpMethod::Post;
	request.url = std::move(url);

	request = applyHeaders(std::nullopt, std::move(request));

	// The form encoding step runs after the header policy and owns Content-Type.
	for (auto &[name, value] : request.headers) {
		if (headerNameEquals(name, "Content-Type")) {
			value = std::string(kFormContentType);
		}
	}
	request.body = FormBody{std::move(body)};

	return request;
}

HttpRequest buildTokenExchangeRequest(const OAuth2Config &config, std::string code)
{
	auto [url, body] = accessTokenUrl(config, std::move(code));
	return buildFormPostRequest(std::move(url), std::move(body));
}

HttpRequest buildRefreshRequest(const OAuth2Config &config, std::string refreshToken)
{
	auto [url, body] = refreshAccessTokenUrl(config, std::move(refreshToken));
	return buildFormPostRequest(std::move(url), std::move(body));
}

HttpRequest buildAuthenticatedRequest(const AccessToken &token, HttpMethod method, std::string url, ParamList query,
				      RequestBody body)
{
	HttpRequest request;
	request.method = method;
	request.url = std::move(url);
	request.query = std::move(query);
	request.body = std::move(body);

	return applyHeaders(token, std::move(request));
}

HttpRequest buildAuthGetRequest(const AccessToken &token, std::string url)
{
	return buildAuthenticatedRequest(token, HttpMethod::Get, std::move(url), accessTokenToParam(token), NoBody{});
}

HttpRequest buildAuthPostRequest(const AccessToken &token, std::string url, ParamList params)
{
	for (auto &param : accessTokenToParam(token)) {
		params.push_back(std::move(param));
	}
	return buildAuthenticatedRequest(token, HttpMethod::Post, std::move(url), {}, FormBody{std::move(params)});
}

HttpRequest buildAuthPostWithBodyRequest(const AccessToken &token, std::string url, ParamList params,
					 ByteString body)
{
	for (auto &param : accessTokenToParam(token)) {
		params.push_back(std::move(param));
	}
	return buildAuthenticatedRequest(token, HttpMethod::Post, std::move(url), std::move(params),
					 RawBody{std::move(body)});
}

std::string authorizationUrl(const OAuth2Config &config, const ParamList &extraParams)
{
	const CurlHelper::CurlHandle curl;

	CurlHelper::CurlUrlSearchParams qp(curl);
	qp.append("client_id", config.client_id);
	qp.append("response_type", "code");
	if (config.redirect_uri.has_value()) {
		qp.append("redirect_uri", *config.redirect_uri);
	}
	for (const auto &[name, value] : extraParams) {
		qp.append(name, value);
	}

	CurlHelper::CurlUrlHandle url;
	if (const CURLUcode uc = url.setUrl(config.authorize_endpoint.c_str()); uc != CURLUE_OK) {
		throw std::invalid_argument(
			fmt::format("InvalidAuthorizeEndpointError(authorizationUrl): {}", curl_url_strerror(uc)));
	}

	const std::string query = qp.toString();
	if (const CURLUcode uc = url.appendQuery(query.c_str()); uc != CURLUE_OK) {
		throw std::runtime_error(fmt::format("QueryAppendError(authorizationUrl): {}", curl_url_strerror(uc)));
	}

	std::unique_ptr<char, decltype(&curl_free)> out(nullptr, curl_free);
	if (const CURLUcode uc = url.toString(out); uc != CURLUE_OK || !out) {
		throw std::runtime_error(fmt::format("GetUrlError(authorizationUrl): {}", curl_url_strerror(uc)));
	}
	return std::string(out.get());
}

} // namespace OAuthKit::OAuth2
