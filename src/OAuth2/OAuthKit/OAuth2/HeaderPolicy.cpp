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

#include "HeaderPolicy.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace OAuthKit::OAuth2 {

HttpHeaderList defaultHeaders(const std::optional<AccessToken> &token)
{
	HttpHeaderList headers{
		{"User-Agent", std::string(kUserAgent)},
		{"Accept", "application/json"},
		{"Content-Type", "application/json"},
	};

	if (token.has_value()) {
		headers.emplace_back("Authorization", fmt::format("Bearer {}", token->access_token));
	}

	return headers;
}

HttpRequest applyHeaders(const std::optional<AccessToken> &token, HttpRequest request)
{
	const HttpHeaderList policy = defaultHeaders(token);

	// Authorization only ever comes from the token argument.
	const auto isOverridden = [&policy](const HttpHeader &existing) {
		return headerNameEquals(existing.first, "Authorization") ||
		       std::ranges::any_of(policy, [&existing](const HttpHeader &h) {
			       return headerNameEquals(h.first, existing.first);
		       });
	};

	HttpHeaderList merged = policy;
	merged.reserve(policy.size() + request.headers.size());

	for (auto &header : request.headers) {
		if (!isOverridden(header)) {
			merged.push_back(std::move(header));
		}
	}

	request.headers = std::move(merged);
	return request;
}

} // namespace OAuthKit::OAuth2
