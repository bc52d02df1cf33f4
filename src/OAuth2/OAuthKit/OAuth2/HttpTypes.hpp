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

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace OAuthKit::OAuth2 {

/// Raw payload bytes. std::string is used as a byte container throughout.
using ByteString = std::string;

/// Ordered key/value pairs for query strings and form bodies.
using ParamList = std::vector<std::pair<std::string, std::string>>;

using HttpHeader = std::pair<std::string, std::string>;
using HttpHeaderList = std::vector<HttpHeader>;

enum class HttpMethod { Get, Post };

[[nodiscard]]
constexpr std::string_view toString(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::Get:
		return "GET";
	case HttpMethod::Post:
		return "POST";
	}
	return "GET";
}

struct NoBody {
	bool operator==(const NoBody &) const = default;
};

/// Sent as application/x-www-form-urlencoded.
struct FormBody {
	ParamList params;

	bool operator==(const FormBody &) const = default;
};

/// Sent verbatim.
struct RawBody {
	ByteString bytes;

	bool operator==(const RawBody &) const = default;
};

using RequestBody = std::variant<NoBody, FormBody, RawBody>;

struct HttpRequest {
	HttpMethod method = HttpMethod::Get;
	std::string url;
	ParamList query;
	HttpHeaderList headers;
	RequestBody body;
	std::optional<std::chrono::milliseconds> timeout;

	bool operator==(const HttpRequest &) const = default;
};

struct HttpResponse {
	long statusCode = 0;
	HttpHeaderList headers;
	ByteString body;

	bool operator==(const HttpResponse &) const = default;
};

/// ASCII case-insensitive comparison, as HTTP header names require.
[[nodiscard]]
bool headerNameEquals(std::string_view lhs, std::string_view rhs) noexcept;

/// Value of the first header named `name`, if any.
[[nodiscard]]
std::optional<std::string> findHeader(const HttpHeaderList &headers, std::string_view name);

} // namespace OAuthKit::OAuth2
