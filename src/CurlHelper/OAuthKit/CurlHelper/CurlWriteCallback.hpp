/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * OAuthKit CurlHelper Library
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

#include <concepts>
#include <cstddef>
#include <exception>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace OAuthKit::CurlHelper {

using CurlResponseHeaderList = std::vector<std::pair<std::string, std::string>>;

template<typename T>
concept CurlByteBuffer = requires(T &t, const char *p) {
	t.insert(t.end(), p, p);
	requires sizeof(typename T::value_type) == 1;
};

template<CurlByteBuffer BufferT>
inline std::size_t CurlBufferWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	std::size_t totalSize = size * nmemb;

	try {
		auto *buffer = static_cast<BufferT *>(userp);
		const auto *start = static_cast<const char *>(contents);
		buffer->insert(buffer->end(), start, start + totalSize);
	} catch (const std::exception &) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

inline std::size_t CurlStringWriteCallback(void *contents, std::size_t size, std::size_t nmemb, void *userp) noexcept
{
	return CurlBufferWriteCallback<std::string>(contents, size, nmemb, userp);
}

namespace detail {

inline std::string_view trimHeaderWhitespace(std::string_view s) noexcept
{
	constexpr std::string_view ws = " \t\r\n";
	const auto first = s.find_first_not_of(ws);
	if (first == std::string_view::npos)
		return {};
	const auto last = s.find_last_not_of(ws);
	return s.substr(first, last - first + 1);
}

} // namespace detail

/// CURLOPT_HEADERFUNCTION callback collecting "Name: value" lines into a
/// CurlResponseHeaderList. A status line starts a new response (redirects,
/// 100-continue), so it clears whatever was collected before it.
inline std::size_t CurlHeaderListCallback(char *buffer, std::size_t size, std::size_t nitems, void *userp) noexcept
{
	if (size != 0 && nitems > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nitems;

	try {
		auto *headers = static_cast<CurlResponseHeaderList *>(userp);
		std::string_view line(buffer, totalSize);

		if (line.starts_with("HTTP/")) {
			headers->clear();
			return totalSize;
		}

		const auto colon = line.find(':');
		if (colon == std::string_view::npos)
			return totalSize;

		headers->emplace_back(std::string(detail::trimHeaderWhitespace(line.substr(0, colon))),
				      std::string(detail::trimHeaderWhitespace(line.substr(colon + 1))));
	} catch (const std::exception &) {
		return 0;
	}

	return totalSize;
}

} // namespace OAuthKit::CurlHelper
