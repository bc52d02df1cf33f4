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

#include "HttpTypes.hpp"

#include <algorithm>
#include <cctype>

namespace OAuthKit::OAuth2 {

namespace {

char toLowerAscii(char c) noexcept
{
	return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // anonymous namespace

bool headerNameEquals(std::string_view lhs, std::string_view rhs) noexcept
{
	return std::ranges::equal(lhs, rhs, [](char a, char b) { return toLowerAscii(a) == toLowerAscii(b); });
}

std::optional<std::string> findHeader(const HttpHeaderList &headers, std::string_view name)
{
	auto it = std::ranges::find_if(headers, [name](const HttpHeader &h) { return headerNameEquals(h.first, name); });
	if (it == headers.end())
		return std::nullopt;
	return it->second;
}

} // namespace OAuthKit::OAuth2
