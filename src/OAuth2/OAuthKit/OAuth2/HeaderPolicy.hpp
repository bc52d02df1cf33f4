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

#include <optional>
#include <string_view>

#include "AccessToken.hpp"
#include "HttpTypes.hpp"

namespace OAuthKit::OAuth2 {

inline constexpr std::string_view kUserAgent = "oauthkit";

/// User-Agent, Accept and Content-Type, plus `Authorization: Bearer <token>`
/// when a token is given.
[[nodiscard]]
HttpHeaderList defaultHeaders(const std::optional<AccessToken> &token);

/// Returns `request` with the default headers placed first. Existing headers
/// with the same names (compared case-insensitively) are dropped, and so is
/// any existing Authorization header even when `token` is empty.
[[nodiscard]]
HttpRequest applyHeaders(const std::optional<AccessToken> &token, HttpRequest request);

} // namespace OAuthKit::OAuth2
