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

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace OAuthKit::OAuth2 {

enum class OAuth2ErrorKind {
	/// No HTTP response was obtained (connect, TLS, timeout, malformed URL).
	Transport,
	/// A response arrived with a status other than 200.
	HttpStatus,
	/// Status 200, but the body did not decode into the requested type.
	Decode,
};

[[nodiscard]]
constexpr std::string_view toString(OAuth2ErrorKind kind) noexcept
{
	switch (kind) {
	case OAuth2ErrorKind::Transport:
		return "Transport";
	case OAuth2ErrorKind::HttpStatus:
		return "HttpStatus";
	case OAuth2ErrorKind::Decode:
		return "Decode";
	}
	return "Unknown";
}

struct OAuth2Error {
	OAuth2ErrorKind kind = OAuth2ErrorKind::Transport;
	/// Diagnostic label followed by the offending bytes. Never empty.
	std::string message;
	/// Present for HttpStatus and Decode errors.
	std::optional<long> statusCode;

	bool operator==(const OAuth2Error &) const = default;
};

template<typename T> class Result;

template<typename T> struct IsResult : std::false_type {};
template<typename T> struct IsResult<Result<T>> : std::true_type {};

/// Either a value of type T or an OAuth2Error. Exactly one is held.
template<typename T> class [[nodiscard]] Result {
public:
	using value_type = T;

	Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
	Result(OAuth2Error error) : storage_(std::in_place_index<1>, std::move(error)) {}

	[[nodiscard]]
	bool ok() const noexcept
	{
		return storage_.index() == 0;
	}

	explicit operator bool() const noexcept { return ok(); }

	[[nodiscard]]
	const T &value() const &
	{
		if (!ok())
			throw std::logic_error("ResultHoldsErrorError(Result::value)");
		return std::get<0>(storage_);
	}

	[[nodiscard]]
	T &&value() &&
	{
		if (!ok())
			throw std::logic_error("ResultHoldsErrorError(Result::value)");
		return std::get<0>(std::move(storage_));
	}

	[[nodiscard]]
	const OAuth2Error &error() const &
	{
		if (ok())
			throw std::logic_error("ResultHoldsValueError(Result::error)");
		return std::get<1>(storage_);
	}

	/// Applies `f` to the held value; an error passes through untouched.
	/// `f` must itself return a Result.
	template<typename F>
		requires IsResult<std::invoke_result_t<F, const T &>>::value
	auto andThen(F &&f) const & -> std::invoke_result_t<F, const T &>
	{
		if (!ok())
			return std::get<1>(storage_);
		return std::forward<F>(f)(std::get<0>(storage_));
	}

	template<typename F>
		requires IsResult<std::invoke_result_t<F, T &&>>::value
	auto andThen(F &&f) && -> std::invoke_result_t<F, T &&>
	{
		if (!ok())
			return std::get<1>(std::move(storage_));
		return std::forward<F>(f)(std::get<0>(std::move(storage_)));
	}

	/// Maps the held value with a plain function; errors pass through.
	template<typename F> auto transform(F &&f) const & -> Result<std::invoke_result_t<F, const T &>>
	{
		if (!ok())
			return std::get<1>(storage_);
		return std::forward<F>(f)(std::get<0>(storage_));
	}

	bool operator==(const Result &) const = default;

private:
	std::variant<T, OAuth2Error> storage_;
};

} // namespace OAuthKit::OAuth2
