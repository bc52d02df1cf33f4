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

#include "CurlHttpTransport.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <OAuthKit/CurlHelper/CurlHandle.hpp>
#include <OAuthKit/CurlHelper/CurlSlistHandle.hpp>
#include <OAuthKit/CurlHelper/CurlUrlHandle.hpp>
#include <OAuthKit/CurlHelper/CurlUrlSearchParams.hpp>
#include <OAuthKit/CurlHelper/CurlWriteCallback.hpp>
#include <OAuthKit/Logger/NullLogger.hpp>

namespace OAuthKit::OAuth2 {

namespace {

constexpr const char *kAllowedProtocols = "http,https";

template<typename T> void setOption(CURL *curl, CURLoption option, T value)
{
	const CURLcode rc = curl_easy_setopt(curl, option, value);
	if (rc != CURLE_OK) {
		throw std::runtime_error(
			fmt::format("CurlSetoptError(CurlHttpTransport::perform): {}", curl_easy_strerror(rc)));
	}
}

OAuth2Error transportError(std::string message)
{
	return OAuth2Error{OAuth2ErrorKind::Transport, std::move(message), std::nullopt};
}

/// Form bodies are encoded here; raw bodies are copied as they are.
ByteString encodeBody(const CurlHelper::CurlHandle &curl, const RequestBody &body)
{
	return std::visit(
		[&curl](const auto &b) -> ByteString {
			using B = std::decay_t<decltype(b)>;
			if constexpr (std::is_same_v<B, FormBody>) {
				return CurlHelper::CurlUrlSearchParams(curl, b.params).toString();
			} else if constexpr (std::is_same_v<B, RawBody>) {
				return b.bytes;
			} else {
				return {};
			}
		},
		body);
}

} // anonymous namespace

void to_json(nlohmann::json &j, const CurlTransportOptions &p)
{
	j = nlohmann::json{
		{"connect_timeout_ms", p.connectTimeout.count()},
		{"timeout_ms", p.timeout.count()},
		{"follow_redirects", p.followRedirects},
		{"max_redirects", p.maxRedirects},
		{"verify_peer", p.verifyPeer},
	};

	if (p.caInfo.has_value())
		j["ca_info"] = *p.caInfo;
}

void from_json(const nlohmann::json &j, CurlTransportOptions &p)
{
	if (auto it = j.find("connect_timeout_ms"); it != j.end()) {
		p.connectTimeout = std::chrono::milliseconds(it->get<std::chrono::milliseconds::rep>());
	}
	if (auto it = j.find("timeout_ms"); it != j.end()) {
		p.timeout = std::chrono::milliseconds(it->get<std::chrono::milliseconds::rep>());
	}
	if (auto it = j.find("follow_redirects"); it != j.end()) {
		it->get_to(p.followRedirects);
	}
	if (auto it = j.find("max_redirects"); it != j.end()) {
		it->get_to(p.maxRedirects);
	}
	if (auto it = j.find("verify_peer"); it != j.end()) {
		it->get_to(p.verifyPeer);
	}
	if (auto it = j.find("ca_info"); it != j.end() && !it->is_null()) {
		it->get_to(p.caInfo.emplace());
	}
}

CurlHttpTransport::CurlHttpTransport(CurlTransportOptions options, std::shared_ptr<const Logger::ILogger> logger)
	: options_(std::move(options)),
	  logger_(logger ? std::move(logger) : Logger::NullLogger::instance())
{
	if (options_.connectTimeout.count() < 0 || options_.timeout.count() < 0) {
		throw std::invalid_argument("NegativeTimeoutError(CurlHttpTransport::CurlHttpTransport)");
	}
	if (options_.maxRedirects < -1) {
		throw std::invalid_argument("InvalidMaxRedirectsError(CurlHttpTransport::CurlHttpTransport)");
	}
}

CurlHttpTransport::~CurlHttpTransport() noexcept = default;

Result<HttpResponse> CurlHttpTransport::perform(const HttpRequest &request) const
{
	if (request.timeout.has_value() && request.timeout->count() < 0) {
		logger_->error("InvalidTimeoutError", {{"url", request.url}});
		return transportError(fmt::format("InvalidTimeoutError: {}ms", request.timeout->count()));
	}

	const CurlHelper::CurlHandle curl;

	CurlHelper::CurlUrlHandle urlHandle;
	if (const CURLUcode uc = urlHandle.setUrl(request.url.c_str()); uc != CURLUE_OK) {
		logger_->error("InvalidUrlError", {{"error", curl_url_strerror(uc)}});
		return transportError(fmt::format("InvalidUrlError: {}: {}", curl_url_strerror(uc), request.url));
	}

	if (!request.query.empty()) {
		const std::string qs = CurlHelper::CurlUrlSearchParams(curl, request.query).toString();
		if (const CURLUcode uc = urlHandle.appendQuery(qs.c_str()); uc != CURLUE_OK) {
			logger_->error("QueryAppendError", {{"error", curl_url_strerror(uc)}});
			return transportError(fmt::format("QueryAppendError: {}", curl_url_strerror(uc)));
		}
	}

	std::unique_ptr<char, decltype(&curl_free)> url(nullptr, curl_free);
	if (const CURLUcode uc = urlHandle.toString(url); uc != CURLUE_OK || !url) {
		logger_->error("GetUrlError", {{"error", curl_url_strerror(uc)}});
		return transportError(fmt::format("GetUrlError: {}", curl_url_strerror(uc)));
	}

	CurlHelper::CurlSlistHandle headers;
	for (const auto &[name, value] : request.headers) {
		headers.appendHeader(name, value);
	}

	const ByteString postData = encodeBody(curl, request.body);

	ByteString responseBody;
	CurlHelper::CurlResponseHeaderList responseHeaders;
	char errorBuffer[CURL_ERROR_SIZE] = {};

	CURL *const handle = curl.get();

	setOption(handle, CURLOPT_URL, url.get());
	setOption(handle, CURLOPT_PROTOCOLS_STR, kAllowedProtocols);
	setOption(handle, CURLOPT_REDIR_PROTOCOLS_STR, kAllowedProtocols);
	setOption(handle, CURLOPT_HTTPHEADER, headers.get());

	switch (request.method) {
	case HttpMethod::Get:
		setOption(handle, CURLOPT_HTTPGET, 1L);
		break;
	case HttpMethod::Post:
		setOption(handle, CURLOPT_POST, 1L);
		setOption(handle, CURLOPT_POSTFIELDS, postData.data());
		setOption(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(postData.size()));
		break;
	}

	setOption(handle, CURLOPT_WRITEFUNCTION, CurlHelper::CurlStringWriteCallback);
	setOption(handle, CURLOPT_WRITEDATA, &responseBody);
	setOption(handle, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderListCallback);
	setOption(handle, CURLOPT_HEADERDATA, &responseHeaders);
	setOption(handle, CURLOPT_ERRORBUFFER, errorBuffer);

	const auto timeout = request.timeout.value_or(options_.timeout);
	setOption(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connectTimeout.count()));
	setOption(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
	setOption(handle, CURLOPT_NOSIGNAL, 1L);

	if (options_.followRedirects) {
		setOption(handle, CURLOPT_FOLLOWLOCATION, 1L);
		setOption(handle, CURLOPT_MAXREDIRS, options_.maxRedirects);
	}

	setOption(handle, CURLOPT_SSL_VERIFYPEER, options_.verifyPeer ? 1L : 0L);
	setOption(handle, CURLOPT_SSL_VERIFYHOST, options_.verifyPeer ? 2L : 0L);
	if (options_.caInfo.has_value()) {
		setOption(handle, CURLOPT_CAINFO, options_.caInfo->c_str());
	}

	logger_->debug("HttpRequestStarting", {{"method", toString(request.method)}, {"url", request.url}});

	const CURLcode res = curl_easy_perform(handle);

	if (res != CURLE_OK) {
		const std::string detail = errorBuffer[0] != '\0' ? std::string(errorBuffer) : curl_easy_strerror(res);
		logger_->error("CurlPerformError", {{"error", curl_easy_strerror(res)}, {"detail", detail}});
		return transportError(fmt::format("CurlPerformError: {}", detail));
	}

	long statusCode = 0;
	if (const CURLcode rc = curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &statusCode); rc != CURLE_OK) {
		logger_->error("CurlGetinfoError", {{"error", curl_easy_strerror(rc)}});
		return transportError(fmt::format("CurlGetinfoError: {}", curl_easy_strerror(rc)));
	}

	// Non-HTTP transfers complete without a status line.
	if (statusCode == 0) {
		logger_->error("NoHttpResponseError", {{"url", request.url}});
		return transportError(fmt::format("NoHttpResponseError: {}", request.url));
	}

	const std::string status = std::to_string(statusCode);
	logger_->debug("HttpResponseReceived", {{"url", request.url}, {"status", status}});

	return HttpResponse{statusCode, std::move(responseHeaders), std::move(responseBody)};
}

} // namespace OAuthKit::OAuth2
