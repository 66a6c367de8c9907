/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "CurlHttpTransport.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <CurlSlistHandle.hpp>
#include <CurlUrlEncode.hpp>
#include <CurlUrlHandle.hpp>
#include <CurlWriteCallback.hpp>

#include "BandError.hpp"

namespace OpenBand {

CurlHttpTransport::CurlHttpTransport(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(CurlHttpTransport::CurlHttpTransport)"))
{
}

CurlHttpTransport::~CurlHttpTransport() noexcept = default;

HttpResponse CurlHttpTransport::get(const std::string &url, const QueryParams &query,
				    const std::optional<BasicAuth> &basicAuth)
{
	return perform("GET", url, query, basicAuth);
}

HttpResponse CurlHttpTransport::post(const std::string &url, const QueryParams &query)
{
	return perform("POST", url, query, std::nullopt);
}

HttpResponse CurlHttpTransport::perform(const std::string &method, const std::string &url, const QueryParams &query,
					const std::optional<BasicAuth> &basicAuth)
{
	curl_.reset();
	CURL *curl = curl_.get();

	CurlHelper::CurlUrlHandle urlHandle;
	urlHandle.setUrl(url);
	urlHandle.appendQuery(CurlHelper::encodeSearchParams(curl, query));
	const std::string fullUrl = urlHandle.toString();

	CurlHelper::CurlSlistHandle requestHeaders;
	requestHeaders.append("Accept: application/json");

	std::vector<char> readBuffer;
	CurlHelper::CurlHeaderMap headers;

	curl_easy_setopt(curl, CURLOPT_URL, fullUrl.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, requestHeaders.get());
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "OpenBand/" OPENBAND_VERSION);
	if (method == "POST") {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
	} else {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	}

	if (basicAuth) {
		curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
		curl_easy_setopt(curl, CURLOPT_USERNAME, basicAuth->username.c_str());
		curl_easy_setopt(curl, CURLOPT_PASSWORD, basicAuth->password.c_str());
	}

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlHelper::CurlCharVectorWriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CurlHelper::CurlHeaderMapCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);

	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
	curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

	logger_->debug("HttpRequestStarted", {{"method", method}, {"url", url}});

	const CURLcode res = curl_easy_perform(curl);
	if (res != CURLE_OK) {
		logger_->error("CurlPerformError", {{"method", method}, {"url", url}, {"error", curl_easy_strerror(res)}});
		throw TransportError(
			fmt::format("CurlPerformError(CurlHttpTransport::perform): {}", curl_easy_strerror(res)));
	}

	HttpResponse response;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
	response.headers = std::move(headers);
	response.body.assign(readBuffer.begin(), readBuffer.end());

	const std::string status = std::to_string(response.status);
	logger_->debug("HttpRequestFinished", {{"method", method}, {"url", url}, {"status", status}});

	return response;
}

} // namespace OpenBand
