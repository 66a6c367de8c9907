/*
 * OpenBand - CurlHelper
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace OpenBand::CurlHelper {

class CurlUrlHandle {
public:
	CurlUrlHandle() : handle_(curl_url())
	{
		if (!handle_) {
			throw std::runtime_error("InitError(CurlUrlHandle)");
		}
	}

	~CurlUrlHandle() noexcept { curl_url_cleanup(handle_); }

	CurlUrlHandle(const CurlUrlHandle &) = delete;
	CurlUrlHandle &operator=(const CurlUrlHandle &) = delete;

	void setUrl(const std::string &url)
	{
		CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, url.c_str(), 0);
		if (uc != CURLUE_OK) {
			throw std::invalid_argument("URLParseError(CurlUrlHandle):" + url);
		}
	}

	void appendQuery(const std::string &query)
	{
		if (query.empty())
			return;

		CURLUcode uc = curl_url_set(handle_, CURLUPART_QUERY, query.c_str(), CURLU_APPENDQUERY);
		if (uc != CURLUE_OK) {
			throw std::runtime_error("QueryAppendError(CurlUrlHandle):" + query);
		}
	}

	[[nodiscard]]
	std::string toString() const
	{
		char *urlStr = nullptr;
		CURLUcode uc = curl_url_get(handle_, CURLUPART_URL, &urlStr, 0);
		if (uc != CURLUE_OK || !urlStr) {
			throw std::runtime_error("GetUrlError(CurlUrlHandle)");
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(urlStr, curl_free);
		return std::string(guard.get());
	}

	[[nodiscard]]
	std::optional<std::string> getScheme() const
	{
		return getPart(CURLUPART_SCHEME, 0);
	}

	[[nodiscard]]
	std::optional<std::string> getHost() const
	{
		return getPart(CURLUPART_HOST, 0);
	}

	// Falls back to the scheme's default port when the URL names none.
	[[nodiscard]]
	std::optional<std::string> getPort() const
	{
		return getPart(CURLUPART_PORT, CURLU_DEFAULT_PORT);
	}

private:
	std::optional<std::string> getPart(CURLUPart part, unsigned int flags) const
	{
		char *partStr = nullptr;
		CURLUcode uc = curl_url_get(handle_, part, &partStr, flags);
		if (uc != CURLUE_OK || !partStr) {
			return std::nullopt;
		}
		std::unique_ptr<char, decltype(&curl_free)> guard(partStr, curl_free);
		return std::string(guard.get());
	}

	CURLU *const handle_;
};

} // namespace OpenBand::CurlHelper
