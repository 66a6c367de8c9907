/*
 * OpenBand - CurlHelper
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <curl/curl.h>

namespace OpenBand::CurlHelper {

class CurlHandle {
	[[nodiscard]]
	static auto createCurlHandle()
	{
		CURL *curl = curl_easy_init();
		if (!curl)
			throw std::runtime_error("CurlInitError(CurlHandle)");
		return std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>(curl, &curl_easy_cleanup);
	}

public:
	CurlHandle() : curl_(createCurlHandle()) {}

	~CurlHandle() noexcept = default;

	CurlHandle(const CurlHandle &) = delete;
	CurlHandle &operator=(const CurlHandle &) = delete;
	CurlHandle(CurlHandle &&) = delete;
	CurlHandle &operator=(CurlHandle &&) = delete;

	[[nodiscard]]
	CURL *get() const noexcept
	{
		return curl_.get();
	}

	// Clears every option set by a previous request so the handle can be reused.
	void reset() noexcept { curl_easy_reset(curl_.get()); }

private:
	std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

} // namespace OpenBand::CurlHelper
