/*
 * OpenBand - CurlHelper
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace OpenBand::CurlHelper {

class CurlSlistHandle {
public:
	CurlSlistHandle() = default;
	~CurlSlistHandle() noexcept { curl_slist_free_all(slist_); }

	CurlSlistHandle(const CurlSlistHandle &) = delete;
	CurlSlistHandle &operator=(const CurlSlistHandle &) = delete;
	CurlSlistHandle(CurlSlistHandle &&) = delete;
	CurlSlistHandle &operator=(CurlSlistHandle &&) = delete;

	void append(const std::string &line)
	{
		curl_slist *next = curl_slist_append(slist_, line.c_str());
		if (!next) {
			throw std::runtime_error("AppendError(CurlSlistHandle)");
		}
		slist_ = next;
	}

	curl_slist *get() const noexcept { return slist_; }

private:
	curl_slist *slist_ = nullptr;
};

} // namespace OpenBand::CurlHelper
