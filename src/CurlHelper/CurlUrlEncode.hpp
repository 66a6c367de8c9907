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
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace OpenBand::CurlHelper {

inline std::string curlEscape(CURL *curl, const std::string &s)
{
	std::unique_ptr<char, decltype(&curl_free)> escaped(
		curl_easy_escape(curl, s.c_str(), static_cast<int>(s.length())), curl_free);
	if (!escaped) {
		throw std::runtime_error("EncodeError(curlEscape)");
	}
	return escaped.get();
}

// "k1=v1&k2=v2" with every key and value percent-encoded, in the given order.
inline std::string encodeSearchParams(CURL *curl, std::span<const std::pair<std::string, std::string>> params)
{
	if (!curl) {
		throw std::invalid_argument("CurlIsNullError(encodeSearchParams)");
	}

	std::string out;
	for (const auto &[key, value] : params) {
		if (!out.empty()) {
			out += '&';
		}
		out += curlEscape(curl, key);
		out += '=';
		out += curlEscape(curl, value);
	}
	return out;
}

} // namespace OpenBand::CurlHelper
