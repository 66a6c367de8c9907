/*
 * OpenBand - CurlHelper
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <curl/curl.h>

namespace OpenBand::CurlHelper {

inline std::size_t CurlCharVectorWriteCallback(void *contents, std::size_t size, std::size_t nmemb,
					       void *userp) noexcept
{
	if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size)) {
		return CURL_WRITEFUNC_ERROR;
	}

	std::size_t totalSize = size * nmemb;

	try {
		auto *vec = static_cast<std::vector<char> *>(userp);
		const auto *start = static_cast<const char *>(contents);
		vec->insert(vec->end(), start, start + totalSize);
	} catch (...) {
		return CURL_WRITEFUNC_ERROR;
	}

	return totalSize;
}

// Header names are lower-cased; a later header with the same name overwrites an earlier one.
using CurlHeaderMap = std::map<std::string, std::string>;

inline std::size_t CurlHeaderMapCallback(char *buffer, std::size_t size, std::size_t nitems, void *userp) noexcept
{
	if (size != 0 && nitems > (std::numeric_limits<std::size_t>::max() / size)) {
		return 0;
	}

	std::size_t totalSize = size * nitems;

	try {
		auto *headers = static_cast<CurlHeaderMap *>(userp);
		std::string_view line(buffer, totalSize);

		// A status line starts every response in a redirect chain; keep only the last one's headers.
		if (line.rfind("HTTP/", 0) == 0) {
			headers->clear();
			return totalSize;
		}

		std::size_t colon = line.find(':');
		if (colon == std::string_view::npos) {
			return totalSize;
		}

		std::string name(line.substr(0, colon));
		std::transform(name.begin(), name.end(), name.begin(),
			       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		std::string_view value = line.substr(colon + 1);
		const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
		while (!value.empty() && isSpace(value.front()))
			value.remove_prefix(1);
		while (!value.empty() && isSpace(value.back()))
			value.remove_suffix(1);

		(*headers)[std::move(name)] = std::string(value);
	} catch (...) {
		return 0;
	}

	return totalSize;
}

} // namespace OpenBand::CurlHelper
