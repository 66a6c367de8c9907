/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace OpenBand {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct BasicAuth {
	std::string username;
	std::string password;
};

struct HttpResponse {
	long status = 0;
	std::map<std::string, std::string> headers; // lower-cased names
	std::string body;

	std::optional<std::string> header(const std::string &lowerCaseName) const
	{
		auto it = headers.find(lowerCaseName);
		if (it == headers.end())
			return std::nullopt;
		return it->second;
	}
};

/**
 * Blocking HTTP client used by every BAND call.
 *
 * Parameters always travel in the URL query string; the API takes no request bodies. Failures
 * that leave no HTTP status (DNS, connect, TLS) throw TransportError. Any status, 2xx or not, is
 * returned to the caller.
 */
class IHttpTransport {
public:
	IHttpTransport() = default;
	virtual ~IHttpTransport() = default;

	IHttpTransport(const IHttpTransport &) = delete;
	IHttpTransport &operator=(const IHttpTransport &) = delete;
	IHttpTransport(IHttpTransport &&) = delete;
	IHttpTransport &operator=(IHttpTransport &&) = delete;

	virtual HttpResponse get(const std::string &url, const QueryParams &query,
				 const std::optional<BasicAuth> &basicAuth = std::nullopt) = 0;

	virtual HttpResponse post(const std::string &url, const QueryParams &query) = 0;
};

} // namespace OpenBand
