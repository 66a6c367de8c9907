/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BandAuthorizationRequest.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>

#include <CurlUrlEncode.hpp>
#include <CurlUrlHandle.hpp>

#include <BandError.hpp>

namespace OpenBand::BandAuth {

QueryParams BandAuthorizationRequest::authorizeParams() const
{
	if (response_type != "code") {
		throw ConfigurationError("InvalidResponseTypeError(BandAuthorizationRequest::authorizeParams):" +
					 response_type);
	}

	return {
		{"response_type", response_type},
		{"client_id", client_id},
		{"redirect_uri", redirect_uri},
	};
}

QueryParams BandAuthorizationRequest::tokenParams(const std::string &code) const
{
	if (grant_type != "authorization_code") {
		throw ConfigurationError("InvalidGrantTypeError(BandAuthorizationRequest::tokenParams):" + grant_type);
	}

	return {
		{"code", code},
		{"grant_type", grant_type},
	};
}

RedirectEndpoint parseRedirectEndpoint(const std::string &redirectUri)
{
	CurlHelper::CurlUrlHandle urlHandle;
	try {
		urlHandle.setUrl(redirectUri);
	} catch (const std::invalid_argument &) {
		throw ConfigurationError("InvalidRedirectUriError(parseRedirectEndpoint):" + redirectUri);
	}

	if (urlHandle.getScheme() != "http") {
		throw ConfigurationError("UnsupportedRedirectSchemeError(parseRedirectEndpoint):" + redirectUri);
	}

	const auto host = urlHandle.getHost();
	const auto port = urlHandle.getPort();
	if (!host || host->empty() || !port) {
		throw ConfigurationError("InvalidRedirectUriError(parseRedirectEndpoint):" + redirectUri);
	}

	unsigned int portNumber = 0;
	const char *first = port->data();
	const char *last = port->data() + port->size();
	auto [ptr, ec] = std::from_chars(first, last, portNumber);
	if (ec != std::errc() || ptr != last || portNumber == 0 ||
	    portNumber > std::numeric_limits<std::uint16_t>::max()) {
		throw ConfigurationError("InvalidRedirectPortError(parseRedirectEndpoint):" + redirectUri);
	}

	return RedirectEndpoint{*host, static_cast<std::uint16_t>(portNumber)};
}

std::string encodeQuery(CURL *curl, const QueryParams &params)
{
	return CurlHelper::encodeSearchParams(curl, params);
}

} // namespace OpenBand::BandAuth
