/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <string>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <HttpTransport.hpp>

namespace OpenBand::BandAuth {

struct BandAuthorizationRequest {
	std::string client_id;
	std::string client_secret;
	std::string redirect_uri = "http://localhost:8000";
	std::string response_type = "code";
	std::string grant_type = "authorization_code";

	// Throws ConfigurationError unless response_type is "code".
	QueryParams authorizeParams() const;

	// Throws ConfigurationError unless grant_type is "authorization_code".
	QueryParams tokenParams(const std::string &code) const;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BandAuthorizationRequest, client_id, client_secret, redirect_uri,
						response_type, grant_type)

struct RedirectEndpoint {
	std::string host;
	std::uint16_t port = 0;
};

// Host and port the local listener binds to. Throws ConfigurationError for anything but an http URL.
RedirectEndpoint parseRedirectEndpoint(const std::string &redirectUri);

// Percent-encodes params in order, e.g. "response_type=code&client_id=abc".
std::string encodeQuery(CURL *curl, const QueryParams &params);

} // namespace OpenBand::BandAuth
