/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <chrono>
#include <string>

#include "BandAuthorizationRequest.hpp"

namespace OpenBand::BandAuth {

/**
 * Catches the single browser redirect that carries the authorization code.
 *
 * listen() binds before the browser is opened. waitForCode() blocks until exactly one request has
 * arrived, answers it, and stops listening whatever the outcome. A zero timeout waits forever.
 */
class IRedirectReceiver {
public:
	IRedirectReceiver() = default;
	virtual ~IRedirectReceiver() = default;

	IRedirectReceiver(const IRedirectReceiver &) = delete;
	IRedirectReceiver &operator=(const IRedirectReceiver &) = delete;
	IRedirectReceiver(IRedirectReceiver &&) = delete;
	IRedirectReceiver &operator=(IRedirectReceiver &&) = delete;

	virtual void listen(const RedirectEndpoint &endpoint) = 0;
	virtual std::string waitForCode(std::chrono::milliseconds timeout) = 0;
	virtual void close() noexcept = 0;
};

} // namespace OpenBand::BandAuth
