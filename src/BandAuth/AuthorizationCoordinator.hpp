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
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <CurlHandle.hpp>
#include <HttpTransport.hpp>
#include <ILogger.hpp>
#include <SecretStore.hpp>

#include "BandAuthorizationRequest.hpp"
#include "RedirectReceiver.hpp"

namespace OpenBand::BandAuth {

struct BandOAuth2FlowUserAgent {
	std::function<void(const std::string &url)> onOpenUrl;
};

struct AuthorizationSettings {
	std::string authBaseUrl = "https://auth.band.us";
	std::string secretNamespace = "openband";
	// Zero waits for the browser redirect forever.
	std::chrono::seconds listenerTimeout{0};
};

enum class AuthorizationState { NoToken, AwaitingRedirect, CodeReceived, Exchanging, Tokenized };

std::string_view toString(AuthorizationState state) noexcept;

/**
 * Obtains the BAND access token through the OAuth2 authorization-code grant and caches it.
 *
 * ensureAccessToken() returns a cached token untouched. Otherwise it opens the consent page through
 * the user agent, blocks on the redirect receiver for the code, exchanges the code with HTTP Basic
 * authentication, and stores both the code and the token. Nothing is retried: on any failure the
 * state goes back to NoToken and the error reaches the caller.
 *
 * The cached token never expires here and is never refreshed.
 */
class AuthorizationCoordinator {
public:
	AuthorizationCoordinator(BandAuthorizationRequest request, AuthorizationSettings settings,
				 std::shared_ptr<IHttpTransport> transport, std::shared_ptr<ISecretStore> secretStore,
				 std::shared_ptr<IRedirectReceiver> redirectReceiver,
				 std::shared_ptr<BandOAuth2FlowUserAgent> userAgent,
				 std::shared_ptr<const Logger::ILogger> logger);
	~AuthorizationCoordinator() noexcept;

	AuthorizationCoordinator(const AuthorizationCoordinator &) = delete;
	AuthorizationCoordinator &operator=(const AuthorizationCoordinator &) = delete;
	AuthorizationCoordinator(AuthorizationCoordinator &&) = delete;
	AuthorizationCoordinator &operator=(AuthorizationCoordinator &&) = delete;

	std::string ensureAccessToken();

	// Forgets the cached authorization code and access token.
	void logout();

	[[nodiscard]]
	std::string getAuthorizationUrl() const;

	[[nodiscard]]
	std::string getTokenExchangeUrl(const std::string &code) const;

	AuthorizationState state() const noexcept { return state_; }

private:
	std::string exchangeCode(const std::string &code);

	const BandAuthorizationRequest request_;
	const AuthorizationSettings settings_;
	const std::shared_ptr<IHttpTransport> transport_;
	const std::shared_ptr<ISecretStore> secretStore_;
	const std::shared_ptr<IRedirectReceiver> redirectReceiver_;
	const std::shared_ptr<BandOAuth2FlowUserAgent> userAgent_;
	const std::shared_ptr<const Logger::ILogger> logger_;

	CurlHelper::CurlHandle curl_;
	AuthorizationState state_ = AuthorizationState::NoToken;
};

} // namespace OpenBand::BandAuth
