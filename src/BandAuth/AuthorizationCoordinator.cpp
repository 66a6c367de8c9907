/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "AuthorizationCoordinator.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <BandError.hpp>

#include "BandTokenResponse.hpp"

namespace OpenBand::BandAuth {

std::string_view toString(AuthorizationState state) noexcept
{
	switch (state) {
	case AuthorizationState::NoToken:
		return "NoToken";
	case AuthorizationState::AwaitingRedirect:
		return "AwaitingRedirect";
	case AuthorizationState::CodeReceived:
		return "CodeReceived";
	case AuthorizationState::Exchanging:
		return "Exchanging";
	case AuthorizationState::Tokenized:
		return "Tokenized";
	}
	return "Unknown";
}

AuthorizationCoordinator::AuthorizationCoordinator(BandAuthorizationRequest request, AuthorizationSettings settings,
						   std::shared_ptr<IHttpTransport> transport,
						   std::shared_ptr<ISecretStore> secretStore,
						   std::shared_ptr<IRedirectReceiver> redirectReceiver,
						   std::shared_ptr<BandOAuth2FlowUserAgent> userAgent,
						   std::shared_ptr<const Logger::ILogger> logger)
	: request_(std::move(request)),
	  settings_(std::move(settings)),
	  transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(AuthorizationCoordinator)")),
	  secretStore_(secretStore ? std::move(secretStore)
				   : throw std::invalid_argument("SecretStoreIsNullError(AuthorizationCoordinator)")),
	  redirectReceiver_(redirectReceiver
				    ? std::move(redirectReceiver)
				    : throw std::invalid_argument("RedirectReceiverIsNullError(AuthorizationCoordinator)")),
	  userAgent_(userAgent ? std::move(userAgent)
			       : throw std::invalid_argument("UserAgentIsNullError(AuthorizationCoordinator)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(AuthorizationCoordinator)"))
{
	if (request_.client_id.empty() || request_.client_secret.empty()) {
		logger_->error("CredentialsMissingError");
		throw ConfigurationError("CredentialsMissingError(AuthorizationCoordinator)");
	}
}

AuthorizationCoordinator::~AuthorizationCoordinator() noexcept = default;

std::string AuthorizationCoordinator::ensureAccessToken()
{
	if (auto cached = secretStore_->get(settings_.secretNamespace, kAccessTokenKey); cached && !cached->empty()) {
		logger_->debug("CachedAccessTokenUsed");
		state_ = AuthorizationState::Tokenized;
		return *cached;
	}

	state_ = AuthorizationState::NoToken;
	try {
		const std::string authorizationUrl = getAuthorizationUrl();
		const RedirectEndpoint endpoint = parseRedirectEndpoint(request_.redirect_uri);

		redirectReceiver_->listen(endpoint);
		state_ = AuthorizationState::AwaitingRedirect;

		logger_->info("AuthorizationUrlOpened", {{"url", authorizationUrl}});
		if (userAgent_->onOpenUrl) {
			userAgent_->onOpenUrl(authorizationUrl);
		}

		const std::string code = redirectReceiver_->waitForCode(settings_.listenerTimeout);
		state_ = AuthorizationState::CodeReceived;
		secretStore_->set(settings_.secretNamespace, kAuthorizationCodeKey, code);

		std::string accessToken = exchangeCode(code);
		state_ = AuthorizationState::Tokenized;
		return accessToken;
	} catch (const std::exception &e) {
		redirectReceiver_->close();
		logger_->error("AuthorizationFlowFailed",
			       {{"state", toString(state_)}, {"exception", e.what()}});
		state_ = AuthorizationState::NoToken;
		throw;
	}
}

void AuthorizationCoordinator::logout()
{
	secretStore_->erase(settings_.secretNamespace, kAccessTokenKey);
	secretStore_->erase(settings_.secretNamespace, kAuthorizationCodeKey);
	state_ = AuthorizationState::NoToken;
	logger_->info("LoggedOut");
}

std::string AuthorizationCoordinator::getAuthorizationUrl() const
{
	return fmt::format("{}/oauth2/authorize?{}", settings_.authBaseUrl,
			   encodeQuery(curl_.get(), request_.authorizeParams()));
}

std::string AuthorizationCoordinator::getTokenExchangeUrl(const std::string &code) const
{
	return fmt::format("{}/oauth2/token?{}", settings_.authBaseUrl,
			   encodeQuery(curl_.get(), request_.tokenParams(code)));
}

std::string AuthorizationCoordinator::exchangeCode(const std::string &code)
{
	const QueryParams params = request_.tokenParams(code);
	state_ = AuthorizationState::Exchanging;
	logger_->info("TokenExchanging");

	const HttpResponse response =
		transport_->get(settings_.authBaseUrl + "/oauth2/token", params,
				BasicAuth{request_.client_id, request_.client_secret});

	if (response.status != 200) {
		const std::string status = std::to_string(response.status);
		logger_->error("TokenExchangeError", {{"status", status}});
		throw AuthorizationError(fmt::format("TokenExchangeError(AuthorizationCoordinator::exchangeCode): HTTP {}",
						     response.status));
	}

	BandTokenResponse token;
	try {
		nlohmann::json::parse(response.body).get_to(token);
	} catch (const nlohmann::json::exception &e) {
		logger_->error("TokenResponseParseError", {{"exception", e.what()}});
		throw AuthorizationError("TokenResponseParseError(AuthorizationCoordinator::exchangeCode)");
	}

	if (token.access_token.empty()) {
		logger_->error("AccessTokenMissingError");
		throw AuthorizationError("AccessTokenMissingError(AuthorizationCoordinator::exchangeCode)");
	}

	secretStore_->set(settings_.secretNamespace, kAccessTokenKey, token.access_token);
	logger_->info("TokenExchanged");
	return token.access_token;
}

} // namespace OpenBand::BandAuth
