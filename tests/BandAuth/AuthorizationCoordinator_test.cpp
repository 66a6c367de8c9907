/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <curl/curl.h>

#include <AuthorizationCoordinator.hpp>
#include <BandError.hpp>
#include <MemorySecretStore.hpp>
#include <NullLogger.hpp>

#include <TestFakes.hpp>

using namespace OpenBand;
using namespace OpenBand::BandAuth;
using OpenBand::Testing::FakeRedirectReceiver;
using OpenBand::Testing::jsonResponse;
using OpenBand::Testing::RecordingHttpTransport;

class AuthorizationCoordinatorTest : public ::testing::Test {
protected:
	static void SetUpTestSuite() { curl_global_init(CURL_GLOBAL_DEFAULT); }
	static void TearDownTestSuite() { curl_global_cleanup(); }

	void SetUp() override
	{
		request.client_id = "abc";
		request.client_secret = "xyz";
		userAgent->onOpenUrl = [this](const std::string &url) { openedUrls.push_back(url); };
	}

	std::unique_ptr<AuthorizationCoordinator> makeCoordinator()
	{
		return std::make_unique<AuthorizationCoordinator>(request, settings, transport, secretStore, receiver,
								  userAgent, Logger::NullLogger::instance());
	}

	BandAuthorizationRequest request;
	AuthorizationSettings settings;
	std::shared_ptr<RecordingHttpTransport> transport = std::make_shared<RecordingHttpTransport>();
	std::shared_ptr<MemorySecretStore> secretStore = std::make_shared<MemorySecretStore>();
	std::shared_ptr<FakeRedirectReceiver> receiver = std::make_shared<FakeRedirectReceiver>("XYZ");
	std::shared_ptr<BandOAuth2FlowUserAgent> userAgent = std::make_shared<BandOAuth2FlowUserAgent>();
	std::vector<std::string> openedUrls;
};

TEST_F(AuthorizationCoordinatorTest, GetAuthorizationUrl)
{
	const auto coordinator = makeCoordinator();

	EXPECT_EQ(coordinator->getAuthorizationUrl(),
		  "https://auth.band.us/oauth2/authorize?response_type=code&client_id=abc&redirect_uri=http%3A%2F%2Flocalhost%3A8000");
}

TEST_F(AuthorizationCoordinatorTest, GetTokenExchangeUrl)
{
	const auto coordinator = makeCoordinator();

	EXPECT_EQ(coordinator->getTokenExchangeUrl("XYZ"),
		  "https://auth.band.us/oauth2/token?code=XYZ&grant_type=authorization_code");
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_RunsFullFlow)
{
	transport->enqueue(jsonResponse(200, R"({"access_token":"T1","token_type":"bearer","expires_in":315359999})"));
	const auto coordinator = makeCoordinator();

	EXPECT_EQ(coordinator->ensureAccessToken(), "T1");
	EXPECT_EQ(coordinator->state(), AuthorizationState::Tokenized);

	ASSERT_TRUE(receiver->lastEndpoint.has_value());
	EXPECT_EQ(receiver->lastEndpoint->host, "localhost");
	EXPECT_EQ(receiver->lastEndpoint->port, 8000);
	EXPECT_EQ(receiver->lastTimeout, std::chrono::milliseconds(0));

	ASSERT_EQ(openedUrls.size(), 1u);
	EXPECT_EQ(openedUrls[0], coordinator->getAuthorizationUrl());

	ASSERT_EQ(transport->requests().size(), 1u);
	const auto &exchange = transport->requests()[0];
	EXPECT_EQ(exchange.method, "GET");
	EXPECT_EQ(exchange.url, "https://auth.band.us/oauth2/token");
	EXPECT_EQ(exchange.param("code"), "XYZ");
	EXPECT_EQ(exchange.param("grant_type"), "authorization_code");
	ASSERT_TRUE(exchange.basicAuth.has_value());
	EXPECT_EQ(exchange.basicAuth->username, "abc");
	EXPECT_EQ(exchange.basicAuth->password, "xyz");

	EXPECT_EQ(secretStore->get("openband", kAuthorizationCodeKey), "XYZ");
	EXPECT_EQ(secretStore->get("openband", kAccessTokenKey), "T1");
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_CachedTokenHasNoInteractions)
{
	transport->enqueue(jsonResponse(200, R"({"access_token":"T1"})"));
	const auto coordinator = makeCoordinator();

	ASSERT_EQ(coordinator->ensureAccessToken(), "T1");
	EXPECT_EQ(coordinator->ensureAccessToken(), "T1");

	EXPECT_EQ(transport->requests().size(), 1u);
	EXPECT_EQ(receiver->listenCount, 1);
	EXPECT_EQ(openedUrls.size(), 1u);
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_PreexistingTokenIsReturnedUnchanged)
{
	secretStore->set("openband", kAccessTokenKey, "CACHED");
	const auto coordinator = makeCoordinator();

	EXPECT_EQ(coordinator->ensureAccessToken(), "CACHED");
	EXPECT_EQ(coordinator->state(), AuthorizationState::Tokenized);
	EXPECT_TRUE(transport->requests().empty());
	EXPECT_EQ(receiver->listenCount, 0);
	EXPECT_TRUE(openedUrls.empty());
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_ListenerTimeoutIsPassedThrough)
{
	settings.listenerTimeout = std::chrono::seconds(30);
	transport->enqueue(jsonResponse(200, R"({"access_token":"T1"})"));
	const auto coordinator = makeCoordinator();

	coordinator->ensureAccessToken();

	EXPECT_EQ(receiver->lastTimeout, std::chrono::milliseconds(30000));
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_Non200IsAuthorizationError)
{
	transport->enqueue(jsonResponse(401, R"({"error":"invalid_client"})"));
	const auto coordinator = makeCoordinator();

	try {
		coordinator->ensureAccessToken();
		FAIL() << "AuthorizationError expected";
	} catch (const AuthorizationError &e) {
		EXPECT_NE(std::string(e.what()).find("401"), std::string::npos);
	}
	EXPECT_EQ(coordinator->state(), AuthorizationState::NoToken);
	EXPECT_FALSE(secretStore->get("openband", kAccessTokenKey).has_value());
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_MissingTokenIsAuthorizationError)
{
	transport->enqueue(jsonResponse(200, R"({"token_type":"bearer"})"));
	transport->enqueue(jsonResponse(200, R"({"access_token":""})"));
	transport->enqueue(jsonResponse(200, "<html></html>"));
	const auto coordinator = makeCoordinator();

	EXPECT_THROW(coordinator->ensureAccessToken(), AuthorizationError);
	EXPECT_THROW(coordinator->ensureAccessToken(), AuthorizationError);
	EXPECT_THROW(coordinator->ensureAccessToken(), AuthorizationError);
	EXPECT_FALSE(secretStore->get("openband", kAccessTokenKey).has_value());
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_RedirectFailurePropagates)
{
	receiver->failure = "ConsentDeniedError(access_denied)";
	const auto coordinator = makeCoordinator();

	EXPECT_THROW(coordinator->ensureAccessToken(), AuthorizationError);
	EXPECT_EQ(coordinator->state(), AuthorizationState::NoToken);
	EXPECT_FALSE(receiver->listening);
	EXPECT_TRUE(transport->requests().empty());
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_InvalidResponseTypeIsConfigurationError)
{
	request.response_type = "token";
	const auto coordinator = makeCoordinator();

	EXPECT_THROW(coordinator->ensureAccessToken(), ConfigurationError);
	EXPECT_EQ(receiver->listenCount, 0);
	EXPECT_TRUE(openedUrls.empty());
}

TEST_F(AuthorizationCoordinatorTest, EnsureAccessToken_InvalidGrantTypeIsConfigurationError)
{
	request.grant_type = "password";
	const auto coordinator = makeCoordinator();

	EXPECT_THROW(coordinator->ensureAccessToken(), ConfigurationError);
	EXPECT_TRUE(transport->requests().empty());
}

TEST_F(AuthorizationCoordinatorTest, Constructor_RequiresCredentials)
{
	request.client_secret.clear();

	EXPECT_THROW(makeCoordinator(), ConfigurationError);
}

TEST_F(AuthorizationCoordinatorTest, Logout_ErasesSecrets)
{
	secretStore->set("openband", kAccessTokenKey, "T1");
	secretStore->set("openband", kAuthorizationCodeKey, "XYZ");
	const auto coordinator = makeCoordinator();

	coordinator->logout();

	EXPECT_FALSE(secretStore->get("openband", kAccessTokenKey).has_value());
	EXPECT_FALSE(secretStore->get("openband", kAuthorizationCodeKey).has_value());
}
