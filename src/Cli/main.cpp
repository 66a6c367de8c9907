/*
 * OpenBand - Cli
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <QCoreApplication>
#include <QDesktopServices>
#include <QGuiApplication>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <curl/curl.h>

#include <AuthorizationCoordinator.hpp>
#include <BandApiClient.hpp>
#include <BandError.hpp>
#include <ClientConfig.hpp>
#include <CurlHttpTransport.hpp>
#include <JsonFileSecretStore.hpp>
#include <KeychainSecretStore.hpp>
#include <PrintLogger.hpp>
#include <QtRedirectListener.hpp>

#include "CommandRunner.hpp"

using namespace OpenBand;

namespace {

class CurlGlobalScope {
public:
	CurlGlobalScope()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("CurlGlobalInitError(CurlGlobalScope)");
		}
	}
	~CurlGlobalScope() noexcept { curl_global_cleanup(); }

	CurlGlobalScope(const CurlGlobalScope &) = delete;
	CurlGlobalScope &operator=(const CurlGlobalScope &) = delete;
};

std::shared_ptr<ISecretStore> makeSecretStore(const ClientConfig &config,
					      std::shared_ptr<const Logger::ILogger> logger)
{
	if (config.secret_store == "file") {
		return std::make_shared<JsonFileSecretStore>(config.secretFilePath(), std::move(logger));
	}
	return std::make_shared<KeychainSecretStore>(std::move(logger));
}

std::shared_ptr<BandAuth::BandOAuth2FlowUserAgent> makeUserAgent(std::shared_ptr<const Logger::ILogger> logger)
{
	auto userAgent = std::make_shared<BandAuth::BandOAuth2FlowUserAgent>();
	userAgent->onOpenUrl = [logger](const std::string &url) {
		std::cerr << "Open the following URL in your browser to authorize OpenBand:\n" << url << std::endl;
		if (!qobject_cast<QGuiApplication *>(QCoreApplication::instance())) {
			logger->info("BrowserUnavailable");
			return;
		}
		if (!QDesktopServices::openUrl(QUrl(QString::fromStdString(url)))) {
			logger->warn("BrowserOpenFailed");
		}
	};
	return userAgent;
}

int runCli(const std::vector<std::string> &args)
{
	Cli::CliInvocation invocation;
	try {
		invocation = Cli::parseCommandLine(args);
	} catch (const Cli::UsageError &e) {
		std::cerr << "openband: " << e.what() << "\n\n" << Cli::usageText();
		return 2;
	}

	try {
		const auto bootstrapLogger = std::make_shared<const Logger::PrintLogger>(Logger::LogLevel::Warn);
		const ClientConfig config =
			ClientConfig::load(invocation.configPath.value_or(ClientConfig::defaultConfigPath()), *bootstrapLogger);

		const auto logger = std::make_shared<const Logger::PrintLogger>(
			Logger::PrintLogger::parseLevel(config.log_level).value_or(Logger::LogLevel::Info));

		const auto transport = std::make_shared<CurlHttpTransport>(logger);
		const auto secretStore = makeSecretStore(config, logger);

		BandAuth::BandAuthorizationRequest request;
		request.client_id = config.client_id;
		request.client_secret = config.client_secret;
		request.redirect_uri = config.redirect_uri;

		BandAuth::AuthorizationSettings authSettings;
		authSettings.authBaseUrl = config.auth_base_url;
		authSettings.secretNamespace = config.secret_namespace;
		authSettings.listenerTimeout = std::chrono::seconds(config.listener_timeout_seconds);

		auto coordinator = std::make_shared<BandAuth::AuthorizationCoordinator>(
			std::move(request), std::move(authSettings), transport, secretStore,
			std::make_shared<BandAuth::QtRedirectListener>(logger), makeUserAgent(logger), logger);

		BandApi::BandApiSettings apiSettings;
		apiSettings.apiBaseUrl = config.api_base_url;
		apiSettings.secretNamespace = config.secret_namespace;
		apiSettings.locale = config.locale;

		auto client = std::make_shared<BandApi::BandApiClient>(std::move(apiSettings), transport, secretStore,
								       logger);

		Cli::CommandRunner runner(std::move(coordinator), std::move(client), logger, std::cout);
		runner.run(invocation.command, invocation.args);
		return 0;
	} catch (const Cli::UsageError &e) {
		std::cerr << "openband: " << e.what() << "\n\n" << Cli::usageText();
		return 2;
	} catch (const BandError &e) {
		std::cerr << "openband: " << e.what() << std::endl;
		return 1;
	} catch (const std::exception &e) {
		std::cerr << "openband: unexpected error: " << e.what() << std::endl;
		return 1;
	}
}

} // anonymous namespace

int main(int argc, char *argv[])
{
	// Without a display QGuiApplication cannot load a platform plugin, so headless hosts run on
	// QCoreApplication and only print the authorization URL.
	const bool graphical =
		Cli::hasGraphicalSession([](const char *name) -> const char * { return std::getenv(name); });
	std::unique_ptr<QCoreApplication> app;
	if (graphical) {
		app = std::make_unique<QGuiApplication>(argc, argv);
	} else {
		app = std::make_unique<QCoreApplication>(argc, argv);
	}
	CurlGlobalScope curlGlobalScope;

	std::vector<std::string> args;
	const QStringList arguments = QCoreApplication::arguments();
	for (qsizetype i = 1; i < arguments.size(); ++i) {
		args.push_back(arguments[i].toStdString());
	}

	return runCli(args);
}
