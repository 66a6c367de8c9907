/*
 * OpenBand - Config
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "ClientConfig.hpp"

#include <cstdlib>
#include <fstream>

#include <BandError.hpp>
#include <PrintLogger.hpp>

namespace OpenBand {

namespace {

std::string getEnv(const char *name)
{
	const char *value = std::getenv(name);
	return value ? std::string(value) : std::string();
}

} // anonymous namespace

ClientConfig ClientConfig::load(const std::filesystem::path &path, const Logger::ILogger &logger)
{
	ClientConfig config;

	std::error_code ec;
	if (std::filesystem::exists(path, ec)) {
		std::ifstream ifs(path, std::ios::in);
		if (!ifs.is_open()) {
			logger.error("ConfigOpenError", {{"path", path.string()}});
			throw ConfigurationError("ConfigOpenError(ClientConfig::load):" + path.string());
		}

		try {
			config = nlohmann::json::parse(ifs).get<ClientConfig>();
		} catch (const nlohmann::json::exception &e) {
			logger.error("ConfigParseError", {{"path", path.string()}, {"exception", e.what()}});
			throw ConfigurationError("ConfigParseError(ClientConfig::load):" + path.string());
		}
		logger.debug("ConfigLoaded", {{"path", path.string()}});
	} else {
		logger.info("ConfigNotFound", {{"path", path.string()}});
	}

	if (std::string clientId = getEnv("OPENBAND_CLIENT_ID"); !clientId.empty()) {
		config.client_id = std::move(clientId);
	}
	if (std::string clientSecret = getEnv("OPENBAND_CLIENT_SECRET"); !clientSecret.empty()) {
		config.client_secret = std::move(clientSecret);
	}

	config.config_path = path;
	config.validate(logger);
	return config;
}

std::filesystem::path ClientConfig::defaultConfigPath()
{
	if (std::string configPath = getEnv("OPENBAND_CONFIG"); !configPath.empty()) {
		return configPath;
	}
	if (std::string xdgConfigHome = getEnv("XDG_CONFIG_HOME"); !xdgConfigHome.empty()) {
		return std::filesystem::path(xdgConfigHome) / "openband" / "config.json";
	}
	if (std::string home = getEnv("HOME"); !home.empty()) {
		return std::filesystem::path(home) / ".config" / "openband" / "config.json";
	}
	return std::filesystem::path("openband.json");
}

std::filesystem::path ClientConfig::secretFilePath() const
{
	if (!secret_file.empty()) {
		return secret_file;
	}
	std::filesystem::path base = config_path.empty() ? defaultConfigPath() : config_path;
	return base.replace_filename("secrets.json");
}

void ClientConfig::validate(const Logger::ILogger &logger) const
{
	if (secret_store != "keychain" && secret_store != "file") {
		logger.error("InvalidSecretStoreError", {{"secretStore", secret_store}});
		throw ConfigurationError("InvalidSecretStoreError(ClientConfig::validate):" + secret_store);
	}
	if (listener_timeout_seconds < 0 || listener_timeout_seconds > kMaxListenerTimeoutSeconds) {
		logger.error("InvalidListenerTimeoutError");
		throw ConfigurationError("InvalidListenerTimeoutError(ClientConfig::validate)");
	}
	if (!Logger::PrintLogger::parseLevel(log_level)) {
		logger.error("InvalidLogLevelError", {{"logLevel", log_level}});
		throw ConfigurationError("InvalidLogLevelError(ClientConfig::validate):" + log_level);
	}
	if (secret_namespace.empty()) {
		logger.error("SecretNamespaceIsEmptyError");
		throw ConfigurationError("SecretNamespaceIsEmptyError(ClientConfig::validate)");
	}
}

} // namespace OpenBand
