/*
 * OpenBand - Config
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include <ILogger.hpp>

namespace OpenBand {

struct ClientConfig {
	std::string client_id;
	std::string client_secret;
	std::string redirect_uri = "http://localhost:8000";
	std::string auth_base_url = "https://auth.band.us";
	std::string api_base_url = "https://openapi.band.us";
	std::string secret_namespace = "openband";
	std::string secret_store = "keychain"; // "keychain" or "file"
	std::string secret_file;
	std::int64_t listener_timeout_seconds = 0;
	std::string locale = "ko_KR";
	std::string log_level = "info";

	NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(ClientConfig, client_id, client_secret, redirect_uri, auth_base_url,
						    api_base_url, secret_namespace, secret_store, secret_file,
						    listener_timeout_seconds, locale, log_level)

	// Largest listener timeout a Qt wait can express in milliseconds.
	static constexpr std::int64_t kMaxListenerTimeoutSeconds = 2147483;

	// File this configuration was loaded from; empty for a default-constructed one. Not serialized.
	std::filesystem::path config_path;

	/**
	 * Reads path, then applies OPENBAND_CLIENT_ID and OPENBAND_CLIENT_SECRET from the environment.
	 *
	 * A missing file yields the defaults. An unreadable file, invalid JSON, or an invalid value
	 * throws ConfigurationError.
	 */
	static ClientConfig load(const std::filesystem::path &path, const Logger::ILogger &logger);

	// $OPENBAND_CONFIG, else $XDG_CONFIG_HOME/openband/config.json, else $HOME/.config/openband/config.json.
	static std::filesystem::path defaultConfigPath();

	// secret_file, or secrets.json beside config_path (or the default config file) when it is empty.
	std::filesystem::path secretFilePath() const;

	void validate(const Logger::ILogger &logger) const;
};

} // namespace OpenBand
