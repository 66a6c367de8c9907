/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <string>

#include <BandError.hpp>
#include <ClientConfig.hpp>
#include <NullLogger.hpp>

using namespace OpenBand;

class ClientConfigTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		for (const char *name : {"OPENBAND_CLIENT_ID", "OPENBAND_CLIENT_SECRET", "OPENBAND_CONFIG", "XDG_CONFIG_HOME"}) {
			const char *value = std::getenv(name);
			savedEnv[name] = value ? std::optional<std::string>(value) : std::nullopt;
			unsetenv(name);
		}

		std::random_device rd;
		dir = std::filesystem::temp_directory_path() / ("openband-config-test-" + std::to_string(rd()));
		std::filesystem::create_directories(dir);
		path = dir / "config.json";
	}

	void TearDown() override
	{
		for (const auto &[name, value] : savedEnv) {
			if (value) {
				setenv(name.c_str(), value->c_str(), 1);
			} else {
				unsetenv(name.c_str());
			}
		}

		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
	}

	void writeConfig(const std::string &text) { std::ofstream(path) << text; }

	const Logger::NullLogger &logger = *Logger::NullLogger::instance();
	std::map<std::string, std::optional<std::string>> savedEnv;
	std::filesystem::path dir;
	std::filesystem::path path;
};

TEST_F(ClientConfigTest, MissingFileYieldsDefaults)
{
	const ClientConfig config = ClientConfig::load(path, logger);

	EXPECT_TRUE(config.client_id.empty());
	EXPECT_EQ(config.redirect_uri, "http://localhost:8000");
	EXPECT_EQ(config.auth_base_url, "https://auth.band.us");
	EXPECT_EQ(config.api_base_url, "https://openapi.band.us");
	EXPECT_EQ(config.secret_namespace, "openband");
	EXPECT_EQ(config.secret_store, "keychain");
	EXPECT_EQ(config.listener_timeout_seconds, 0);
	EXPECT_EQ(config.locale, "ko_KR");
	EXPECT_EQ(config.log_level, "info");
}

TEST_F(ClientConfigTest, FileValuesOverrideDefaults)
{
	writeConfig(R"({"client_id":"abc","client_secret":"xyz","secret_store":"file","listener_timeout_seconds":120,"locale":"en_US"})");

	const ClientConfig config = ClientConfig::load(path, logger);

	EXPECT_EQ(config.client_id, "abc");
	EXPECT_EQ(config.client_secret, "xyz");
	EXPECT_EQ(config.secret_store, "file");
	EXPECT_EQ(config.listener_timeout_seconds, 120);
	EXPECT_EQ(config.locale, "en_US");
	EXPECT_EQ(config.api_base_url, "https://openapi.band.us");
}

TEST_F(ClientConfigTest, EnvironmentOverridesCredentials)
{
	writeConfig(R"({"client_id":"abc","client_secret":"xyz"})");
	setenv("OPENBAND_CLIENT_ID", "env-id", 1);
	setenv("OPENBAND_CLIENT_SECRET", "env-secret", 1);

	const ClientConfig config = ClientConfig::load(path, logger);

	EXPECT_EQ(config.client_id, "env-id");
	EXPECT_EQ(config.client_secret, "env-secret");
}

TEST_F(ClientConfigTest, InvalidJsonIsConfigurationError)
{
	writeConfig("{\"client_id\":");

	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);
}

TEST_F(ClientConfigTest, WrongTypeIsConfigurationError)
{
	writeConfig(R"({"listener_timeout_seconds":"soon"})");

	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);
}

TEST_F(ClientConfigTest, InvalidValuesAreConfigurationErrors)
{
	writeConfig(R"({"secret_store":"vault"})");
	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);

	writeConfig(R"({"log_level":"verbose"})");
	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);

	writeConfig(R"({"listener_timeout_seconds":-1})");
	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);

	writeConfig(R"({"listener_timeout_seconds":2147484})");
	EXPECT_THROW(ClientConfig::load(path, logger), ConfigurationError);
}

TEST_F(ClientConfigTest, LargestListenerTimeoutIsAccepted)
{
	writeConfig(R"({"listener_timeout_seconds":2147483})");

	const ClientConfig config = ClientConfig::load(path, logger);

	EXPECT_EQ(config.listener_timeout_seconds, ClientConfig::kMaxListenerTimeoutSeconds);
}

TEST_F(ClientConfigTest, DefaultConfigPath)
{
	setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
	EXPECT_EQ(ClientConfig::defaultConfigPath(), std::filesystem::path("/tmp/xdg/openband/config.json"));

	setenv("OPENBAND_CONFIG", "/etc/openband.json", 1);
	EXPECT_EQ(ClientConfig::defaultConfigPath(), std::filesystem::path("/etc/openband.json"));
}

TEST_F(ClientConfigTest, SecretFilePath)
{
	setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
	ClientConfig config;
	EXPECT_EQ(config.secretFilePath(), std::filesystem::path("/tmp/xdg/openband/secrets.json"));

	config.secret_file = "/var/lib/openband/secrets.json";
	EXPECT_EQ(config.secretFilePath(), std::filesystem::path("/var/lib/openband/secrets.json"));
}

TEST_F(ClientConfigTest, SecretFileDefaultsBesideLoadedConfig)
{
	setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
	writeConfig(R"({"secret_store":"file"})");

	const ClientConfig config = ClientConfig::load(path, logger);

	EXPECT_EQ(config.config_path, path);
	EXPECT_EQ(config.secretFilePath(), path.parent_path() / "secrets.json");
}
