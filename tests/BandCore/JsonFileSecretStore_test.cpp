/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#include <BandError.hpp>
#include <JsonFileSecretStore.hpp>
#include <NullLogger.hpp>

using namespace OpenBand;

class JsonFileSecretStoreTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		std::random_device rd;
		dir = std::filesystem::temp_directory_path() / ("openband-test-" + std::to_string(rd()));
		path = dir / "nested" / "secrets.json";
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove_all(dir, ec);
	}

	void writeRaw(const std::string &text)
	{
		std::filesystem::create_directories(path.parent_path());
		std::ofstream(path) << text;
	}

	std::filesystem::path dir;
	std::filesystem::path path;
};

TEST_F(JsonFileSecretStoreTest, MissingFileHasNoSecrets)
{
	JsonFileSecretStore store(path, Logger::NullLogger::instance());

	EXPECT_FALSE(store.get("openband", kAccessTokenKey).has_value());
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(JsonFileSecretStoreTest, SetPersistsAcrossInstances)
{
	{
		JsonFileSecretStore store(path, Logger::NullLogger::instance());
		store.set("openband", kAccessTokenKey, "T1");
	}

	JsonFileSecretStore reopened(path, Logger::NullLogger::instance());
	EXPECT_EQ(reopened.get("openband", kAccessTokenKey), "T1");
}

TEST_F(JsonFileSecretStoreTest, NamespacesAreIsolated)
{
	JsonFileSecretStore store(path, Logger::NullLogger::instance());
	store.set("openband", kAccessTokenKey, "T1");
	store.set("other", kAccessTokenKey, "T2");

	EXPECT_EQ(store.get("openband", kAccessTokenKey), "T1");
	EXPECT_EQ(store.get("other", kAccessTokenKey), "T2");
}

TEST_F(JsonFileSecretStoreTest, EraseRemovesOnlyThatSlot)
{
	JsonFileSecretStore store(path, Logger::NullLogger::instance());
	store.set("openband", kAccessTokenKey, "T1");
	store.set("openband", kAuthorizationCodeKey, "C1");

	store.erase("openband", kAccessTokenKey);
	store.erase("missing", kAccessTokenKey);

	EXPECT_FALSE(store.get("openband", kAccessTokenKey).has_value());
	EXPECT_EQ(store.get("openband", kAuthorizationCodeKey), "C1");
}

TEST_F(JsonFileSecretStoreTest, FileIsOwnerOnly)
{
	JsonFileSecretStore store(path, Logger::NullLogger::instance());
	store.set("openband", kAccessTokenKey, "T1");

	const auto perms = std::filesystem::status(path).permissions();
	EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
		  std::filesystem::perms::none);
}

TEST_F(JsonFileSecretStoreTest, WorldReadableFileIsReplacedWithOwnerOnlyFile)
{
	writeRaw("{}");
	std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
						   std::filesystem::perms::group_read | std::filesystem::perms::others_read);

	JsonFileSecretStore store(path, Logger::NullLogger::instance());
	store.set("openband", kAccessTokenKey, "T1");

	const auto perms = std::filesystem::status(path).permissions();
	EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
		  std::filesystem::perms::none);
	EXPECT_EQ(store.get("openband", kAccessTokenKey), "T1");
}

TEST_F(JsonFileSecretStoreTest, WriteLeavesNoTemporaryFile)
{
	JsonFileSecretStore store(path, Logger::NullLogger::instance());
	store.set("openband", kAccessTokenKey, "T1");
	store.erase("openband", kAccessTokenKey);

	std::filesystem::path tempPath = path;
	tempPath += ".tmp";
	EXPECT_FALSE(std::filesystem::exists(tempPath));
	EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(JsonFileSecretStoreTest, InvalidFileIsConfigurationError)
{
	writeRaw("{broken");
	JsonFileSecretStore store(path, Logger::NullLogger::instance());

	EXPECT_THROW(store.get("openband", kAccessTokenKey), ConfigurationError);
	EXPECT_THROW(store.set("openband", kAccessTokenKey, "T1"), ConfigurationError);
}

TEST_F(JsonFileSecretStoreTest, NonObjectFileIsConfigurationError)
{
	writeRaw("[1, 2, 3]");
	JsonFileSecretStore store(path, Logger::NullLogger::instance());

	EXPECT_THROW(store.get("openband", kAccessTokenKey), ConfigurationError);
}

TEST_F(JsonFileSecretStoreTest, EmptyPathIsRejected)
{
	EXPECT_THROW({ JsonFileSecretStore store(std::filesystem::path{}, Logger::NullLogger::instance()); },
		     std::invalid_argument);
}
