/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "JsonFileSecretStore.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "BandError.hpp"

namespace OpenBand {

JsonFileSecretStore::JsonFileSecretStore(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger)
	: path_(path.empty() ? throw std::invalid_argument("PathIsEmptyError(JsonFileSecretStore::JsonFileSecretStore)")
			     : std::move(path)),
	  logger_(logger ? std::move(logger)
			 : throw std::invalid_argument("LoggerIsNullError(JsonFileSecretStore::JsonFileSecretStore)"))
{
}

JsonFileSecretStore::~JsonFileSecretStore() noexcept = default;

std::optional<std::string> JsonFileSecretStore::get(const std::string &ns, const std::string &key) const
{
	std::scoped_lock lock(mutex_);
	const nlohmann::json document = readDocument();

	auto nsIt = document.find(ns);
	if (nsIt == document.end() || !nsIt->is_object())
		return std::nullopt;

	auto keyIt = nsIt->find(key);
	if (keyIt == nsIt->end() || !keyIt->is_string())
		return std::nullopt;

	return keyIt->get<std::string>();
}

void JsonFileSecretStore::set(const std::string &ns, const std::string &key, const std::string &value)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json document = readDocument();
	document[ns][key] = value;
	writeDocument(document);
	logger_->debug("SecretStored", {{"namespace", ns}, {"key", key}});
}

void JsonFileSecretStore::erase(const std::string &ns, const std::string &key)
{
	std::scoped_lock lock(mutex_);
	nlohmann::json document = readDocument();

	auto nsIt = document.find(ns);
	if (nsIt == document.end() || !nsIt->is_object())
		return;

	nsIt->erase(key);
	writeDocument(document);
	logger_->debug("SecretErased", {{"namespace", ns}, {"key", key}});
}

nlohmann::json JsonFileSecretStore::readDocument() const
{
	std::error_code ec;
	if (!std::filesystem::exists(path_, ec)) {
		return nlohmann::json::object();
	}

	std::ifstream ifs(path_, std::ios::in);
	if (!ifs.is_open()) {
		logger_->error("FileOpenError", {{"path", path_.string()}});
		throw ConfigurationError("FileOpenError(JsonFileSecretStore::readDocument):" + path_.string());
	}

	try {
		nlohmann::json document = nlohmann::json::parse(ifs);
		if (!document.is_object()) {
			logger_->error("SecretFileNotObjectError", {{"path", path_.string()}});
			throw ConfigurationError("NotAnObjectError(JsonFileSecretStore::readDocument):" + path_.string());
		}
		return document;
	} catch (const nlohmann::json::exception &e) {
		logger_->error("SecretFileParseError", {{"path", path_.string()}, {"exception", e.what()}});
		throw ConfigurationError("ParseError(JsonFileSecretStore::readDocument):" + path_.string());
	}
}

void JsonFileSecretStore::writeDocument(const nlohmann::json &document) const
{
	if (path_.has_parent_path()) {
		std::error_code ec;
		std::filesystem::create_directories(path_.parent_path(), ec);
		if (ec) {
			logger_->error("DirectoryCreateError", {{"path", path_.parent_path().string()}, {"error", ec.message()}});
			throw ConfigurationError("DirectoryCreateError(JsonFileSecretStore::writeDocument):" +
						 path_.parent_path().string());
		}
	}

	std::filesystem::path tempPath = path_;
	tempPath += ".tmp";

	{
		std::ofstream ofs(tempPath, std::ios::out | std::ios::trunc);
		if (!ofs.is_open()) {
			logger_->error("FileOpenError", {{"path", tempPath.string()}});
			throw ConfigurationError("FileOpenError(JsonFileSecretStore::writeDocument):" + tempPath.string());
		}

		// Restrict the file before any secret is written into it.
		std::error_code ec;
		std::filesystem::permissions(tempPath,
					     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
					     std::filesystem::perm_options::replace, ec);
		if (ec) {
			logger_->error("FilePermissionsError", {{"path", tempPath.string()}, {"error", ec.message()}});
			ofs.close();
			std::filesystem::remove(tempPath, ec);
			throw ConfigurationError("FilePermissionsError(JsonFileSecretStore::writeDocument):" +
						 tempPath.string());
		}

		ofs << document.dump(2);
		ofs.flush();
		if (!ofs.good()) {
			logger_->error("FileWriteError", {{"path", tempPath.string()}});
			ofs.close();
			std::filesystem::remove(tempPath, ec);
			throw ConfigurationError("FileWriteError(JsonFileSecretStore::writeDocument):" + tempPath.string());
		}
	}

	std::error_code ec;
	std::filesystem::rename(tempPath, path_, ec);
	if (ec) {
		logger_->error("FileRenameError", {{"path", path_.string()}, {"error", ec.message()}});
		std::error_code removeEc;
		std::filesystem::remove(tempPath, removeEc);
		throw ConfigurationError("FileRenameError(JsonFileSecretStore::writeDocument):" + path_.string());
	}
}

} // namespace OpenBand
