/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include <ILogger.hpp>

#include "SecretStore.hpp"

namespace OpenBand {

/**
 * Secret store backed by a single JSON document of the form {"<namespace>": {"<key>": "<value>"}}.
 *
 * The file is read on every get() and rewritten on every set()/erase(), with owner-only
 * permissions. A missing file reads as empty.
 */
class JsonFileSecretStore final : public ISecretStore {
public:
	JsonFileSecretStore(std::filesystem::path path, std::shared_ptr<const Logger::ILogger> logger);
	~JsonFileSecretStore() noexcept override;

	std::optional<std::string> get(const std::string &ns, const std::string &key) const override;
	void set(const std::string &ns, const std::string &key, const std::string &value) override;
	void erase(const std::string &ns, const std::string &key) override;

	const std::filesystem::path &path() const noexcept { return path_; }

private:
	nlohmann::json readDocument() const;
	void writeDocument(const nlohmann::json &document) const;

	const std::filesystem::path path_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	mutable std::mutex mutex_;
};

} // namespace OpenBand
