/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <ILogger.hpp>

#include "SecretStore.hpp"

namespace OpenBand {

/**
 * Secret store backed by the platform keychain through Qt Keychain.
 *
 * The namespace is used as the keychain service name. Each call runs one keychain job to
 * completion on a local event loop, so a QCoreApplication must exist.
 */
class KeychainSecretStore final : public ISecretStore {
public:
	explicit KeychainSecretStore(std::shared_ptr<const Logger::ILogger> logger);
	~KeychainSecretStore() noexcept override;

	std::optional<std::string> get(const std::string &ns, const std::string &key) const override;
	void set(const std::string &ns, const std::string &key, const std::string &value) override;
	void erase(const std::string &ns, const std::string &key) override;

private:
	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace OpenBand
