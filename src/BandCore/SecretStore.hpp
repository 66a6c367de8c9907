/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <optional>
#include <string>

namespace OpenBand {

inline constexpr char kAuthorizationCodeKey[] = "authorization_code";
inline constexpr char kAccessTokenKey[] = "access_token";

/**
 * Named secret slots, grouped under an application namespace.
 *
 * get() returns std::nullopt for a slot that was never set or has been erased. Storage failures
 * throw; a missing slot is not a failure.
 */
class ISecretStore {
public:
	ISecretStore() = default;
	virtual ~ISecretStore() = default;

	ISecretStore(const ISecretStore &) = delete;
	ISecretStore &operator=(const ISecretStore &) = delete;
	ISecretStore(ISecretStore &&) = delete;
	ISecretStore &operator=(ISecretStore &&) = delete;

	virtual std::optional<std::string> get(const std::string &ns, const std::string &key) const = 0;
	virtual void set(const std::string &ns, const std::string &key, const std::string &value) = 0;
	virtual void erase(const std::string &ns, const std::string &key) = 0;
};

} // namespace OpenBand
