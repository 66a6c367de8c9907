/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "SecretStore.hpp"

namespace OpenBand {

class MemorySecretStore final : public ISecretStore {
public:
	MemorySecretStore() = default;
	~MemorySecretStore() noexcept override = default;

	std::optional<std::string> get(const std::string &ns, const std::string &key) const override
	{
		std::scoped_lock lock(mutex_);
		auto it = secrets_.find({ns, key});
		if (it == secrets_.end())
			return std::nullopt;
		return it->second;
	}

	void set(const std::string &ns, const std::string &key, const std::string &value) override
	{
		std::scoped_lock lock(mutex_);
		secrets_[{ns, key}] = value;
	}

	void erase(const std::string &ns, const std::string &key) override
	{
		std::scoped_lock lock(mutex_);
		secrets_.erase({ns, key});
	}

private:
	mutable std::mutex mutex_;
	std::map<std::pair<std::string, std::string>, std::string> secrets_;
};

} // namespace OpenBand
