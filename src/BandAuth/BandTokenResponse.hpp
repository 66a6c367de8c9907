/*
 * OpenBand - BandAuth
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace OpenBand::BandAuth {

struct BandTokenResponse {
	std::string access_token;
	std::optional<std::string> token_type;
	std::optional<std::string> refresh_token;
	std::optional<std::int64_t> expires_in;
	std::optional<std::string> scope;
	std::optional<std::string> user_key;
};

inline void from_json(const nlohmann::json &j, BandTokenResponse &p)
{
	j.at("access_token").get_to(p.access_token);

	const auto set_optional = [&j](const char *key, auto &field) {
		if (auto it = j.find(key); it != j.end() && !it->is_null()) {
			it->get_to(field.emplace());
		} else {
			field = std::nullopt;
		}
	};

	set_optional("token_type", p.token_type);
	set_optional("refresh_token", p.refresh_token);
	set_optional("expires_in", p.expires_in);
	set_optional("scope", p.scope);
	set_optional("user_key", p.user_key);
}

} // namespace OpenBand::BandAuth
