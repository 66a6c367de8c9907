/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "PageCursor.hpp"

#include <algorithm>
#include <string>

namespace OpenBand::BandApi {

std::optional<PageCursor> PageCursor::fromResultData(const Json &resultData)
{
	if (!resultData.is_object())
		return std::nullopt;

	auto paging = resultData.find("paging");
	if (paging == resultData.end() || !paging->is_object())
		return std::nullopt;

	auto nextParams = paging->find("next_params");
	if (nextParams == paging->end() || !nextParams->is_object())
		return std::nullopt;

	PageCursor cursor;
	for (const auto &[key, value] : nextParams->items()) {
		cursor.params.emplace_back(key, value.is_string() ? value.get<std::string>() : value.dump());
	}
	return cursor;
}

void PageCursor::applyTo(QueryParams &query) const
{
	for (const auto &[key, value] : params) {
		auto it = std::find_if(query.begin(), query.end(), [&key](const auto &param) { return param.first == key; });
		if (it != query.end()) {
			it->second = value;
		} else {
			query.emplace_back(key, value);
		}
	}
}

Json PageCursor::toJson() const
{
	Json j = Json::object();
	for (const auto &[key, value] : params) {
		j[key] = value;
	}
	return j;
}

} // namespace OpenBand::BandApi
