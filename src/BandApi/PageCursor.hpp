/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include <HttpTransport.hpp>

namespace OpenBand::BandApi {

// Object key order of API responses is kept so continuation cursors replay as received.
using Json = nlohmann::ordered_json;

/**
 * Opaque continuation token of a listing endpoint (`paging.next_params`).
 *
 * The pairs are replayed as query parameters without being interpreted.
 */
struct PageCursor {
	QueryParams params;

	// std::nullopt when resultData has no paging.next_params object.
	static std::optional<PageCursor> fromResultData(const Json &resultData);

	// A key already in query keeps its position and takes the cursor's value; new keys are appended.
	void applyTo(QueryParams &query) const;

	Json toJson() const;

	bool operator==(const PageCursor &) const = default;
};

template<typename T> struct PagedResult {
	std::vector<T> items;
	std::optional<PageCursor> nextCursor;
};

} // namespace OpenBand::BandApi
