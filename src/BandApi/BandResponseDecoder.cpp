/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BandResponseDecoder.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <BandError.hpp>

namespace OpenBand::BandApi {

namespace {

bool isJsonContentType(const HttpResponse &response)
{
	const auto contentType = response.header("content-type");
	return contentType && contentType->starts_with("application/json");
}

template<typename T> T readOr(const Json &object, const char *key, T fallback)
{
	if (!object.is_object())
		return fallback;

	auto it = object.find(key);
	if (it == object.end())
		return fallback;

	if constexpr (std::is_same_v<T, std::string>) {
		return it->is_string() ? it->get<std::string>() : fallback;
	} else {
		return it->is_number_integer() ? it->get<T>() : fallback;
	}
}

const Json &childOrNull(const Json &object, const char *key)
{
	static const Json null;
	if (!object.is_object())
		return null;

	auto it = object.find(key);
	return it == object.end() ? null : *it;
}

} // anonymous namespace

BandResponseDecoder::BandResponseDecoder(std::shared_ptr<const Logger::ILogger> logger)
	: logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(BandResponseDecoder)"))
{
}

Json BandResponseDecoder::parse(const HttpResponse &response) const
{
	const bool isJson = isJsonContentType(response);

	if (response.status != 200) {
		Json envelope = Json::object();
		if (isJson) {
			envelope = Json::parse(response.body, nullptr, false);
			if (envelope.is_discarded()) {
				envelope = Json::object();
			}
		}
		throwEnvelopeError(envelope, response.status);
	}

	if (!isJson) {
		logger_->error("ApiError", {{"reason", "invalid content type"},
					    {"contentType", response.header("content-type").value_or("")}});
		throw ApiError("invalid content type", response.status);
	}

	Json j = Json::parse(response.body, nullptr, false);
	if (j.is_discarded()) {
		logger_->error("ApiError", {{"reason", "malformed response body"}});
		throw ApiError("malformed response body", response.status);
	}

	return j;
}

Json BandResponseDecoder::unwrapEnvelope(const Json &envelope) const
{
	if (!envelope.is_object()) {
		logger_->error("ApiError", {{"reason", "envelope is not an object"}});
		throw ApiError("malformed envelope", 200);
	}

	auto codeIt = envelope.find("result_code");
	if (codeIt == envelope.end() || !codeIt->is_number_integer() || codeIt->get<std::int64_t>() != 1) {
		throwEnvelopeError(envelope, 200);
	}

	auto dataIt = envelope.find("result_data");
	if (dataIt == envelope.end() || dataIt->is_null()) {
		return Json::object();
	}
	if (!dataIt->is_object()) {
		logger_->error("ApiError", {{"reason", "result_data is not an object"}});
		throw ApiError("malformed envelope", 200);
	}
	return *dataIt;
}

void BandResponseDecoder::throwEnvelopeError(const Json &envelope, long httpStatus) const
{
	const Json &resultData = childOrNull(envelope, "result_data");
	const Json &detail = childOrNull(resultData, "detail");

	ApiError error(readOr<std::int64_t>(envelope, "result_code", -1), readOr<std::string>(resultData, "message", ""),
		       readOr<std::string>(detail, "error", ""), readOr<std::string>(detail, "description", ""),
		       httpStatus);

	logger_->error("ApiError", {{"httpStatus", std::to_string(httpStatus)},
				    {"resultCode", std::to_string(error.resultCode())},
				    {"message", error.message()},
				    {"error", error.error()}});
	throw error;
}

} // namespace OpenBand::BandApi
