/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>

#include <HttpTransport.hpp>
#include <ILogger.hpp>

#include "PageCursor.hpp"

namespace OpenBand::BandApi {

/**
 * Turns raw BAND responses into JSON or ApiError.
 *
 * parse() never lets a JSON exception escape. A non-200 response always becomes ApiError, built
 * from whatever envelope fields could be read and defaulting the rest.
 */
class BandResponseDecoder {
public:
	explicit BandResponseDecoder(std::shared_ptr<const Logger::ILogger> logger);

	Json parse(const HttpResponse &response) const;

	// Returns result_data of a successful envelope, or an empty object when it is missing or null.
	Json unwrapEnvelope(const Json &envelope) const;

private:
	[[noreturn]] void throwEnvelopeError(const Json &envelope, long httpStatus) const;

	const std::shared_ptr<const Logger::ILogger> logger_;
};

} // namespace OpenBand::BandApi
