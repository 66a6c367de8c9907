/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BandError.hpp"

#include <utility>

#include <fmt/format.h>

namespace OpenBand {

ApiError::ApiError(const std::string &what, long httpStatus) : BandError(what), httpStatus_(httpStatus) {}

ApiError::ApiError(std::int64_t resultCode, std::string message, std::string error, std::string description,
		   long httpStatus)
	: BandError(fmt::format("{}, {}({})\n{}", resultCode, message, error, description)),
	  resultCode_(resultCode),
	  message_(std::move(message)),
	  error_(std::move(error)),
	  description_(std::move(description)),
	  httpStatus_(httpStatus)
{
}

} // namespace OpenBand
