/*
 * OpenBand - BandCore
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace OpenBand {

class BandError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Invalid local configuration. Raised before any request is issued.
class ConfigurationError : public BandError {
public:
	using BandError::BandError;
};

class AuthorizationError : public BandError {
public:
	using BandError::BandError;
};

class PermissionError : public BandError {
public:
	using BandError::BandError;
};

// The request never produced an HTTP status.
class TransportError : public BandError {
public:
	using BandError::BandError;
};

/**
 * Business-level failure reported by the BAND API, or a response that cannot be read as one.
 *
 * When the failure came from an error envelope, what() reads
 * "{resultCode}, {message}({error})\n{description}".
 */
class ApiError : public BandError {
public:
	explicit ApiError(const std::string &what, long httpStatus = 0);
	ApiError(std::int64_t resultCode, std::string message, std::string error, std::string description,
		 long httpStatus = 0);

	std::int64_t resultCode() const noexcept { return resultCode_; }
	const std::string &message() const noexcept { return message_; }
	const std::string &error() const noexcept { return error_; }
	const std::string &description() const noexcept { return description_; }
	long httpStatus() const noexcept { return httpStatus_; }

private:
	std::int64_t resultCode_ = -1;
	std::string message_;
	std::string error_;
	std::string description_;
	long httpStatus_ = 0;
};

} // namespace OpenBand
