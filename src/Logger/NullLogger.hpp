/*
 * OpenBand - Logger
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <memory>
#include <source_location>
#include <span>
#include <string_view>

#include "ILogger.hpp"

namespace OpenBand::Logger {

class NullLogger final : public ILogger {
public:
	NullLogger() noexcept : ILogger(LogLevel::Error) {}
	~NullLogger() noexcept override = default;

	static std::shared_ptr<const NullLogger> instance()
	{
		static const std::shared_ptr<const NullLogger> instance = std::make_shared<const NullLogger>();
		return instance;
	}

protected:
	void log(LogLevel, std::string_view, std::source_location, std::span<const LogField>) const noexcept override
	{
		// No-op
	}
};

} // namespace OpenBand::Logger
