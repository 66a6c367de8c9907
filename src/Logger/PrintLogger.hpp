/*
 * OpenBand - Logger
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <span>
#include <string_view>

#include "ILogger.hpp"

namespace OpenBand::Logger {

/**
 * Writes one tab-separated `key=value` line per event to std::clog.
 *
 * Events below the configured minimum level are dropped.
 */
class PrintLogger : public ILogger {
public:
	explicit PrintLogger(LogLevel minLevel = LogLevel::Info) noexcept : ILogger(minLevel) {}
	~PrintLogger() override = default;

	static std::optional<LogLevel> parseLevel(std::string_view name) noexcept
	{
		if (name == "debug")
			return LogLevel::Debug;
		if (name == "info")
			return LogLevel::Info;
		if (name == "warn")
			return LogLevel::Warn;
		if (name == "error")
			return LogLevel::Error;
		return std::nullopt;
	}

protected:
	void log(LogLevel level, std::string_view name, std::source_location loc,
		 std::span<const LogField> context) const noexcept override
	{
		std::scoped_lock lock(mutex_);
		switch (level) {
		case LogLevel::Debug:
			std::clog << "level=DEBUG";
			break;
		case LogLevel::Info:
			std::clog << "level=INFO";
			break;
		case LogLevel::Warn:
			std::clog << "level=WARN";
			break;
		case LogLevel::Error:
			std::clog << "level=ERROR";
			break;
		default:
			std::clog << "level=UNKNOWN";
			break;
		}

		std::clog << "\tname=" << name << "\tlocation=" << loc.file_name() << ":" << loc.line();
		for (const auto &field : context) {
			std::clog << "\t" << field.key << "=" << field.value;
		}
		std::clog << std::endl;
	}

private:
	mutable std::mutex mutex_;
};

} // namespace OpenBand::Logger
