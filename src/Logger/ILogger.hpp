/*
 * OpenBand - Logger
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <initializer_list>
#include <source_location>
#include <span>
#include <string_view>

namespace OpenBand::Logger {

struct LogField {
	std::string_view key;
	std::string_view value;
};

enum class LogLevel { Debug, Info, Warn, Error };

/**
 * Structured event logger.
 *
 * Every event has a PascalCase name and an optional list of key/value fields. Values are views, so
 * callers keep the backing strings alive for the duration of the call only. Events below the
 * minimum level never reach log().
 */
class ILogger {
public:
	explicit ILogger(LogLevel minLevel = LogLevel::Debug) noexcept : minLevel_(minLevel) {}
	virtual ~ILogger() = default;

	ILogger(const ILogger &) = delete;
	ILogger &operator=(const ILogger &) = delete;
	ILogger(ILogger &&) = delete;
	ILogger &operator=(ILogger &&) = delete;

	void debug(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		if (isEnabled(LogLevel::Debug))
			log(LogLevel::Debug, name, loc, context);
	}

	void info(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		if (isEnabled(LogLevel::Info))
			log(LogLevel::Info, name, loc, context);
	}

	void warn(std::string_view name, std::initializer_list<LogField> context = {},
		  std::source_location loc = std::source_location::current()) const noexcept
	{
		if (isEnabled(LogLevel::Warn))
			log(LogLevel::Warn, name, loc, context);
	}

	void error(std::string_view name, std::initializer_list<LogField> context = {},
		   std::source_location loc = std::source_location::current()) const noexcept
	{
		if (isEnabled(LogLevel::Error))
			log(LogLevel::Error, name, loc, context);
	}

	bool isEnabled(LogLevel level) const noexcept { return level >= minLevel_; }

	LogLevel minLevel() const noexcept { return minLevel_; }

protected:
	virtual void log(LogLevel level, std::string_view name, std::source_location loc,
			 std::span<const LogField> context) const noexcept = 0;

private:
	const LogLevel minLevel_;
};

} // namespace OpenBand::Logger
