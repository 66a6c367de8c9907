/*
 * OpenBand - Cli
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <AuthorizationCoordinator.hpp>
#include <BandApiClient.hpp>
#include <ILogger.hpp>
#include <PageCursor.hpp>

namespace OpenBand::Cli {

// Bad command line. Reported with the usage text and exit code 2.
class UsageError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct CliInvocation {
	std::optional<std::filesystem::path> configPath;
	std::string command;
	std::vector<std::string> args;
};

// args excludes the program name.
CliInvocation parseCommandLine(std::span<const std::string> args);

// Reads KEY=VALUE arguments as a cursor, in order. std::nullopt when args is empty.
std::optional<BandApi::PageCursor> parseCursorArguments(std::span<const std::string> args);

std::string_view usageText() noexcept;

using EnvironmentLookup = const char *(*)(const char *name);

// True when a windowing system is reachable, so a GUI application and the desktop browser can be used.
// X11 and Wayland sessions are detected from the environment; other platforms always have one.
bool hasGraphicalSession(EnvironmentLookup lookup);

/**
 * Executes one CLI command and prints its result as JSON.
 *
 * Resource commands obtain the access token through the coordinator first, so the first call
 * runs the browser login when nothing is cached.
 */
class CommandRunner {
public:
	CommandRunner(std::shared_ptr<BandAuth::AuthorizationCoordinator> coordinator,
		      std::shared_ptr<BandApi::BandApiClient> client, std::shared_ptr<const Logger::ILogger> logger,
		      std::ostream &out);
	~CommandRunner() noexcept;

	CommandRunner(const CommandRunner &) = delete;
	CommandRunner &operator=(const CommandRunner &) = delete;
	CommandRunner(CommandRunner &&) = delete;
	CommandRunner &operator=(CommandRunner &&) = delete;

	// Throws UsageError for an unknown command or wrong arity; BAND failures propagate as BandError.
	void run(const std::string &command, std::span<const std::string> args);

private:
	void printJson(const BandApi::Json &j);

	template<typename T> void printPage(const BandApi::PagedResult<T> &page);

	BandApi::Comment findComment(const BandApi::Post &post, const std::string &commentKey);

	const std::shared_ptr<BandAuth::AuthorizationCoordinator> coordinator_;
	const std::shared_ptr<BandApi::BandApiClient> client_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	std::ostream &out_;
};

} // namespace OpenBand::Cli
