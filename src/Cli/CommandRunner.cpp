/*
 * OpenBand - Cli
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "CommandRunner.hpp"

#include <cstddef>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include <BandError.hpp>

namespace OpenBand::Cli {

namespace {

constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

// Comment pages walked while looking up a comment to remove.
constexpr int kMaxCommentPages = 20;

constexpr std::string_view kUsage = R"(usage: openband [--config PATH] <command> [args]

commands:
  login
  logout
  auth-url
  profile [BAND_KEY]
  bands
  permissions BAND_KEY
  posts BAND_KEY [KEY=VALUE...]
  post BAND_KEY POST_KEY
  comments BAND_KEY POST_KEY [KEY=VALUE...]
  write-post BAND_KEY CONTENT [--push]
  remove-post BAND_KEY POST_KEY
  write-comment BAND_KEY POST_KEY BODY
  remove-comment BAND_KEY POST_KEY COMMENT_KEY
  albums BAND_KEY [KEY=VALUE...]
  photos BAND_KEY [ALBUM_KEY] [KEY=VALUE...]

Listing commands print "next_params"; pass its pairs back as KEY=VALUE to get the next page.
)";

void requireArity(const std::string &command, std::span<const std::string> args, std::size_t min,
		  std::size_t max)
{
	if (args.size() < min || args.size() > max) {
		throw UsageError(fmt::format("wrong number of arguments for {}", command));
	}
}

bool isCursorArgument(const std::string &arg)
{
	return arg.find('=') != std::string::npos;
}

} // anonymous namespace

CliInvocation parseCommandLine(std::span<const std::string> args)
{
	CliInvocation invocation;

	std::size_t i = 0;
	while (i < args.size() && args[i].starts_with("--")) {
		if (args[i] == "--config") {
			if (i + 1 >= args.size()) {
				throw UsageError("--config requires a path");
			}
			invocation.configPath = args[i + 1];
			i += 2;
		} else if (args[i].starts_with("--config=")) {
			invocation.configPath = args[i].substr(std::string_view("--config=").size());
			++i;
		} else {
			throw UsageError(fmt::format("unknown option {}", args[i]));
		}
	}

	if (i >= args.size()) {
		throw UsageError("missing command");
	}

	invocation.command = args[i];
	invocation.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
	return invocation;
}

std::optional<BandApi::PageCursor> parseCursorArguments(std::span<const std::string> args)
{
	if (args.empty()) {
		return std::nullopt;
	}

	BandApi::PageCursor cursor;
	for (const std::string &arg : args) {
		const auto pos = arg.find('=');
		if (pos == std::string::npos || pos == 0) {
			throw UsageError(fmt::format("expected KEY=VALUE but got {}", arg));
		}
		cursor.params.emplace_back(arg.substr(0, pos), arg.substr(pos + 1));
	}
	return cursor;
}

std::string_view usageText() noexcept
{
	return kUsage;
}

bool hasGraphicalSession(EnvironmentLookup lookup)
{
#if defined(__APPLE__) || defined(_WIN32)
	(void)lookup;
	return true;
#else
	const auto isSet = [lookup](const char *name) {
		const char *value = lookup(name);
		return value != nullptr && value[0] != '\0';
	};
	return isSet("QT_QPA_PLATFORM") || isSet("WAYLAND_DISPLAY") || isSet("DISPLAY");
#endif
}

CommandRunner::CommandRunner(std::shared_ptr<BandAuth::AuthorizationCoordinator> coordinator,
			     std::shared_ptr<BandApi::BandApiClient> client,
			     std::shared_ptr<const Logger::ILogger> logger, std::ostream &out)
	: coordinator_(coordinator ? std::move(coordinator)
				   : throw std::invalid_argument("CoordinatorIsNullError(CommandRunner)")),
	  client_(client ? std::move(client) : throw std::invalid_argument("ClientIsNullError(CommandRunner)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(CommandRunner)")),
	  out_(out)
{
}

CommandRunner::~CommandRunner() noexcept = default;

void CommandRunner::run(const std::string &command, std::span<const std::string> args)
{
	logger_->debug("CommandStarted", {{"command", command}});

	if (command == "auth-url") {
		requireArity(command, args, 0, 0);
		out_ << coordinator_->getAuthorizationUrl() << std::endl;
		return;
	}

	if (command == "logout") {
		requireArity(command, args, 0, 0);
		coordinator_->logout();
		out_ << "Logged out." << std::endl;
		return;
	}

	if (command == "login") {
		requireArity(command, args, 0, 0);
		coordinator_->ensureAccessToken();
		out_ << "Logged in." << std::endl;
		return;
	}

	if (command == "profile") {
		requireArity(command, args, 0, 1);
		coordinator_->ensureAccessToken();
		std::optional<std::string> bandKey;
		if (!args.empty()) {
			bandKey = args[0];
		}
		printJson(client_->getProfile(bandKey).toJson());
	} else if (command == "bands") {
		requireArity(command, args, 0, 0);
		coordinator_->ensureAccessToken();
		BandApi::Json j = BandApi::Json::array();
		for (const auto &band : client_->listBands()) {
			j.push_back(band->toJson());
		}
		printJson(j);
	} else if (command == "permissions") {
		requireArity(command, args, 1, 1);
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		BandApi::Json j = BandApi::Json::array();
		for (const auto &capability : client_->getPermissions(*band).capabilities()) {
			j.push_back(capability);
		}
		printJson(j);
	} else if (command == "posts") {
		requireArity(command, args, 1, kUnbounded);
		const auto cursor = parseCursorArguments(args.subspan(1));
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		printPage(client_->listPosts(*band, cursor));
	} else if (command == "post") {
		requireArity(command, args, 2, 2);
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		printJson(client_->getPost(*band, args[1]).toJson());
	} else if (command == "comments") {
		requireArity(command, args, 2, kUnbounded);
		const auto cursor = parseCursorArguments(args.subspan(2));
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		const BandApi::Post post = client_->getPost(*band, args[1]);
		printPage(client_->listComments(post, cursor));
	} else if (command == "write-post") {
		requireArity(command, args, 2, 3);
		bool doPush = false;
		if (args.size() == 3) {
			if (args[2] != "--push") {
				throw UsageError(fmt::format("unknown option {}", args[2]));
			}
			doPush = true;
		}
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		const std::string postKey = client_->writePost(*band, args[1], doPush);
		printJson(BandApi::Json{{"band_key", band->bandKey()}, {"post_key", postKey}});
	} else if (command == "remove-post") {
		requireArity(command, args, 2, 2);
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		client_->removePost(client_->getPost(*band, args[1]));
		out_ << "Removed." << std::endl;
	} else if (command == "write-comment") {
		requireArity(command, args, 3, 3);
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		client_->writeComment(client_->getPost(*band, args[1]), args[2]);
		out_ << "Commented." << std::endl;
	} else if (command == "remove-comment") {
		requireArity(command, args, 3, 3);
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		const BandApi::Post post = client_->getPost(*band, args[1]);
		client_->removeComment(findComment(post, args[2]));
		out_ << "Removed." << std::endl;
	} else if (command == "albums") {
		requireArity(command, args, 1, kUnbounded);
		const auto cursor = parseCursorArguments(args.subspan(1));
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		printPage(client_->listAlbums(*band, cursor));
	} else if (command == "photos") {
		requireArity(command, args, 1, kUnbounded);
		std::optional<std::string> albumKey;
		std::size_t cursorStart = 1;
		if (args.size() > 1 && !isCursorArgument(args[1])) {
			albumKey = args[1];
			cursorStart = 2;
		}
		const auto cursor = parseCursorArguments(args.subspan(cursorStart));
		coordinator_->ensureAccessToken();
		const auto band = client_->getBand(args[0]);
		printPage(client_->listPhotos(*band, albumKey, cursor));
	} else {
		throw UsageError(fmt::format("unknown command {}", command));
	}
}

void CommandRunner::printJson(const BandApi::Json &j)
{
	out_ << j.dump(2) << std::endl;
}

template<typename T> void CommandRunner::printPage(const BandApi::PagedResult<T> &page)
{
	BandApi::Json items = BandApi::Json::array();
	for (const auto &item : page.items) {
		items.push_back(item.toJson());
	}

	printJson(BandApi::Json{{"items", std::move(items)},
				{"next_params", page.nextCursor ? page.nextCursor->toJson() : BandApi::Json()}});
}

BandApi::Comment CommandRunner::findComment(const BandApi::Post &post, const std::string &commentKey)
{
	std::optional<BandApi::PageCursor> cursor;
	int remainingPages = kMaxCommentPages;
	do {
		auto page = client_->listComments(post, cursor);
		for (auto &comment : page.items) {
			if (comment.commentKey() == commentKey) {
				return std::move(comment);
			}
		}
		cursor = std::move(page.nextCursor);
	} while (cursor && --remainingPages > 0);

	logger_->error("CommentNotFoundError", {{"postKey", post.postKey()}, {"commentKey", commentKey}});
	throw ApiError("CommentNotFoundError(CommandRunner::findComment):" + commentKey);
}

} // namespace OpenBand::Cli
