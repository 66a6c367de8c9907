/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BandApiClient.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <BandError.hpp>

namespace OpenBand::BandApi {

namespace {

constexpr char kRequestedPermissions[] = "posting,commenting,contents_deletion";

// Runs a pure mapping step and reports bad payload shapes as ApiError.
template<typename F>
auto mapPayload(const Logger::ILogger &logger, std::string_view what, F &&f) -> decltype(f())
{
	try {
		return f();
	} catch (const nlohmann::json::exception &e) {
		logger.error("MalformedPayloadError", {{"payload", what}, {"exception", e.what()}});
		throw ApiError(fmt::format("malformed {} payload", what), 200);
	}
}

} // anonymous namespace

BandApiClient::BandApiClient(BandApiSettings settings, std::shared_ptr<IHttpTransport> transport,
			     std::shared_ptr<const ISecretStore> secretStore,
			     std::shared_ptr<const Logger::ILogger> logger)
	: settings_(std::move(settings)),
	  transport_(transport ? std::move(transport)
			       : throw std::invalid_argument("TransportIsNullError(BandApiClient)")),
	  secretStore_(secretStore ? std::move(secretStore)
				   : throw std::invalid_argument("SecretStoreIsNullError(BandApiClient)")),
	  logger_(logger ? std::move(logger) : throw std::invalid_argument("LoggerIsNullError(BandApiClient)")),
	  decoder_(logger_)
{
}

BandApiClient::~BandApiClient() noexcept = default;

Profile BandApiClient::getProfile(const std::optional<std::string> &bandKey)
{
	QueryParams query;
	if (bandKey) {
		query.emplace_back("band_key", *bandKey);
	}

	const Json resultData = call(Method::Get, "/v2/profile", std::move(query));
	return mapPayload(*logger_, "profile", [&] { return Profile::fromJson(resultData); });
}

std::vector<std::shared_ptr<Band>> BandApiClient::listBands()
{
	const Json resultData = call(Method::Get, "/v2.1/bands", {});
	return mapPayload(*logger_, "band", [&] {
		std::vector<std::shared_ptr<Band>> bands;
		if (auto it = resultData.find("bands"); it != resultData.end() && !it->is_null()) {
			for (const auto &item : *it) {
				bands.push_back(Band::fromJson(item));
			}
		}
		return bands;
	});
}

std::shared_ptr<Band> BandApiClient::getBand(const std::string &bandKey)
{
	for (auto &band : listBands()) {
		if (band->bandKey() == bandKey) {
			return band;
		}
	}

	logger_->error("BandNotFoundError", {{"bandKey", bandKey}});
	throw ApiError("BandNotFoundError(BandApiClient::getBand):" + bandKey);
}

const BandPermissions &BandApiClient::getPermissions(const Band &band)
{
	return band.permissions([&] {
		const Json resultData = call(Method::Get, "/v2/band/permissions",
					     {{"band_key", band.bandKey()}, {"permissions", kRequestedPermissions}});
		BandPermissions permissions =
			mapPayload(*logger_, "permissions", [&] { return BandPermissions::fromJson(resultData); });
		logger_->debug("PermissionsFetched", {{"bandKey", band.bandKey()}});
		return permissions;
	});
}

PagedResult<Post> BandApiClient::listPosts(const Band &band, const std::optional<PageCursor> &cursor,
					   const std::optional<std::string> &locale)
{
	return list<Post>("/v2/band/posts",
			  {{"band_key", band.bandKey()}, {"locale", locale.value_or(settings_.locale)}}, cursor,
			  [&band](const Json &item) { return Post::fromJson(item, band); });
}

Post BandApiClient::getPost(const Band &band, const std::string &postKey)
{
	const Json resultData =
		call(Method::Get, "/v2.1/band/post", {{"band_key", band.bandKey()}, {"post_key", postKey}});
	return mapPayload(*logger_, "post", [&] { return Post::fromJson(resultData.at("post"), band); });
}

std::string BandApiClient::writePost(const Band &band, const std::string &content, bool doPush)
{
	requirePermission(band, kPostingPermission, "writePost");

	const Json resultData = call(Method::Post, "/v2.2/band/post/create",
				     {{"band_key", band.bandKey()},
				      {"content", content},
				      {"do_push", doPush ? "true" : "false"}});
	std::string postKey = mapPayload(*logger_, "post", [&] { return resultData.at("post_key").get<std::string>(); });
	logger_->info("PostWritten", {{"bandKey", band.bandKey()}, {"postKey", postKey}});
	return postKey;
}

void BandApiClient::removePost(const Post &post)
{
	requireRemovable(post.band(), post.author(), "removePost");

	call(Method::Post, "/v2/band/post/remove", {{"band_key", post.bandKey()}, {"post_key", post.postKey()}});
	logger_->info("PostRemoved", {{"bandKey", post.bandKey()}, {"postKey", post.postKey()}});
}

PagedResult<Comment> BandApiClient::listComments(const Post &post, const std::optional<PageCursor> &cursor)
{
	return list<Comment>("/v2/band/post/comments", {{"band_key", post.bandKey()}, {"post_key", post.postKey()}},
			     cursor, [&post](const Json &item) {
				     return Comment::fromJson(item, post.band(), post.postKey());
			     });
}

void BandApiClient::writeComment(const Post &post, const std::string &body)
{
	requirePermission(post.band(), kCommentingPermission, "writeComment");

	call(Method::Post, "/v2/band/post/comment/create",
	     {{"band_key", post.bandKey()}, {"post_key", post.postKey()}, {"body", body}});
	logger_->info("CommentWritten", {{"bandKey", post.bandKey()}, {"postKey", post.postKey()}});
}

void BandApiClient::removeComment(const Comment &comment)
{
	if (!comment.commentKey()) {
		logger_->error("CommentKeyIsMissingError", {{"postKey", comment.postKey()}});
		throw std::invalid_argument("CommentKeyIsMissingError(BandApiClient::removeComment)");
	}

	requireRemovable(comment.band(), comment.author(), "removeComment");

	call(Method::Post, "/v2/band/post/comment/remove",
	     {{"band_key", comment.bandKey()}, {"post_key", comment.postKey()}, {"comment_key", *comment.commentKey()}});
	logger_->info("CommentRemoved", {{"bandKey", comment.bandKey()}, {"commentKey", *comment.commentKey()}});
}

PagedResult<Album> BandApiClient::listAlbums(const Band &band, const std::optional<PageCursor> &cursor)
{
	return list<Album>("/v2/band/albums", {{"band_key", band.bandKey()}}, cursor,
			   [](const Json &item) { return Album::fromJson(item); });
}

PagedResult<Photo> BandApiClient::listPhotos(const Band &band, const std::optional<std::string> &albumKey,
					     const std::optional<PageCursor> &cursor)
{
	QueryParams query{{"band_key", band.bandKey()}};
	if (albumKey) {
		query.emplace_back("photo_album_key", *albumKey);
	}

	return list<Photo>("/v2/band/album/photos", std::move(query), cursor,
			   [](const Json &item) { return Photo::fromJson(item); });
}

std::string BandApiClient::accessToken() const
{
	auto token = secretStore_->get(settings_.secretNamespace, kAccessTokenKey);
	if (!token || token->empty()) {
		logger_->error("AccessTokenMissingError", {{"namespace", settings_.secretNamespace}});
		throw AuthorizationError("AccessTokenMissingError(BandApiClient)");
	}
	return *token;
}

Json BandApiClient::call(Method method, std::string_view path, QueryParams query)
{
	query.emplace(query.begin(), "access_token", accessToken());

	const std::string url = settings_.apiBaseUrl + std::string(path);
	logger_->debug("ApiRequest", {{"method", method == Method::Get ? "GET" : "POST"}, {"path", path}});

	const HttpResponse response = method == Method::Get ? transport_->get(url, query) : transport_->post(url, query);
	return decoder_.unwrapEnvelope(decoder_.parse(response));
}

template<typename T>
PagedResult<T> BandApiClient::list(std::string_view path, QueryParams query, const std::optional<PageCursor> &cursor,
				   const std::function<T(const Json &)> &mapItem)
{
	if (cursor) {
		cursor->applyTo(query);
	}

	const Json resultData = call(Method::Get, path, std::move(query));

	return mapPayload(*logger_, path, [&] {
		PagedResult<T> result;
		if (auto it = resultData.find("items"); it != resultData.end() && !it->is_null()) {
			for (const auto &item : *it) {
				result.items.push_back(mapItem(item));
			}
		}
		result.nextCursor = PageCursor::fromResultData(resultData);
		return result;
	});
}

void BandApiClient::requirePermission(const Band &band, std::string_view capability, std::string_view operation)
{
	if (getPermissions(band).has(capability))
		return;

	logger_->error("PermissionError",
		       {{"bandKey", band.bandKey()}, {"capability", capability}, {"operation", operation}});
	throw PermissionError(fmt::format("PermissionError(BandApiClient::{}): {} is not granted", operation, capability));
}

void BandApiClient::requireRemovable(const Band &band, const Author &author, std::string_view operation)
{
	if (getPermissions(band).has(kContentsDeletionPermission))
		return;

	const Profile profile = getProfile(band.bandKey());
	if (profile.userKey() == author.userKey())
		return;

	logger_->error("PermissionError", {{"bandKey", band.bandKey()},
					   {"capability", kContentsDeletionPermission},
					   {"operation", operation}});
	throw PermissionError(
		fmt::format("PermissionError(BandApiClient::{}): not the author and {} is not granted", operation,
			    kContentsDeletionPermission));
}

} // namespace OpenBand::BandApi
