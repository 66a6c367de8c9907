/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <HttpTransport.hpp>
#include <ILogger.hpp>
#include <SecretStore.hpp>

#include "BandResponseDecoder.hpp"
#include "BandTypes.hpp"
#include "PageCursor.hpp"

namespace OpenBand::BandApi {

struct BandApiSettings {
	std::string apiBaseUrl = "https://openapi.band.us";
	std::string secretNamespace = "openband";
	std::string locale = "ko_KR";
};

/**
 * Typed access to the BAND Open API.
 *
 * The access token is read from the secret store on every call; a missing token throws
 * AuthorizationError before any request. Listing calls return one page and the cursor for the
 * next one. Posts and comments returned here refer to the Band they were listed from, which must
 * outlive them.
 */
class BandApiClient {
public:
	BandApiClient(BandApiSettings settings, std::shared_ptr<IHttpTransport> transport,
		      std::shared_ptr<const ISecretStore> secretStore, std::shared_ptr<const Logger::ILogger> logger);
	~BandApiClient() noexcept;

	BandApiClient(const BandApiClient &) = delete;
	BandApiClient &operator=(const BandApiClient &) = delete;
	BandApiClient(BandApiClient &&) = delete;
	BandApiClient &operator=(BandApiClient &&) = delete;

	Profile getProfile(const std::optional<std::string> &bandKey = std::nullopt);

	std::vector<std::shared_ptr<Band>> listBands();

	// Looks bandKey up in listBands(). Throws ApiError when the user is not a member.
	std::shared_ptr<Band> getBand(const std::string &bandKey);

	// Fetched on first use and then served from the Band.
	const BandPermissions &getPermissions(const Band &band);

	PagedResult<Post> listPosts(const Band &band, const std::optional<PageCursor> &cursor = std::nullopt,
				    const std::optional<std::string> &locale = std::nullopt);

	Post getPost(const Band &band, const std::string &postKey);

	// Requires the posting permission. Returns the key of the new post.
	std::string writePost(const Band &band, const std::string &content, bool doPush = false);

	// Requires contents_deletion or authorship of the post.
	void removePost(const Post &post);

	PagedResult<Comment> listComments(const Post &post, const std::optional<PageCursor> &cursor = std::nullopt);

	// Requires the commenting permission.
	void writeComment(const Post &post, const std::string &body);

	// Requires contents_deletion or authorship of the comment.
	void removeComment(const Comment &comment);

	PagedResult<Album> listAlbums(const Band &band, const std::optional<PageCursor> &cursor = std::nullopt);

	// Without albumKey, lists the photos that belong to no album.
	PagedResult<Photo> listPhotos(const Band &band, const std::optional<std::string> &albumKey = std::nullopt,
				      const std::optional<PageCursor> &cursor = std::nullopt);

private:
	enum class Method { Get, Post };

	std::string accessToken() const;

	Json call(Method method, std::string_view path, QueryParams query);

	template<typename T>
	PagedResult<T> list(std::string_view path, QueryParams query, const std::optional<PageCursor> &cursor,
			    const std::function<T(const Json &)> &mapItem);

	void requirePermission(const Band &band, std::string_view capability, std::string_view operation);
	void requireRemovable(const Band &band, const Author &author, std::string_view operation);

	const BandApiSettings settings_;
	const std::shared_ptr<IHttpTransport> transport_;
	const std::shared_ptr<const ISecretStore> secretStore_;
	const std::shared_ptr<const Logger::ILogger> logger_;
	const BandResponseDecoder decoder_;
};

} // namespace OpenBand::BandApi
