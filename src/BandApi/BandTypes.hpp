/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "PageCursor.hpp"

namespace OpenBand::BandApi {

// BAND timestamps are epoch milliseconds.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp timestampFromMillis(std::int64_t millis) noexcept;
std::int64_t timestampToMillis(Timestamp timestamp) noexcept;

/*
 * Resource objects are immutable and built only by their fromJson() factories, which read one
 * item of a decoded envelope and never touch the network. fromJson() throws nlohmann::json
 * exceptions for missing required fields or wrong types.
 *
 * field(name) returns one declared field as JSON and throws std::out_of_range for any other name.
 */

class Author {
public:
	static constexpr std::array<std::string_view, 5> kFieldNames{"name", "description", "role",
								     "profile_image_url", "user_key"};

	static Author fromJson(const Json &j);

	const std::string &name() const noexcept { return name_; }
	const std::string &description() const noexcept { return description_; }
	const std::string &role() const noexcept { return role_; }
	const std::string &profileImageUrl() const noexcept { return profileImageUrl_; }
	const std::string &userKey() const noexcept { return userKey_; }

	bool isLeader() const noexcept { return role_ == "leader"; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	Author() = default;

	std::string name_;
	std::string description_;
	std::string role_;
	std::string profileImageUrl_;
	std::string userKey_;
};

class Profile {
public:
	static constexpr std::array<std::string_view, 6> kFieldNames{
		"user_key", "profile_image_url", "name", "is_app_member", "message_allowed", "member_joined_at"};

	static Profile fromJson(const Json &j);

	const std::string &userKey() const noexcept { return userKey_; }
	const std::string &profileImageUrl() const noexcept { return profileImageUrl_; }
	const std::string &name() const noexcept { return name_; }
	bool isAppMember() const noexcept { return isAppMember_; }
	bool messageAllowed() const noexcept { return messageAllowed_; }

	// Present only when the profile was requested for a specific band.
	const std::optional<Timestamp> &memberJoinedAt() const noexcept { return memberJoinedAt_; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	Profile() = default;

	std::string userKey_;
	std::string profileImageUrl_;
	std::string name_;
	bool isAppMember_ = false;
	bool messageAllowed_ = false;
	std::optional<Timestamp> memberJoinedAt_;
};

inline constexpr char kPostingPermission[] = "posting";
inline constexpr char kCommentingPermission[] = "commenting";
inline constexpr char kContentsDeletionPermission[] = "contents_deletion";

class BandPermissions {
public:
	BandPermissions() = default;
	explicit BandPermissions(std::set<std::string> capabilities) : capabilities_(std::move(capabilities)) {}

	// Reads result_data.permissions.
	static BandPermissions fromJson(const Json &resultData);

	bool has(std::string_view capability) const;
	const std::set<std::string> &capabilities() const noexcept { return capabilities_; }

private:
	std::set<std::string> capabilities_;
};

/**
 * A band the user belongs to.
 *
 * Also owns the band's permission slot, filled at most once per instance. Posts and comments point
 * back here without owning it, so a Band is handed out by shared_ptr and is neither copied nor
 * moved.
 */
class Band {
	struct PrivateTag {
		explicit PrivateTag() = default;
	};

public:
	static constexpr std::array<std::string_view, 4> kFieldNames{"name", "band_key", "cover", "member_count"};

	static std::shared_ptr<Band> fromJson(const Json &j);

	// Reachable only through fromJson, which names the private tag.
	explicit Band(PrivateTag) {}
	~Band() noexcept = default;

	Band(const Band &) = delete;
	Band &operator=(const Band &) = delete;
	Band(Band &&) = delete;
	Band &operator=(Band &&) = delete;

	const std::string &name() const noexcept { return name_; }
	const std::string &bandKey() const noexcept { return bandKey_; }
	const std::string &cover() const noexcept { return cover_; }
	std::int64_t memberCount() const noexcept { return memberCount_; }

	// Runs fetch only while the slot is empty. The slot is left empty if fetch throws.
	const BandPermissions &permissions(const std::function<BandPermissions()> &fetch) const;

	bool hasCachedPermissions() const;

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	std::string name_;
	std::string bandKey_;
	std::string cover_;
	std::int64_t memberCount_ = 0;

	mutable std::mutex permissionsMutex_;
	mutable std::optional<BandPermissions> permissions_;
};

class Photo {
public:
	static constexpr std::array<std::string_view, 10> kFieldNames{
		"photo_key",	 "photo_album_key", "url",	     "width",	      "height",
		"created_at", "author",		    "comment_count", "emotion_count", "is_video_thumbnail"};

	static Photo fromJson(const Json &j);

	const std::string &photoKey() const noexcept { return photoKey_; }
	const std::optional<std::string> &photoAlbumKey() const noexcept { return photoAlbumKey_; }
	const std::string &url() const noexcept { return url_; }
	std::int64_t width() const noexcept { return width_; }
	std::int64_t height() const noexcept { return height_; }
	Timestamp createdAt() const noexcept { return createdAt_; }
	const std::optional<Author> &author() const noexcept { return author_; }
	std::int64_t commentCount() const noexcept { return commentCount_; }
	std::int64_t emotionCount() const noexcept { return emotionCount_; }
	bool isVideoThumbnail() const noexcept { return isVideoThumbnail_; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	Photo() = default;

	std::string photoKey_;
	std::optional<std::string> photoAlbumKey_;
	std::string url_;
	std::int64_t width_ = 0;
	std::int64_t height_ = 0;
	Timestamp createdAt_{};
	std::optional<Author> author_;
	std::int64_t commentCount_ = 0;
	std::int64_t emotionCount_ = 0;
	bool isVideoThumbnail_ = false;
};

class Comment {
public:
	static constexpr std::array<std::string_view, 8> kFieldNames{
		"band_key", "post_key", "comment_key", "body", "author", "created_at", "emotion_count", "is_audio_included"};

	// Comments embedded in a post carry no band_key/post_key; those come from band and postKey.
	static Comment fromJson(const Json &j, const Band &band, const std::string &postKey);

	const Band &band() const noexcept { return *band_; }
	const std::string &bandKey() const noexcept { return bandKey_; }
	const std::string &postKey() const noexcept { return postKey_; }
	const std::optional<std::string> &commentKey() const noexcept { return commentKey_; }
	const std::string &body() const noexcept { return body_; }
	const Author &author() const noexcept { return *author_; }
	Timestamp createdAt() const noexcept { return createdAt_; }
	std::int64_t emotionCount() const noexcept { return emotionCount_; }
	bool isAudioIncluded() const noexcept { return isAudioIncluded_; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	explicit Comment(const Band &band) : band_(&band) {}

	const Band *band_;
	std::string bandKey_;
	std::string postKey_;
	std::optional<std::string> commentKey_;
	std::string body_;
	std::optional<Author> author_;
	Timestamp createdAt_{};
	std::int64_t emotionCount_ = 0;
	bool isAudioIncluded_ = false;
};

class Post {
public:
	static constexpr std::array<std::string_view, 10> kFieldNames{
		"band_key",	 "post_key",	  "content", "author",	       "created_at",
		"comment_count", "emotion_count", "photos",  "latest_comments", "post_read_count"};

	static Post fromJson(const Json &j, const Band &band);

	const Band &band() const noexcept { return *band_; }
	const std::string &bandKey() const noexcept { return bandKey_; }
	const std::string &postKey() const noexcept { return postKey_; }
	const std::string &content() const noexcept { return content_; }
	const Author &author() const noexcept { return *author_; }
	Timestamp createdAt() const noexcept { return createdAt_; }
	std::int64_t commentCount() const noexcept { return commentCount_; }
	std::int64_t emotionCount() const noexcept { return emotionCount_; }
	const std::vector<Photo> &photos() const noexcept { return photos_; }
	const std::vector<Comment> &latestComments() const noexcept { return latestComments_; }

	// -1 when the API did not report it; list items never do.
	std::int64_t postReadCount() const noexcept { return postReadCount_; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	explicit Post(const Band &band) : band_(&band) {}

	const Band *band_;
	std::string bandKey_;
	std::string postKey_;
	std::string content_;
	std::optional<Author> author_;
	Timestamp createdAt_{};
	std::int64_t commentCount_ = 0;
	std::int64_t emotionCount_ = 0;
	std::vector<Photo> photos_;
	std::vector<Comment> latestComments_;
	std::int64_t postReadCount_ = -1;
};

class Album {
public:
	static constexpr std::array<std::string_view, 5> kFieldNames{"photo_album_key", "name", "photo_count",
								     "created_at", "author"};

	static Album fromJson(const Json &j);

	const std::string &photoAlbumKey() const noexcept { return photoAlbumKey_; }
	const std::string &name() const noexcept { return name_; }
	std::int64_t photoCount() const noexcept { return photoCount_; }
	const std::optional<Timestamp> &createdAt() const noexcept { return createdAt_; }
	const std::optional<Author> &author() const noexcept { return author_; }

	Json toJson() const;
	Json field(std::string_view name) const;

private:
	Album() = default;

	std::string photoAlbumKey_;
	std::string name_;
	std::int64_t photoCount_ = 0;
	std::optional<Timestamp> createdAt_;
	std::optional<Author> author_;
};

} // namespace OpenBand::BandApi
