/*
 * OpenBand - BandApi
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include "BandTypes.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <stdexcept>

#include <fmt/format.h>

namespace OpenBand::BandApi {

namespace {

template<typename T> void readOptional(const Json &j, const char *key, T &out)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		it->get_to(out);
	}
}

template<typename T> void readOptional(const Json &j, const char *key, std::optional<T> &out)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		out = it->template get<T>();
	}
}

std::optional<Timestamp> readOptionalTimestamp(const Json &j, const char *key)
{
	if (auto it = j.find(key); it != j.end() && !it->is_null()) {
		return timestampFromMillis(it->get<std::int64_t>());
	}
	return std::nullopt;
}

Json lookupField(const Json &object, std::span<const std::string_view> names, std::string_view name,
		 std::string_view typeName)
{
	if (std::find(names.begin(), names.end(), name) == names.end()) {
		throw std::out_of_range(fmt::format("UnknownFieldError({}::field): {}", typeName, name));
	}

	auto it = object.find(std::string(name));
	return it == object.end() ? Json() : *it;
}

} // anonymous namespace

Timestamp timestampFromMillis(std::int64_t millis) noexcept
{
	return Timestamp(std::chrono::milliseconds(millis));
}

std::int64_t timestampToMillis(Timestamp timestamp) noexcept
{
	return timestamp.time_since_epoch().count();
}

// Author

Author Author::fromJson(const Json &j)
{
	Author author;
	j.at("name").get_to(author.name_);
	j.at("user_key").get_to(author.userKey_);
	readOptional(j, "description", author.description_);
	readOptional(j, "role", author.role_);
	readOptional(j, "profile_image_url", author.profileImageUrl_);
	return author;
}

Json Author::toJson() const
{
	return Json{{"name", name_},
		    {"description", description_},
		    {"role", role_},
		    {"profile_image_url", profileImageUrl_},
		    {"user_key", userKey_}};
}

Json Author::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Author");
}

// Profile

Profile Profile::fromJson(const Json &j)
{
	Profile profile;
	j.at("user_key").get_to(profile.userKey_);
	j.at("name").get_to(profile.name_);
	readOptional(j, "profile_image_url", profile.profileImageUrl_);
	readOptional(j, "is_app_member", profile.isAppMember_);
	readOptional(j, "message_allowed", profile.messageAllowed_);
	profile.memberJoinedAt_ = readOptionalTimestamp(j, "member_joined_at");
	return profile;
}

Json Profile::toJson() const
{
	Json j{{"user_key", userKey_},
	       {"profile_image_url", profileImageUrl_},
	       {"name", name_},
	       {"is_app_member", isAppMember_},
	       {"message_allowed", messageAllowed_}};
	if (memberJoinedAt_) {
		j["member_joined_at"] = timestampToMillis(*memberJoinedAt_);
	}
	return j;
}

Json Profile::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Profile");
}

// BandPermissions

BandPermissions BandPermissions::fromJson(const Json &resultData)
{
	std::set<std::string> capabilities;
	if (auto it = resultData.find("permissions"); it != resultData.end() && !it->is_null()) {
		for (const auto &permission : *it) {
			capabilities.insert(permission.get<std::string>());
		}
	}
	return BandPermissions(std::move(capabilities));
}

bool BandPermissions::has(std::string_view capability) const
{
	return capabilities_.find(std::string(capability)) != capabilities_.end();
}

// Band

std::shared_ptr<Band> Band::fromJson(const Json &j)
{
	auto band = std::make_shared<Band>(PrivateTag{});
	j.at("name").get_to(band->name_);
	j.at("band_key").get_to(band->bandKey_);
	readOptional(j, "cover", band->cover_);
	readOptional(j, "member_count", band->memberCount_);
	return band;
}

const BandPermissions &Band::permissions(const std::function<BandPermissions()> &fetch) const
{
	std::scoped_lock lock(permissionsMutex_);
	if (!permissions_) {
		permissions_.emplace(fetch());
	}
	return *permissions_;
}

bool Band::hasCachedPermissions() const
{
	std::scoped_lock lock(permissionsMutex_);
	return permissions_.has_value();
}

Json Band::toJson() const
{
	return Json{{"name", name_}, {"band_key", bandKey_}, {"cover", cover_}, {"member_count", memberCount_}};
}

Json Band::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Band");
}

// Photo

Photo Photo::fromJson(const Json &j)
{
	Photo photo;
	j.at("photo_key").get_to(photo.photoKey_);
	j.at("url").get_to(photo.url_);
	photo.createdAt_ = timestampFromMillis(j.at("created_at").get<std::int64_t>());
	readOptional(j, "photo_album_key", photo.photoAlbumKey_);
	readOptional(j, "width", photo.width_);
	readOptional(j, "height", photo.height_);
	readOptional(j, "comment_count", photo.commentCount_);
	readOptional(j, "emotion_count", photo.emotionCount_);
	readOptional(j, "is_video_thumbnail", photo.isVideoThumbnail_);
	if (auto it = j.find("author"); it != j.end() && !it->is_null()) {
		photo.author_.emplace(Author::fromJson(*it));
	}
	return photo;
}

Json Photo::toJson() const
{
	Json j{{"photo_key", photoKey_},
	       {"photo_album_key", photoAlbumKey_ ? Json(*photoAlbumKey_) : Json()},
	       {"url", url_},
	       {"width", width_},
	       {"height", height_},
	       {"created_at", timestampToMillis(createdAt_)},
	       {"author", author_ ? author_->toJson() : Json()},
	       {"comment_count", commentCount_},
	       {"emotion_count", emotionCount_},
	       {"is_video_thumbnail", isVideoThumbnail_}};
	return j;
}

Json Photo::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Photo");
}

// Comment

Comment Comment::fromJson(const Json &j, const Band &band, const std::string &postKey)
{
	Comment comment(band);
	comment.bandKey_ = j.value("band_key", band.bandKey());
	comment.postKey_ = j.value("post_key", postKey);
	readOptional(j, "comment_key", comment.commentKey_);

	// Listed comments carry their text in "content", comments embedded in a post in "body".
	if (auto it = j.find("content"); it != j.end() && !it->is_null()) {
		it->get_to(comment.body_);
	} else {
		readOptional(j, "body", comment.body_);
	}

	comment.author_.emplace(Author::fromJson(j.at("author")));
	comment.createdAt_ = timestampFromMillis(j.at("created_at").get<std::int64_t>());
	readOptional(j, "emotion_count", comment.emotionCount_);
	readOptional(j, "is_audio_included", comment.isAudioIncluded_);
	return comment;
}

Json Comment::toJson() const
{
	return Json{{"band_key", bandKey_},
		    {"post_key", postKey_},
		    {"comment_key", commentKey_ ? Json(*commentKey_) : Json()},
		    {"body", body_},
		    {"author", author_->toJson()},
		    {"created_at", timestampToMillis(createdAt_)},
		    {"emotion_count", emotionCount_},
		    {"is_audio_included", isAudioIncluded_}};
}

Json Comment::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Comment");
}

// Post

Post Post::fromJson(const Json &j, const Band &band)
{
	Post post(band);
	post.bandKey_ = j.value("band_key", band.bandKey());
	j.at("post_key").get_to(post.postKey_);
	readOptional(j, "content", post.content_);
	post.author_.emplace(Author::fromJson(j.at("author")));
	post.createdAt_ = timestampFromMillis(j.at("created_at").get<std::int64_t>());
	readOptional(j, "comment_count", post.commentCount_);
	readOptional(j, "emotion_count", post.emotionCount_);
	readOptional(j, "post_read_count", post.postReadCount_);

	if (auto it = j.find("photos"); it != j.end() && !it->is_null()) {
		for (const auto &photo : *it) {
			post.photos_.push_back(Photo::fromJson(photo));
		}
	}

	if (auto it = j.find("latest_comments"); it != j.end() && !it->is_null()) {
		for (const auto &comment : *it) {
			post.latestComments_.push_back(Comment::fromJson(comment, band, post.postKey_));
		}
	}

	return post;
}

Json Post::toJson() const
{
	Json photos = Json::array();
	for (const auto &photo : photos_) {
		photos.push_back(photo.toJson());
	}

	Json latestComments = Json::array();
	for (const auto &comment : latestComments_) {
		latestComments.push_back(comment.toJson());
	}

	return Json{{"band_key", bandKey_},
		    {"post_key", postKey_},
		    {"content", content_},
		    {"author", author_->toJson()},
		    {"created_at", timestampToMillis(createdAt_)},
		    {"comment_count", commentCount_},
		    {"emotion_count", emotionCount_},
		    {"photos", std::move(photos)},
		    {"latest_comments", std::move(latestComments)},
		    {"post_read_count", postReadCount_}};
}

Json Post::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Post");
}

// Album

Album Album::fromJson(const Json &j)
{
	Album album;
	j.at("photo_album_key").get_to(album.photoAlbumKey_);
	readOptional(j, "name", album.name_);
	readOptional(j, "photo_count", album.photoCount_);
	album.createdAt_ = readOptionalTimestamp(j, "created_at");
	if (auto it = j.find("author"); it != j.end() && !it->is_null()) {
		album.author_.emplace(Author::fromJson(*it));
	}
	return album;
}

Json Album::toJson() const
{
	return Json{{"photo_album_key", photoAlbumKey_},
		    {"name", name_},
		    {"photo_count", photoCount_},
		    {"created_at", createdAt_ ? Json(timestampToMillis(*createdAt_)) : Json()},
		    {"author", author_ ? author_->toJson() : Json()}};
}

Json Album::field(std::string_view name) const
{
	return lookupField(toJson(), kFieldNames, name, "Album");
}

} // namespace OpenBand::BandApi
