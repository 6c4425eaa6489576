#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

enum class MediaKind
{
    IMAGE,
    VIDEO
};

enum class Destination
{
    TWITTER,
    BLUESKY
};

std::string toString(MediaKind kind);
std::string toString(Destination destination);

/**
 * @brief Immutable description of a local media file ready for upload
 *
 * Every optimization pass produces a new MediaAsset pointing at a new file;
 * an asset is never modified in place.
 */
struct MediaAsset
{
    std::string local_ref; // Path of the file on disk
    MediaKind kind = MediaKind::IMAGE;
    std::optional<int> width;
    std::optional<int> height;
    std::string mime_type;
    uint64_t byte_size = 0;
    bool mime_inferred = false; // mime_type came from the per-kind fallback

    bool isVideo() const { return kind == MediaKind::VIDEO; }
    bool isImage() const { return kind == MediaKind::IMAGE; }
    bool isGif() const { return mime_type == "image/gif"; }

    bool operator==(const MediaAsset &other) const
    {
        return local_ref == other.local_ref && kind == other.kind && width == other.width &&
               height == other.height && mime_type == other.mime_type && byte_size == other.byte_size;
    }
    bool operator!=(const MediaAsset &other) const { return !(*this == other); }
};

/**
 * @brief Media already uploaded to Twitter's chunked endpoint
 */
struct TwitterMediaHandle
{
    std::string media_id;

    bool operator==(const TwitterMediaHandle &other) const { return media_id == other.media_id; }
};

/**
 * @brief Blob descriptor returned by com.atproto.repo.uploadBlob
 */
struct BlueskyBlob
{
    std::string link; // ref.$link (CID)
    std::string mime_type;
    uint64_t size = 0;

    bool operator==(const BlueskyBlob &other) const
    {
        return link == other.link && mime_type == other.mime_type && size == other.size;
    }

    nlohmann::json toJson() const;
    static BlueskyBlob fromJson(const nlohmann::json &blob);
};

using UploadHandle = std::variant<TwitterMediaHandle, BlueskyBlob>;
