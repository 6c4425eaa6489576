#include "core/media_probe.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <vector>

namespace
{
    const std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "gif", "webp", "heic", "heif", "bmp", "tif", "tiff"};
    const std::vector<std::string> video_extensions = {"mp4", "m4v", "mov", "webm", "avi", "mkv", "3gp"};

    const std::unordered_map<std::string, std::string> mime_types = {
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"heic", "image/heic"},
        {"mp4", "video/mp4"},
        {"m4v", "video/mp4"},
        {"mov", "video/quicktime"},
        {"webm", "video/webm"}};
}

MediaProbe::MediaProbe(std::shared_ptr<ImageTranscoder> images, std::shared_ptr<VideoTranscoder> videos)
    : images_(std::move(images)), videos_(std::move(videos))
{
}

std::string MediaProbe::getFileExtension(const std::string &file_path)
{
    std::string filename = std::filesystem::path(file_path).filename().string();
    size_t dot_pos = filename.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos + 1 == filename.size())
    {
        return "";
    }
    std::string extension = filename.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

bool MediaProbe::isImageFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    return std::find(image_extensions.begin(), image_extensions.end(), ext) != image_extensions.end();
}

bool MediaProbe::isVideoFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    return std::find(video_extensions.begin(), video_extensions.end(), ext) != video_extensions.end();
}

std::string MediaProbe::mimeForExtension(const std::string &extension)
{
    auto it = mime_types.find(extension);
    return it == mime_types.end() ? "" : it->second;
}

std::string MediaProbe::fallbackMime(MediaKind kind)
{
    return kind == MediaKind::VIDEO ? "video/mp4" : "image/jpeg";
}

MediaAsset MediaProbe::probe(const std::string &path, const std::optional<std::string> &mime_type) const
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        throw ValidationError("Media file does not exist: " + path);
    }

    MediaAsset asset;
    asset.local_ref = path;
    asset.byte_size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw ValidationError("Cannot read size of " + path + ": " + ec.message());
    }

    std::string mime = mime_type.value_or("");
    if (mime.rfind("video/", 0) == 0)
        asset.kind = MediaKind::VIDEO;
    else if (mime.rfind("image/", 0) == 0)
        asset.kind = MediaKind::IMAGE;
    else if (isVideoFile(path))
        asset.kind = MediaKind::VIDEO;
    else if (isImageFile(path))
        asset.kind = MediaKind::IMAGE;
    else
        throw ValidationError("Unsupported media type: " + path);

    if (mime.empty())
    {
        mime = mimeForExtension(getFileExtension(path));
    }
    if (mime.empty())
    {
        mime = fallbackMime(asset.kind);
        asset.mime_inferred = true;
        Logger::warn("No mime type known for " + path + ", assuming " + mime);
    }
    asset.mime_type = mime;

    std::optional<PixelSize> size;
    if (asset.isVideo() && videos_)
        size = videos_->probe(path);
    else if (asset.isImage() && images_)
        size = images_->dimensions(path);
    if (size)
    {
        asset.width = size->width;
        asset.height = size->height;
    }

    Logger::debug("Probed " + path + ": " + toString(asset.kind) + " " + asset.mime_type + ", " +
                  std::to_string(asset.byte_size) + " bytes");
    return asset;
}
