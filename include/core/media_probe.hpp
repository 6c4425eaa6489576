#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/media_asset.hpp"
#include "core/media_transcoder.hpp"

/**
 * @brief Builds MediaAsset values from files on disk
 *
 * Kind comes from the explicit mime type when one is given, else from the
 * file extension. A missing mime type falls back to image/jpeg or video/mp4
 * and the asset is flagged mime_inferred.
 */
class MediaProbe
{
public:
    MediaProbe(std::shared_ptr<ImageTranscoder> images, std::shared_ptr<VideoTranscoder> videos);

    /**
     * @brief Describe a local file
     * @param mime_type Optional explicit mime type (e.g. from a picker)
     * @throws ValidationError if the file is missing or its kind cannot be determined
     */
    MediaAsset probe(const std::string &path, const std::optional<std::string> &mime_type = std::nullopt) const;

    static std::string getFileExtension(const std::string &file_path);
    static bool isImageFile(const std::string &file_path);
    static bool isVideoFile(const std::string &file_path);

    /**
     * @brief Known mime type for an extension, or empty
     */
    static std::string mimeForExtension(const std::string &extension);

    static std::string fallbackMime(MediaKind kind);

private:
    std::shared_ptr<ImageTranscoder> images_;
    std::shared_ptr<VideoTranscoder> videos_;
};
