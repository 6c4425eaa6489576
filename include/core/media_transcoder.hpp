#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct PixelSize
{
    int width = 0;
    int height = 0;
};

/**
 * @brief Resize + JPEG re-encode primitive used by the optimizer
 *
 * Implementations throw std::exception subclasses on failure.
 */
class ImageTranscoder
{
public:
    virtual ~ImageTranscoder() = default;

    /**
     * @brief Write @p input to @p output as JPEG, downscaled so neither side exceeds @p max_dimension
     * @param quality JPEG quality in (0, 1]
     * @return Pixel size of the written image
     */
    virtual PixelSize reencode(const std::string &input, const std::string &output, int max_dimension,
                               double quality) = 0;

    virtual std::optional<PixelSize> dimensions(const std::string &path) = 0;
};

class OpenCvImageTranscoder : public ImageTranscoder
{
public:
    PixelSize reencode(const std::string &input, const std::string &output, int max_dimension,
                       double quality) override;
    std::optional<PixelSize> dimensions(const std::string &path) override;
};

struct VideoProfile
{
    int max_side = 1280;
    int64_t bitrate_bps = 5000000;
};

/**
 * @brief Bitrate/resolution transcode primitive used by the optimizer
 */
class VideoTranscoder
{
public:
    virtual ~VideoTranscoder() = default;

    virtual std::optional<PixelSize> probe(const std::string &path) = 0;

    /**
     * @brief Transcode to H.264 MP4 at the profile's size and bitrate
     * @return Pixel size of the written video
     */
    virtual PixelSize transcode(const std::string &input, const std::string &output, const VideoProfile &profile) = 0;
};

/**
 * @brief libavformat/libavcodec transcoder: H.264 video, audio stream-copied
 */
class FfmpegVideoTranscoder : public VideoTranscoder
{
public:
    std::optional<PixelSize> probe(const std::string &path) override;
    PixelSize transcode(const std::string &input, const std::string &output, const VideoProfile &profile) override;

    /**
     * @brief Fit (width, height) inside max_side keeping aspect ratio; both sides even, never upscaled
     */
    static PixelSize fitWithin(int width, int height, int max_side);
};
