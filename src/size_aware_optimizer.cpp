#include "core/size_aware_optimizer.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <cmath>
#include <filesystem>

namespace
{
    std::string formatBytes(uint64_t bytes)
    {
        return std::to_string(bytes / 1024) + " KiB";
    }
}

SizeAwareOptimizer::SizeAwareOptimizer(std::shared_ptr<ImageTranscoder> images, std::shared_ptr<VideoTranscoder> videos,
                                       Options options)
    : images_(std::move(images)), videos_(std::move(videos)), options_(std::move(options))
{
    if (options_.work_dir.empty())
    {
        options_.work_dir = (std::filesystem::temp_directory_path() / "crosspost").string();
    }
}

const std::vector<ImagePass> &SizeAwareOptimizer::imageLadder()
{
    static const std::vector<ImagePass> ladder = {{1600, 0.8}, {1200, 0.7}, {1000, 0.6}};
    return ladder;
}

VideoProfile SizeAwareOptimizer::profileFor(std::optional<int> width, std::optional<int> height)
{
    if (width && height && *width > 0 && *height > 0)
    {
        double ratio = static_cast<double>(*width) / static_cast<double>(*height);
        if (std::fabs(ratio - 1.0) <= 0.05)
        {
            return VideoProfile{1080, 4000000};
        }
    }
    return VideoProfile{1280, 5000000};
}

MediaAsset SizeAwareOptimizer::optimize(const MediaAsset &asset, uint64_t limit_bytes)
{
    return optimizeDetailed(asset, limit_bytes).asset;
}

OptimizationResult SizeAwareOptimizer::optimizeDetailed(const MediaAsset &asset, uint64_t limit_bytes)
{
    OptimizationResult result{asset, 0, std::nullopt};
    if (asset.byte_size <= limit_bytes)
    {
        return result;
    }
    if (asset.byte_size < options_.min_transform_bytes)
    {
        Logger::debug("Skipping optimization of " + asset.local_ref + ": below minimum transform size");
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.work_dir, ec);
    if (ec)
    {
        Logger::error("Cannot create optimizer work directory " + options_.work_dir + ": " + ec.message());
        result.warning = "Media is larger than the " + formatBytes(limit_bytes) + " limit and could not be optimized";
        return result;
    }

    Logger::info("Optimizing " + asset.local_ref + " (" + formatBytes(asset.byte_size) + ") for a " +
                 formatBytes(limit_bytes) + " limit");
    return asset.isVideo() ? optimizeVideo(asset, limit_bytes) : optimizeImage(asset, limit_bytes);
}

OptimizationResult SizeAwareOptimizer::optimizeImage(const MediaAsset &asset, uint64_t limit_bytes)
{
    OptimizationResult result{asset, 0, std::nullopt};

    if (asset.isGif())
    {
        // JPEG re-encoding would drop the animation
        result.warning = "Animated GIF exceeds the " + formatBytes(limit_bytes) + " limit";
        Logger::warn(*result.warning + ": " + asset.local_ref);
        return result;
    }
    if (!images_)
    {
        result.warning = "Image exceeds the " + formatBytes(limit_bytes) + " limit and no image transcoder is available";
        Logger::warn(*result.warning);
        return result;
    }

    for (const ImagePass &pass : imageLadder())
    {
        std::string output = nextOutputPath(asset, "jpg");
        ++result.passes;
        try
        {
            // Every pass starts from the original to avoid compounding artifacts
            PixelSize size = images_->reencode(asset.local_ref, output, pass.max_dimension, pass.quality);

            MediaAsset candidate;
            candidate.local_ref = output;
            candidate.kind = MediaKind::IMAGE;
            candidate.width = size.width;
            candidate.height = size.height;
            candidate.mime_type = "image/jpeg";
            candidate.byte_size = std::filesystem::file_size(output);

            Logger::debug("Image pass " + std::to_string(pass.max_dimension) + "px/q" + std::to_string(pass.quality) +
                          " -> " + formatBytes(candidate.byte_size));

            if (candidate.byte_size < result.asset.byte_size)
            {
                discard(result.asset, asset);
                result.asset = candidate;
            }
            else
            {
                discard(candidate, asset);
            }
            if (result.asset.byte_size <= limit_bytes)
            {
                Logger::info("Image fits after " + std::to_string(result.passes) + " pass(es): " +
                             formatBytes(result.asset.byte_size));
                return result;
            }
        }
        catch (const std::exception &e)
        {
            Logger::error("Image optimization pass failed for " + asset.local_ref + ": " + e.what());
            std::error_code ec;
            std::filesystem::remove(output, ec);
            break;
        }
    }

    if (result.asset.byte_size > limit_bytes)
    {
        result.warning = "Image is still " + formatBytes(result.asset.byte_size) + " after optimization (limit " +
                         formatBytes(limit_bytes) + ")";
        Logger::warn(*result.warning);
    }
    return result;
}

OptimizationResult SizeAwareOptimizer::optimizeVideo(const MediaAsset &asset, uint64_t limit_bytes)
{
    OptimizationResult result{asset, 0, std::nullopt};
    if (!videos_)
    {
        Logger::warn("No video transcoder configured; uploading " + asset.local_ref + " unchanged");
        return result;
    }

    std::optional<int> width = asset.width;
    std::optional<int> height = asset.height;
    if (!width || !height)
    {
        try
        {
            if (auto probed = videos_->probe(asset.local_ref))
            {
                width = probed->width;
                height = probed->height;
            }
        }
        catch (const std::exception &e)
        {
            Logger::warn("Video probe failed for " + asset.local_ref + ": " + e.what());
        }
    }

    VideoProfile primary = profileFor(width, height);
    VideoProfile fallback{primary.max_side, static_cast<int64_t>(primary.bitrate_bps * 0.7)};

    for (const VideoProfile &profile : {primary, fallback})
    {
        std::string output = nextOutputPath(asset, "mp4");
        ++result.passes;
        try
        {
            PixelSize size = videos_->transcode(asset.local_ref, output, profile);

            MediaAsset candidate;
            candidate.local_ref = output;
            candidate.kind = MediaKind::VIDEO;
            candidate.width = size.width;
            candidate.height = size.height;
            candidate.mime_type = "video/mp4";
            candidate.byte_size = std::filesystem::file_size(output);

            if (candidate.byte_size < result.asset.byte_size)
            {
                discard(result.asset, asset);
                result.asset = candidate;
            }
            else
            {
                discard(candidate, asset);
            }
            if (result.asset.byte_size <= limit_bytes)
            {
                Logger::info("Video fits at " + std::to_string(profile.bitrate_bps / 1000) + " kbit/s: " +
                             formatBytes(result.asset.byte_size));
                return result;
            }
        }
        catch (const std::exception &e)
        {
            Logger::error("Video transcode failed for " + asset.local_ref + ": " + e.what());
            std::error_code ec;
            std::filesystem::remove(output, ec);
        }
    }

    result.warning = "Video is still " + formatBytes(result.asset.byte_size) + " after transcoding (limit " +
                     formatBytes(limit_bytes) + ")";
    Logger::warn(*result.warning);
    return result;
}

std::string SizeAwareOptimizer::nextOutputPath(const MediaAsset &asset, const std::string &extension)
{
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();
    std::string stem = std::filesystem::path(asset.local_ref).stem().string();
    std::string name = stem + "_" + std::to_string(stamp) + "_" + std::to_string(++counter_) + "." + extension;
    return (std::filesystem::path(options_.work_dir) / name).string();
}

void SizeAwareOptimizer::discard(const MediaAsset &candidate, const MediaAsset &original) const
{
    // Never delete the caller's file
    if (candidate.local_ref == original.local_ref)
    {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(candidate.local_ref, ec);
}
