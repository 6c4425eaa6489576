#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/media_asset.hpp"
#include "core/media_transcoder.hpp"

struct ImagePass
{
    int max_dimension;
    double quality;
};

struct OptimizationResult
{
    MediaAsset asset;
    int passes = 0;                     // Transform passes actually run
    std::optional<std::string> warning; // Set when the result is still over the limit
};

/**
 * @brief Re-encodes media until it fits a byte budget or the pass ladder runs out
 *
 * Never throws for transform failures: the best asset obtained so far is
 * returned and the failure is logged.
 */
class SizeAwareOptimizer
{
public:
    struct Options
    {
        uint64_t min_transform_bytes = 256 * 1024;
        std::string work_dir;
    };

    SizeAwareOptimizer(std::shared_ptr<ImageTranscoder> images, std::shared_ptr<VideoTranscoder> videos,
                       Options options);

    MediaAsset optimize(const MediaAsset &asset, uint64_t limit_bytes);

    OptimizationResult optimizeDetailed(const MediaAsset &asset, uint64_t limit_bytes);

    static const std::vector<ImagePass> &imageLadder();

    /**
     * @brief Square sources (ratio within 5% of 1) get 1080px at 4 Mbit/s, others 1280px at 5 Mbit/s
     */
    static VideoProfile profileFor(std::optional<int> width, std::optional<int> height);

private:
    OptimizationResult optimizeImage(const MediaAsset &asset, uint64_t limit_bytes);
    OptimizationResult optimizeVideo(const MediaAsset &asset, uint64_t limit_bytes);
    std::string nextOutputPath(const MediaAsset &asset, const std::string &extension);
    void discard(const MediaAsset &candidate, const MediaAsset &original) const;

    std::shared_ptr<ImageTranscoder> images_;
    std::shared_ptr<VideoTranscoder> videos_;
    Options options_;
    std::atomic<uint64_t> counter_{0};
};
