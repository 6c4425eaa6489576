#include "core/cross_post_settings.hpp"
#include "core/poco_config_manager.hpp"
#include <algorithm>

CrossPostSettings CrossPostSettings::fromConfig(const PocoConfigManager &config)
{
    CrossPostSettings settings;
    settings.twitter.upload_url = config.getTwitterUploadUrl();
    settings.twitter.post_url = config.getTwitterPostUrl();
    settings.twitter.small_chunk_bytes = config.getSmallChunkBytes();
    settings.twitter.large_chunk_bytes = config.getLargeChunkBytes();
    settings.twitter.large_video_threshold_bytes = config.getLargeVideoThresholdBytes();
    settings.twitter.status_min_interval = std::chrono::milliseconds(config.getStatusMinIntervalMs());
    settings.twitter.status_max_polls = std::max(1, config.getStatusMaxPolls());

    settings.optimizer.min_transform_bytes = config.getOptimizerMinTransformBytes();
    settings.optimizer.work_dir = config.getOptimizerWorkDir();

    settings.bluesky_pds_url = config.getBlueskyPdsUrl();
    settings.twitter_image_limit_bytes = config.getTwitterImageLimitBytes();
    settings.twitter_gif_limit_bytes = config.getTwitterGifLimitBytes();
    settings.twitter_video_limit_bytes = config.getTwitterVideoLimitBytes();
    settings.bluesky_text_limit = config.getBlueskyTextLimit();
    settings.bluesky_max_blob_bytes = config.getBlueskyMaxBlobBytes();
    return settings;
}

uint64_t CrossPostSettings::twitterLimitFor(const MediaAsset &asset) const
{
    if (asset.isVideo())
        return twitter_video_limit_bytes;
    if (asset.isGif())
        return twitter_gif_limit_bytes;
    return twitter_image_limit_bytes;
}

uint64_t CrossPostSettings::eagerLimitFor(const MediaAsset &asset, bool bluesky_active) const
{
    uint64_t limit = twitterLimitFor(asset);
    if (bluesky_active && !asset.isVideo())
    {
        limit = std::min(limit, bluesky_max_blob_bytes);
    }
    return limit;
}
