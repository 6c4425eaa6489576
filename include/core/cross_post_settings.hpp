#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "core/chunked_upload_client.hpp"
#include "core/media_asset.hpp"
#include "core/size_aware_optimizer.hpp"

class PocoConfigManager;

/**
 * @brief Everything the coordinator needs from configuration, as plain values
 */
struct CrossPostSettings
{
    ChunkedUploadClient::Options twitter;
    SizeAwareOptimizer::Options optimizer;
    std::string bluesky_pds_url = "https://bsky.social";

    uint64_t twitter_image_limit_bytes = 5ULL * 1024 * 1024;
    uint64_t twitter_gif_limit_bytes = 15ULL * 1024 * 1024;
    uint64_t twitter_video_limit_bytes = 512ULL * 1024 * 1024;
    size_t bluesky_text_limit = 300;
    uint64_t bluesky_max_blob_bytes = 50ULL * 1024 * 1024;

    static CrossPostSettings fromConfig(const PocoConfigManager &config);

    uint64_t twitterLimitFor(const MediaAsset &asset) const;

    /**
     * @brief Byte budget for the eager optimization pass
     *
     * The Twitter limit for the asset kind, tightened to the Bluesky blob limit
     * when the asset will also be uploaded there.
     */
    uint64_t eagerLimitFor(const MediaAsset &asset, bool bluesky_active) const;
};
