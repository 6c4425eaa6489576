#include <gtest/gtest.h>
#include "core/size_aware_optimizer.hpp"
#include "test_support.hpp"

using namespace test_support;

class SizeAwareOptimizerTest : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        images_ = std::make_shared<FakeImageTranscoder>();
        videos_ = std::make_shared<FakeVideoTranscoder>();
        options_.min_transform_bytes = 100;
        options_.work_dir = (dir_ / "work").string();
    }

    SizeAwareOptimizer make(bool with_video = true)
    {
        return SizeAwareOptimizer(images_, with_video ? videos_ : nullptr, options_);
    }

    std::shared_ptr<FakeImageTranscoder> images_;
    std::shared_ptr<FakeVideoTranscoder> videos_;
    SizeAwareOptimizer::Options options_;
};

TEST_F(SizeAwareOptimizerTest, AssetUnderLimitIsReturnedUnchanged)
{
    MediaAsset asset = makeAsset("photo.jpg", 2000, MediaKind::IMAGE, "image/jpeg");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 2000);
    EXPECT_EQ(result.asset, asset);
    EXPECT_EQ(result.passes, 0);
    EXPECT_FALSE(result.warning.has_value());
    EXPECT_TRUE(images_->calls.empty());
}

TEST_F(SizeAwareOptimizerTest, SmallAssetsSkipTransform)
{
    options_.min_transform_bytes = 10000;
    MediaAsset asset = makeAsset("photo.jpg", 5000, MediaKind::IMAGE, "image/jpeg");
    SizeAwareOptimizer optimizer = make();

    EXPECT_EQ(optimizer.optimize(asset, 1000), asset);
    EXPECT_TRUE(images_->calls.empty());
}

TEST_F(SizeAwareOptimizerTest, StopsAtFirstPassUnderLimit)
{
    images_->size_for = [](int max_dimension, double)
    { return max_dimension == 1200 ? size_t(900) : size_t(3000); };
    MediaAsset asset = makeAsset("photo.jpg", 5000, MediaKind::IMAGE, "image/jpeg");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 1000);

    EXPECT_EQ(result.passes, 2);
    EXPECT_EQ(result.asset.byte_size, 900u);
    EXPECT_EQ(result.asset.mime_type, "image/jpeg");
    EXPECT_NE(result.asset.local_ref, asset.local_ref);
    EXPECT_EQ(result.asset.width, 1200);
    EXPECT_FALSE(result.warning.has_value());

    ASSERT_EQ(images_->calls.size(), 2u);
    EXPECT_EQ(images_->calls[0], std::make_pair(1600, 0.8));
    EXPECT_EQ(images_->calls[1], std::make_pair(1200, 0.7));
    // Every pass re-encodes the original
    for (const auto &input : images_->inputs)
    {
        EXPECT_EQ(input, asset.local_ref);
    }
    // The original is never touched
    EXPECT_TRUE(std::filesystem::exists(asset.local_ref));
}

TEST_F(SizeAwareOptimizerTest, ExhaustedLadderReturnsSmallestWithWarning)
{
    images_->size_for = [](int max_dimension, double)
    { return max_dimension == 1200 ? size_t(1500) : size_t(2500); };
    MediaAsset asset = makeAsset("photo.jpg", 5000, MediaKind::IMAGE, "image/jpeg");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 1000);

    EXPECT_EQ(result.passes, 3);
    EXPECT_EQ(result.asset.byte_size, 1500u);
    EXPECT_TRUE(result.warning.has_value());
    EXPECT_TRUE(std::filesystem::exists(result.asset.local_ref));
}

TEST_F(SizeAwareOptimizerTest, TransformFailureReturnsBestSoFar)
{
    images_->fail = true;
    MediaAsset asset = makeAsset("photo.jpg", 5000, MediaKind::IMAGE, "image/jpeg");
    SizeAwareOptimizer optimizer = make();

    MediaAsset result;
    ASSERT_NO_THROW(result = optimizer.optimize(asset, 1000));
    EXPECT_EQ(result, asset);
}

TEST_F(SizeAwareOptimizerTest, GifIsNotReencoded)
{
    MediaAsset asset = makeAsset("anim.gif", 5000, MediaKind::IMAGE, "image/gif");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 1000);
    EXPECT_EQ(result.asset, asset);
    EXPECT_TRUE(result.warning.has_value());
    EXPECT_TRUE(images_->calls.empty());
}

TEST_F(SizeAwareOptimizerTest, VideoWithoutTranscoderPassesThrough)
{
    MediaAsset asset = makeAsset("clip.mp4", 5000, MediaKind::VIDEO, "video/mp4");
    SizeAwareOptimizer optimizer = make(false);
    EXPECT_EQ(optimizer.optimize(asset, 1000), asset);
}

TEST_F(SizeAwareOptimizerTest, VideoProfileFollowsAspectRatio)
{
    VideoProfile square = SizeAwareOptimizer::profileFor(1000, 1040);
    EXPECT_EQ(square.max_side, 1080);
    EXPECT_EQ(square.bitrate_bps, 4000000);

    VideoProfile landscape = SizeAwareOptimizer::profileFor(1920, 1080);
    EXPECT_EQ(landscape.max_side, 1280);
    EXPECT_EQ(landscape.bitrate_bps, 5000000);

    VideoProfile portrait = SizeAwareOptimizer::profileFor(1080, 1920);
    EXPECT_EQ(portrait.max_side, 1280);

    VideoProfile unknown = SizeAwareOptimizer::profileFor(std::nullopt, std::nullopt);
    EXPECT_EQ(unknown.max_side, 1280);
}

TEST_F(SizeAwareOptimizerTest, VideoFallsBackToLowerBitrate)
{
    videos_->size_for = [](const VideoProfile &profile)
    { return profile.bitrate_bps < 5000000 ? size_t(800) : size_t(1200); };
    MediaAsset asset = makeAsset("clip.mp4", 5000, MediaKind::VIDEO, "video/mp4");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 1000);

    ASSERT_EQ(videos_->calls.size(), 2u);
    EXPECT_EQ(videos_->calls[0].bitrate_bps, 5000000);
    EXPECT_EQ(videos_->calls[1].bitrate_bps, 3500000);
    EXPECT_EQ(result.asset.byte_size, 800u);
    EXPECT_EQ(result.asset.mime_type, "video/mp4");
    EXPECT_FALSE(result.warning.has_value());
}

TEST_F(SizeAwareOptimizerTest, VideoStillTooLargeWarns)
{
    videos_->size_for = [](const VideoProfile &)
    { return size_t(2000); };
    MediaAsset asset = makeAsset("clip.mp4", 5000, MediaKind::VIDEO, "video/mp4");
    SizeAwareOptimizer optimizer = make();

    OptimizationResult result = optimizer.optimizeDetailed(asset, 1000);
    EXPECT_EQ(result.asset.byte_size, 2000u);
    EXPECT_TRUE(result.warning.has_value());
}

TEST(VideoTranscoderTest, FitWithinKeepsAspectAndEvenSides)
{
    PixelSize landscape = FfmpegVideoTranscoder::fitWithin(1920, 1080, 1280);
    EXPECT_EQ(landscape.width, 1280);
    EXPECT_EQ(landscape.height, 720);

    PixelSize odd = FfmpegVideoTranscoder::fitWithin(1001, 999, 1080);
    EXPECT_EQ(odd.width % 2, 0);
    EXPECT_EQ(odd.height % 2, 0);
    EXPECT_LE(odd.width, 1001);

    PixelSize portrait = FfmpegVideoTranscoder::fitWithin(1080, 1920, 1280);
    EXPECT_EQ(portrait.height, 1280);
    EXPECT_EQ(portrait.width, 720);

    EXPECT_THROW(FfmpegVideoTranscoder::fitWithin(0, 10, 100), std::invalid_argument);
}
