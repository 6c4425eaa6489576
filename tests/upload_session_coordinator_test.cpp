#include <gtest/gtest.h>
#include "core/upload_session_coordinator.hpp"

TEST(UploadSessionCoordinatorTest, GenerationsAreMonotonic)
{
    UploadSessionCoordinator session;
    std::vector<uint64_t> generations;
    for (int i = 0; i < 5; ++i)
    {
        generations.push_back(session.beginAttempt());
    }

    EXPECT_EQ(session.currentGeneration(), generations.back());
    EXPECT_TRUE(session.isCurrent(generations.back()));
    for (size_t i = 0; i + 1 < generations.size(); ++i)
    {
        EXPECT_LT(generations[i], generations[i + 1]);
        EXPECT_FALSE(session.isCurrent(generations[i]));
    }
}

TEST(UploadSessionCoordinatorTest, OneUploadingAttemptPerDestination)
{
    UploadSessionCoordinator session;
    uint64_t generation = session.beginAttempt();

    EXPECT_TRUE(session.beginUpload(generation, Destination::TWITTER, CancelToken()));
    EXPECT_FALSE(session.beginUpload(generation, Destination::TWITTER, CancelToken()));
    EXPECT_TRUE(session.beginUpload(generation, Destination::BLUESKY, CancelToken()));
    EXPECT_TRUE(session.isInFlight(generation));

    session.finishUpload(generation, Destination::TWITTER, AttemptState::FAILED);
    EXPECT_EQ(session.attemptState(generation, Destination::TWITTER), AttemptState::FAILED);
    // A failed attempt can be retried within the same generation
    EXPECT_TRUE(session.beginUpload(generation, Destination::TWITTER, CancelToken()));

    session.finishUpload(generation, Destination::TWITTER, AttemptState::SUCCEEDED);
    session.finishUpload(generation, Destination::BLUESKY, AttemptState::SUCCEEDED);
    EXPECT_FALSE(session.isInFlight(generation));
    EXPECT_FALSE(session.hasInFlight());
}

TEST(UploadSessionCoordinatorTest, StaleGenerationCannotStartUploads)
{
    UploadSessionCoordinator session;
    uint64_t old_generation = session.beginAttempt();
    session.beginAttempt();
    EXPECT_FALSE(session.beginUpload(old_generation, Destination::TWITTER, CancelToken()));
}

TEST(UploadSessionCoordinatorTest, CancelAllSignalsTrackedTokensAndIsIdempotent)
{
    UploadSessionCoordinator session;
    EXPECT_NO_THROW(session.cancelAll());

    uint64_t generation = session.beginAttempt();
    CancelToken upload;
    CancelToken extra;
    ASSERT_TRUE(session.beginUpload(generation, Destination::TWITTER, upload));
    session.trackCancelable(extra);
    session.trackCancelable(extra);
    EXPECT_EQ(session.trackedCount(), 2u);

    int callbacks = 0;
    auto registration = upload.onCancel([&]()
                                        { ++callbacks; });

    session.cancelAll();
    EXPECT_TRUE(upload.isCancelled());
    EXPECT_TRUE(extra.isCancelled());
    EXPECT_EQ(session.trackedCount(), 0u);
    EXPECT_EQ(session.attemptState(generation, Destination::TWITTER), AttemptState::CANCELED);
    EXPECT_FALSE(session.hasInFlight());

    session.cancelAll();
    EXPECT_EQ(callbacks, 1);

    // A late completion does not revive a canceled attempt
    session.finishUpload(generation, Destination::TWITTER, AttemptState::SUCCEEDED);
    EXPECT_EQ(session.attemptState(generation, Destination::TWITTER), AttemptState::CANCELED);
}
