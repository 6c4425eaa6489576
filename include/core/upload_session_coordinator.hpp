#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "core/cancel_token.hpp"
#include "core/media_asset.hpp"

enum class AttemptState
{
    PENDING,
    UPLOADING,
    SUCCEEDED,
    FAILED,
    CANCELED
};

std::string toString(AttemptState state);

struct UploadAttempt
{
    uint64_t generation = 0;
    Destination destination = Destination::TWITTER;
    AttemptState state = AttemptState::PENDING;
    CancelToken cancel;
};

/**
 * @brief Owns the generation counter and the cancellation handles of in-flight work
 *
 * Async results capture the generation they were started under and check it
 * with isCurrent() before touching shared state. Thread safe.
 */
class UploadSessionCoordinator
{
public:
    UploadSessionCoordinator() = default;

    /**
     * @brief Start a new generation; every previous generation becomes stale
     */
    uint64_t beginAttempt();

    uint64_t currentGeneration() const { return generation_.load(); }

    bool isCurrent(uint64_t generation) const { return generation == generation_.load(); }

    /**
     * @brief Remember a token so cancelAll() can reach it
     */
    void trackCancelable(const CancelToken &token);

    /**
     * @brief Register an Uploading attempt for (generation, destination)
     * @return false if one is already Uploading for that pair or the generation is stale
     */
    bool beginUpload(uint64_t generation, Destination destination, const CancelToken &token);

    /**
     * @brief Move the attempt to a terminal state; unknown attempts are ignored
     */
    void finishUpload(uint64_t generation, Destination destination, AttemptState state);

    AttemptState attemptState(uint64_t generation, Destination destination) const;

    bool isInFlight(uint64_t generation) const;
    bool hasInFlight() const;

    /**
     * @brief Cancel every tracked handle and mark Uploading attempts Canceled
     *
     * With nothing tracked this is a no-op; calling it twice equals calling it once.
     */
    void cancelAll();

    size_t trackedCount() const;

private:
    using AttemptKey = std::pair<uint64_t, Destination>;

    std::atomic<uint64_t> generation_{0};
    mutable std::mutex mutex_;
    std::vector<CancelToken> tracked_;
    std::map<AttemptKey, UploadAttempt> attempts_;
};
