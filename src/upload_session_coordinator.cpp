#include "core/upload_session_coordinator.hpp"
#include "logging/logger.hpp"
#include <algorithm>

std::string toString(AttemptState state)
{
    switch (state)
    {
    case AttemptState::PENDING:
        return "pending";
    case AttemptState::UPLOADING:
        return "uploading";
    case AttemptState::SUCCEEDED:
        return "succeeded";
    case AttemptState::FAILED:
        return "failed";
    case AttemptState::CANCELED:
        return "canceled";
    }
    return "unknown";
}

uint64_t UploadSessionCoordinator::beginAttempt()
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t generation = ++generation_;

    // Settled attempts of older generations can never be consulted again
    for (auto it = attempts_.begin(); it != attempts_.end();)
    {
        if (it->first.first < generation && it->second.state != AttemptState::UPLOADING)
            it = attempts_.erase(it);
        else
            ++it;
    }

    Logger::debug("Began upload generation " + std::to_string(generation));
    return generation;
}

void UploadSessionCoordinator::trackCancelable(const CancelToken &token)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(tracked_.begin(), tracked_.end(), token) == tracked_.end())
    {
        tracked_.push_back(token);
    }
}

bool UploadSessionCoordinator::beginUpload(uint64_t generation, Destination destination, const CancelToken &token)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_.load())
    {
        Logger::debug("Refusing upload for stale generation " + std::to_string(generation));
        return false;
    }

    AttemptKey key{generation, destination};
    auto it = attempts_.find(key);
    if (it != attempts_.end() && it->second.state == AttemptState::UPLOADING)
    {
        Logger::debug(toString(destination) + " upload already running for generation " + std::to_string(generation));
        return false;
    }

    UploadAttempt attempt;
    attempt.generation = generation;
    attempt.destination = destination;
    attempt.state = AttemptState::UPLOADING;
    attempt.cancel = token;
    attempts_[key] = attempt;

    if (std::find(tracked_.begin(), tracked_.end(), token) == tracked_.end())
    {
        tracked_.push_back(token);
    }
    return true;
}

void UploadSessionCoordinator::finishUpload(uint64_t generation, Destination destination, AttemptState state)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(AttemptKey{generation, destination});
    if (it == attempts_.end())
    {
        return;
    }
    // A canceled attempt stays canceled even if its job reports later
    if (it->second.state == AttemptState::UPLOADING)
    {
        it->second.state = state;
    }
    CancelToken token = it->second.cancel;
    tracked_.erase(std::remove(tracked_.begin(), tracked_.end(), token), tracked_.end());
}

AttemptState UploadSessionCoordinator::attemptState(uint64_t generation, Destination destination) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(AttemptKey{generation, destination});
    return it == attempts_.end() ? AttemptState::PENDING : it->second.state;
}

bool UploadSessionCoordinator::isInFlight(uint64_t generation) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, attempt] : attempts_)
    {
        if (key.first == generation && attempt.state == AttemptState::UPLOADING)
            return true;
    }
    return false;
}

bool UploadSessionCoordinator::hasInFlight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : attempts_)
    {
        if (entry.second.state == AttemptState::UPLOADING)
            return true;
    }
    return false;
}

void UploadSessionCoordinator::cancelAll()
{
    std::vector<CancelToken> to_cancel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_cancel.swap(tracked_);
        for (auto &entry : attempts_)
        {
            if (entry.second.state == AttemptState::UPLOADING)
                entry.second.state = AttemptState::CANCELED;
        }
    }

    if (to_cancel.empty())
    {
        return;
    }

    Logger::info("Cancelling " + std::to_string(to_cancel.size()) + " in-flight operation(s)");
    // Callbacks run outside the lock; they may call back into this object
    for (const auto &token : to_cancel)
    {
        token.cancel();
    }
}

size_t UploadSessionCoordinator::trackedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.size();
}
