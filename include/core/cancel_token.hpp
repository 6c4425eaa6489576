#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Shared cooperative cancellation flag
 *
 * Copies of a token share one state. Network calls register a callback that
 * tears down their connection; sleeps between polls wait on the token so a
 * cancel interrupts them immediately.
 */
class CancelToken
{
public:
    /**
     * @brief Unregisters its callback when destroyed
     */
    class Registration
    {
    public:
        Registration() = default;
        Registration(std::weak_ptr<void> state, uint64_t id);
        ~Registration();

        Registration(const Registration &) = delete;
        Registration &operator=(const Registration &) = delete;
        Registration(Registration &&other) noexcept;
        Registration &operator=(Registration &&other) noexcept;

        void reset();

    private:
        std::weak_ptr<void> state_;
        uint64_t id_ = 0;
    };

    CancelToken();

    /**
     * @brief Create a token that is cancelled whenever @p parent is
     * @return The child token and the registration that keeps the link alive
     */
    static std::pair<CancelToken, Registration> linkedTo(const CancelToken &parent);

    /**
     * @brief Signal cancellation; runs every registered callback exactly once
     */
    void cancel() const;

    bool isCancelled() const;

    /**
     * @brief Register a callback run on cancellation
     *
     * Runs immediately on the calling thread if the token is already cancelled.
     */
    Registration onCancel(std::function<void()> callback) const;

    /**
     * @brief Sleep up to @p duration
     * @return true if the token was cancelled before the duration elapsed
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * @brief Throw UploadCanceledError if cancelled
     * @param operation Name of the operation used in the error message
     */
    void throwIfCancelled(const std::string &operation) const;

    bool operator==(const CancelToken &other) const { return state_ == other.state_; }
    bool operator<(const CancelToken &other) const { return state_ < other.state_; }

private:
    struct State;
    std::shared_ptr<State> state_;
};
