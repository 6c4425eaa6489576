#include "core/cancel_token.hpp"
#include "core/upload_errors.hpp"
#include <thread>

struct CancelToken::State
{
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t running_id = 0; // Callback currently executing in cancel()
    std::thread::id running_thread;

    /**
     * @brief Unregister a callback; waits for it to finish if cancel() is running it
     *
     * Once this returns the callback will not run again and is not running,
     * unless it is the caller itself.
     */
    void remove(uint64_t id)
    {
        std::unique_lock<std::mutex> lock(mutex);
        callbacks.erase(id);
        cv.wait(lock, [this, id]()
                { return running_id != id || running_thread == std::this_thread::get_id(); });
    }
};

CancelToken::Registration::Registration(std::weak_ptr<void> state, uint64_t id)
    : state_(std::move(state)), id_(id)
{
}

CancelToken::Registration::~Registration()
{
    reset();
}

CancelToken::Registration::Registration(Registration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_)
{
    other.id_ = 0;
}

CancelToken::Registration &CancelToken::Registration::operator=(Registration &&other) noexcept
{
    if (this != &other)
    {
        reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancelToken::Registration::reset()
{
    if (id_ == 0)
    {
        return;
    }
    if (auto locked = state_.lock())
    {
        std::static_pointer_cast<State>(locked)->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

CancelToken::CancelToken() : state_(std::make_shared<State>())
{
}

std::pair<CancelToken, CancelToken::Registration> CancelToken::linkedTo(const CancelToken &parent)
{
    CancelToken child;
    std::weak_ptr<State> weak_child = child.state_;
    auto registration = parent.onCancel([weak_child]()
                                        {
        if (auto state = weak_child.lock())
        {
            CancelToken token;
            token.state_ = state;
            token.cancel();
        } });
    return {child, std::move(registration)};
}

void CancelToken::cancel() const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled)
        {
            return;
        }
        state_->cancelled = true;
    }
    state_->cv.notify_all();

    // Callbacks run one at a time outside the lock so they may touch the token again.
    // Each stays visible as running_id until it returns, so Registration::reset can wait for it.
    for (;;)
    {
        std::function<void()> callback;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->callbacks.empty())
            {
                break;
            }
            auto it = state_->callbacks.begin();
            state_->running_id = it->first;
            state_->running_thread = std::this_thread::get_id();
            callback = std::move(it->second);
            state_->callbacks.erase(it);
        }

        callback();

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->running_id = 0;
            state_->running_thread = std::thread::id();
        }
        state_->cv.notify_all();
    }
}

bool CancelToken::isCancelled() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancelToken::Registration CancelToken::onCancel(std::function<void()> callback) const
{
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled)
        {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return Registration(state_, id);
        }
    }
    callback();
    return Registration();
}

bool CancelToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this]()
                               { return state_->cancelled; });
}

void CancelToken::throwIfCancelled(const std::string &operation) const
{
    if (isCancelled())
    {
        throw UploadCanceledError(operation);
    }
}
