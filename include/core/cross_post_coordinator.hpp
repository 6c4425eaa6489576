#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cancel_token.hpp"
#include "core/credential_store.hpp"
#include "core/cross_post_settings.hpp"
#include "core/media_asset.hpp"
#include "core/serial_task_queue.hpp"
#include "core/size_aware_optimizer.hpp"
#include "core/upload_session_coordinator.hpp"
#include "net/http_transport.hpp"

enum class DestinationStatus
{
    SUCCESS,
    FAILURE,
    SKIPPED
};

struct DestinationOutcome
{
    DestinationStatus status = DestinationStatus::SKIPPED;
    std::string post_id; // tweet id or record uri
    std::string error;   // FAILURE detail or SKIPPED reason
};

enum class OutcomeKind
{
    FULL_SUCCESS,
    PARTIAL_SUCCESS,
    FAILURE
};

struct PostOutcome
{
    DestinationOutcome twitter;
    DestinationOutcome bluesky;
    std::optional<TwitterMediaHandle> twitter_handle; // Handles obtained or reused
    std::optional<BlueskyBlob> bluesky_blob;

    OutcomeKind kind() const;
};

enum class PostResultKind
{
    SUCCESS,
    PARTIAL_SUCCESS,
    FAILURE,
    REJECTED,
    MISSING_CREDENTIALS,
    SUPERSEDED,
    BUSY
};

std::string toString(PostResultKind kind);

/**
 * @brief What the user is shown after asking to post
 */
struct PostResult
{
    PostResultKind kind = PostResultKind::FAILURE;
    std::string title;
    std::string message;
    std::optional<PostOutcome> outcome;

    static PostResult fromOutcome(const PostOutcome &outcome);
    static PostResult make(PostResultKind kind, const std::string &message);
};

struct BlueskyEligibility
{
    bool eligible = true;
    std::string reason; // Empty when eligible
};

/**
 * @brief Inputs of one publish, captured at the moment the post starts
 */
struct PublishRequest
{
    std::string text;
    std::optional<MediaAsset> asset;
    bool bluesky_requested = true;
    Credentials credentials;
    std::optional<TwitterMediaHandle> twitter_handle; // Reused instead of uploading when set
    std::optional<BlueskyBlob> bluesky_blob;
};

/**
 * @brief Read-only view of the composer for front ends
 */
struct ComposerSnapshot
{
    std::string text;
    std::optional<MediaAsset> asset;
    uint64_t generation = 0;
    bool bluesky_enabled = true;
    BlueskyEligibility bluesky_eligibility;
    bool optimizing = false;
    bool uploading = false;
    bool posting = false;
    double twitter_progress = 0.0;
    std::optional<TwitterMediaHandle> twitter_handle;
    std::optional<BlueskyBlob> bluesky_blob;
    std::optional<std::string> optimization_warning;

    bool blueskyActive() const { return bluesky_enabled && bluesky_eligibility.eligible; }
};

/**
 * @brief Composition session: eager uploads, post requests and the dual-destination publish
 *
 * Every intent is posted to a private SerialTaskQueue; optimization, uploads
 * and posts run as background jobs that report back through the same queue.
 * Results carrying a generation older than the current one are dropped.
 * Intents must not be called from the coordinator's own callbacks.
 */
class CrossPostCoordinator
{
public:
    using ProgressListener = std::function<void(Destination, double)>;

    CrossPostCoordinator(std::shared_ptr<HttpTransport> transport, std::shared_ptr<CredentialStore> credentials,
                         std::shared_ptr<SizeAwareOptimizer> optimizer, CrossPostSettings settings);
    ~CrossPostCoordinator();

    CrossPostCoordinator(const CrossPostCoordinator &) = delete;
    CrossPostCoordinator &operator=(const CrossPostCoordinator &) = delete;

    // User intents
    void setText(const std::string &text);
    void selectMedia(const MediaAsset &asset);
    void removeMedia();

    /**
     * @brief Toggle Bluesky
     * @return false if enabling was refused because Bluesky is ineligible
     */
    bool setBlueskyEnabled(bool enabled);

    std::future<PostResult> requestPost();

    /**
     * @brief Stop every in-flight upload and post; pending requests resolve Superseded
     */
    void cancelAll();

    ComposerSnapshot snapshot();

    /**
     * @brief Block until no intent or background job is outstanding
     */
    void waitForIdle();

    void setProgressListener(ProgressListener listener);

    /**
     * @brief Run the whole publish on the calling thread
     *
     * Twitter is required and goes first; Bluesky is attempted only after a
     * successful tweet and only when eligible and configured.
     * @throws ValidationError for empty content, CredentialError for missing Twitter keys
     */
    PostOutcome publish(const PublishRequest &request, const CancelToken &cancel);

    /**
     * @brief Video assets and texts over the limit (in code points) are not eligible
     */
    static BlueskyEligibility evaluateBlueskyEligibility(const std::string &text, const std::optional<MediaAsset> &asset,
                                                         size_t text_limit = 300);

    static size_t countCodePoints(const std::string &utf8);

    UploadSessionCoordinator &session() { return session_; }

private:
    struct PendingPost
    {
        std::shared_ptr<std::promise<PostResult>> promise;
        uint64_t generation = 0;
    };

    // Actor-only helpers
    void refreshEligibility();
    void supersedePendingPost(const std::string &reason);
    void startEagerUploads(uint64_t generation);
    void startEagerUpload(uint64_t generation, Destination destination, const MediaAsset &asset,
                          const Credentials &credentials);
    void onEagerUploadFinished(uint64_t generation, Destination destination, std::optional<UploadHandle> handle,
                               AttemptState state);
    void settle();
    void startPost(std::shared_ptr<std::promise<PostResult>> promise);
    void onPostFinished(uint64_t generation, std::shared_ptr<std::promise<PostResult>> promise,
                        std::optional<PostOutcome> outcome, std::optional<PostResult> error_result);
    void resetComposer();
    bool uploadsSettled() const;
    void retireOptimizedFile();
    void removeRetiredFiles();

    void launch(std::function<void()> job);
    void reportProgress(Destination destination, double fraction);
    Credentials loadCredentials();

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<CredentialStore> credentials_;
    std::shared_ptr<SizeAwareOptimizer> optimizer_;
    CrossPostSettings settings_;

    UploadSessionCoordinator session_;

    // Composer state; touched only on actor_
    ComposerSnapshot state_;
    std::optional<PendingPost> pending_post_;

    // Optimizer output backing state_.asset; the user's own file is never listed here
    std::string optimized_file_;
    // Retired while a post may still be reading them
    std::vector<std::string> retired_files_;

    std::atomic<double> twitter_progress_{0.0};
    std::atomic<bool> shutting_down_{false};

    std::mutex post_cancel_mutex_;
    std::optional<CancelToken> post_cancel_;

    std::mutex listener_mutex_;
    ProgressListener progress_listener_;

    std::mutex jobs_mutex_;
    std::vector<std::future<void>> jobs_;

    // Declared last so it is destroyed first
    SerialTaskQueue actor_;
};
