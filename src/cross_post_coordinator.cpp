#include "core/cross_post_coordinator.hpp"
#include "core/chunked_upload_client.hpp"
#include "core/single_shot_upload_client.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace
{
    OAuth1Credentials oauthFrom(const Credentials &credentials)
    {
        return OAuth1Credentials{credentials.api_key, credentials.api_secret, credentials.access_token,
                                 credentials.access_secret};
    }

    bool isBlank(const std::string &text)
    {
        return std::all_of(text.begin(), text.end(), [](unsigned char c)
                           { return std::isspace(c) != 0; });
    }
}

OutcomeKind PostOutcome::kind() const
{
    if (twitter.status != DestinationStatus::SUCCESS)
        return OutcomeKind::FAILURE;
    if (bluesky.status == DestinationStatus::FAILURE)
        return OutcomeKind::PARTIAL_SUCCESS;
    return OutcomeKind::FULL_SUCCESS;
}

std::string toString(PostResultKind kind)
{
    switch (kind)
    {
    case PostResultKind::SUCCESS:
        return "success";
    case PostResultKind::PARTIAL_SUCCESS:
        return "partial_success";
    case PostResultKind::FAILURE:
        return "failure";
    case PostResultKind::REJECTED:
        return "rejected";
    case PostResultKind::MISSING_CREDENTIALS:
        return "missing_credentials";
    case PostResultKind::SUPERSEDED:
        return "superseded";
    case PostResultKind::BUSY:
        return "busy";
    }
    return "unknown";
}

PostResult PostResult::make(PostResultKind kind, const std::string &message)
{
    PostResult result;
    result.kind = kind;
    result.message = message;
    switch (kind)
    {
    case PostResultKind::SUCCESS:
        result.title = "Success";
        break;
    case PostResultKind::PARTIAL_SUCCESS:
        result.title = "Partial Success";
        break;
    case PostResultKind::MISSING_CREDENTIALS:
        result.title = "Missing Credentials";
        break;
    case PostResultKind::SUPERSEDED:
        result.title = "Superseded";
        break;
    case PostResultKind::BUSY:
        result.title = "Busy";
        break;
    case PostResultKind::FAILURE:
    case PostResultKind::REJECTED:
        result.title = "Error";
        break;
    }
    return result;
}

PostResult PostResult::fromOutcome(const PostOutcome &outcome)
{
    PostResult result;
    switch (outcome.kind())
    {
    case OutcomeKind::FULL_SUCCESS:
        if (outcome.bluesky.status == DestinationStatus::SUCCESS)
        {
            result = make(PostResultKind::SUCCESS, "Posted to Twitter and Bluesky!");
        }
        else
        {
            result = make(PostResultKind::SUCCESS, "Posted to Twitter!" +
                                                       (outcome.bluesky.error.empty()
                                                            ? std::string()
                                                            : " (Bluesky skipped: " + outcome.bluesky.error + ")"));
        }
        break;
    case OutcomeKind::PARTIAL_SUCCESS:
        result = make(PostResultKind::PARTIAL_SUCCESS, "Posted to Twitter, but Bluesky failed: " + outcome.bluesky.error);
        break;
    case OutcomeKind::FAILURE:
        result = make(PostResultKind::FAILURE, "Failed to post to Twitter: " + outcome.twitter.error);
        break;
    }
    result.outcome = outcome;
    return result;
}

CrossPostCoordinator::CrossPostCoordinator(std::shared_ptr<HttpTransport> transport,
                                           std::shared_ptr<CredentialStore> credentials,
                                           std::shared_ptr<SizeAwareOptimizer> optimizer, CrossPostSettings settings)
    : transport_(std::move(transport)),
      credentials_(std::move(credentials)),
      optimizer_(std::move(optimizer)),
      settings_(std::move(settings)),
      actor_("crosspost-composer")
{
    state_.generation = session_.beginAttempt();
    state_.bluesky_eligibility = evaluateBlueskyEligibility(state_.text, state_.asset, settings_.bluesky_text_limit);
}

CrossPostCoordinator::~CrossPostCoordinator()
{
    shutting_down_ = true;
    cancelAll();
    waitForIdle();
    actor_.stop();

    // Idle and stopped, so nothing reads the optimizer output any more
    retireOptimizedFile();
    removeRetiredFiles();
}

size_t CrossPostCoordinator::countCodePoints(const std::string &utf8)
{
    size_t count = 0;
    for (unsigned char c : utf8)
    {
        // Continuation bytes (10xxxxxx) do not start a code point
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

BlueskyEligibility CrossPostCoordinator::evaluateBlueskyEligibility(const std::string &text,
                                                                    const std::optional<MediaAsset> &asset,
                                                                    size_t text_limit)
{
    if (asset && asset->isVideo())
    {
        return BlueskyEligibility{false, "Bluesky does not accept video from this app"};
    }
    size_t length = countCodePoints(text);
    if (length > text_limit)
    {
        return BlueskyEligibility{false, "Text is " + std::to_string(length) + " characters; Bluesky allows " +
                                             std::to_string(text_limit)};
    }
    return BlueskyEligibility{};
}

void CrossPostCoordinator::setProgressListener(ProgressListener listener)
{
    std::lock_guard<std::mutex> lock(listener_mutex_);
    progress_listener_ = std::move(listener);
}

void CrossPostCoordinator::reportProgress(Destination destination, double fraction)
{
    if (destination == Destination::TWITTER)
    {
        twitter_progress_ = fraction;
    }
    ProgressListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = progress_listener_;
    }
    if (listener)
    {
        listener(destination, fraction);
    }
}

Credentials CrossPostCoordinator::loadCredentials()
{
    if (!credentials_)
    {
        return Credentials();
    }
    return Credentials::load(*credentials_);
}

void CrossPostCoordinator::launch(std::function<void()> job)
{
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_.erase(std::remove_if(jobs_.begin(), jobs_.end(), [](std::future<void> &f)
                               { return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }),
                jobs_.end());
    jobs_.push_back(std::async(std::launch::async, std::move(job)));
}

void CrossPostCoordinator::waitForIdle()
{
    while (true)
    {
        actor_.waitForCompletion();
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            pending.swap(jobs_);
        }
        if (pending.empty())
        {
            return;
        }
        for (auto &job : pending)
        {
            job.wait();
        }
    }
}

void CrossPostCoordinator::setText(const std::string &text)
{
    actor_.enqueue([this, text]()
                   {
        state_.text = text;
        refreshEligibility(); });
}

void CrossPostCoordinator::selectMedia(const MediaAsset &asset)
{
    actor_.enqueue([this, asset]()
                   {
        // Everything still running belongs to the previous selection
        session_.cancelAll();
        uint64_t generation = session_.beginAttempt();
        supersedePendingPost("A new media selection replaced the pending post");
        retireOptimizedFile();

        state_.generation = generation;
        state_.asset = asset;
        state_.twitter_handle.reset();
        state_.bluesky_blob.reset();
        state_.optimization_warning.reset();
        state_.optimizing = true;
        state_.uploading = false;
        twitter_progress_ = 0.0;
        refreshEligibility();

        uint64_t limit = settings_.eagerLimitFor(asset, state_.blueskyActive());
        Logger::info("Media selected (generation " + std::to_string(generation) + "): " + asset.local_ref);

        launch([this, generation, asset, limit]()
               {
            OptimizationResult result{asset, 0, std::nullopt};
            if (optimizer_)
            {
                try
                {
                    result = optimizer_->optimizeDetailed(asset, limit);
                }
                catch (const std::exception &e)
                {
                    Logger::error("Optimization failed, using the original file: " + std::string(e.what()));
                }
            }
            bool transformed = result.asset.local_ref != asset.local_ref;
            actor_.enqueue([this, generation, result, transformed]()
                           {
                if (!session_.isCurrent(generation))
                {
                    Logger::debug("Dropping optimization result of stale generation " + std::to_string(generation));
                    if (transformed)
                    {
                        std::error_code ec;
                        std::filesystem::remove(result.asset.local_ref, ec);
                    }
                    return;
                }
                state_.optimizing = false;
                state_.asset = result.asset;
                if (transformed)
                    optimized_file_ = result.asset.local_ref;
                state_.optimization_warning = result.warning;
                refreshEligibility();
                startEagerUploads(generation);
                settle(); }); }); });
}

void CrossPostCoordinator::removeMedia()
{
    actor_.enqueue([this]()
                   {
        session_.cancelAll();
        uint64_t generation = session_.beginAttempt();
        supersedePendingPost("The media was removed");
        retireOptimizedFile();

        state_.generation = generation;
        state_.asset.reset();
        state_.twitter_handle.reset();
        state_.bluesky_blob.reset();
        state_.optimization_warning.reset();
        state_.optimizing = false;
        state_.uploading = false;
        twitter_progress_ = 0.0;
        refreshEligibility();
        Logger::info("Media removed"); });
}

bool CrossPostCoordinator::setBlueskyEnabled(bool enabled)
{
    std::future<bool> accepted = actor_.enqueueWithResult<bool>([this, enabled]()
                                                                {
        if (enabled && !state_.bluesky_eligibility.eligible)
        {
            Logger::info("Bluesky cannot be enabled: " + state_.bluesky_eligibility.reason);
            return false;
        }
        state_.bluesky_enabled = enabled;

        if (enabled && state_.asset && !state_.optimizing && !state_.bluesky_blob &&
            session_.attemptState(state_.generation, Destination::BLUESKY) != AttemptState::UPLOADING)
        {
            try
            {
                Credentials credentials = loadCredentials();
                if (credentials.hasBluesky() && state_.asset->byte_size <= settings_.bluesky_max_blob_bytes)
                {
                    startEagerUpload(state_.generation, Destination::BLUESKY, *state_.asset, credentials);
                }
            }
            catch (const std::exception &e)
            {
                Logger::warn("Could not start Bluesky upload: " + std::string(e.what()));
            }
        }
        return true; });
    return accepted.get();
}

ComposerSnapshot CrossPostCoordinator::snapshot()
{
    std::future<ComposerSnapshot> result = actor_.enqueueWithResult<ComposerSnapshot>([this]()
                                                                                      {
        ComposerSnapshot copy = state_;
        copy.twitter_progress = twitter_progress_;
        return copy; });
    return result.get();
}

void CrossPostCoordinator::cancelAll()
{
    // Queued ahead of the completions the cancellation below will produce
    actor_.enqueue([this]()
                   { supersedePendingPost("Canceled"); });

    session_.cancelAll();
    std::lock_guard<std::mutex> lock(post_cancel_mutex_);
    if (post_cancel_)
    {
        Logger::info("Cancelling the running post");
        post_cancel_->cancel();
    }
}

std::future<PostResult> CrossPostCoordinator::requestPost()
{
    auto promise = std::make_shared<std::promise<PostResult>>();
    std::future<PostResult> future = promise->get_future();

    bool accepted = actor_.enqueue([this, promise]()
                                   {
        if (isBlank(state_.text) && !state_.asset)
        {
            promise->set_value(PostResult::make(PostResultKind::REJECTED, "Please enter text or select media."));
            return;
        }

        Credentials credentials;
        try
        {
            credentials = loadCredentials();
        }
        catch (const std::exception &e)
        {
            Logger::error("Failed to load credentials: " + std::string(e.what()));
            promise->set_value(PostResult::make(PostResultKind::FAILURE, "Could not read credentials: " + std::string(e.what())));
            return;
        }
        if (!credentials.hasTwitter())
        {
            promise->set_value(PostResult::make(PostResultKind::MISSING_CREDENTIALS,
                                                "Please configure your Twitter API keys first."));
            return;
        }
        if (state_.posting || pending_post_)
        {
            promise->set_value(PostResult::make(PostResultKind::BUSY, "A post is already in progress."));
            return;
        }
        if (shutting_down_)
        {
            promise->set_value(PostResult::make(PostResultKind::SUPERSEDED, "Shutting down"));
            return;
        }

        if (!uploadsSettled())
        {
            Logger::info("Post queued until uploads of generation " + std::to_string(state_.generation) + " settle");
            pending_post_ = PendingPost{promise, state_.generation};
            return;
        }
        startPost(promise); });

    if (!accepted)
    {
        promise->set_value(PostResult::make(PostResultKind::SUPERSEDED, "The composer has been shut down."));
    }
    return future;
}

void CrossPostCoordinator::refreshEligibility()
{
    BlueskyEligibility previous = state_.bluesky_eligibility;
    state_.bluesky_eligibility = evaluateBlueskyEligibility(state_.text, state_.asset, settings_.bluesky_text_limit);
    if (previous.eligible && !state_.bluesky_eligibility.eligible)
    {
        Logger::info("Bluesky disabled: " + state_.bluesky_eligibility.reason);
    }
    else if (!previous.eligible && state_.bluesky_eligibility.eligible)
    {
        Logger::info("Bluesky is eligible again");
    }
}

void CrossPostCoordinator::supersedePendingPost(const std::string &reason)
{
    if (!pending_post_)
    {
        return;
    }
    Logger::info("Pending post superseded: " + reason);
    pending_post_->promise->set_value(PostResult::make(PostResultKind::SUPERSEDED, reason));
    pending_post_.reset();
}

bool CrossPostCoordinator::uploadsSettled() const
{
    return !state_.optimizing && !session_.isInFlight(state_.generation);
}

void CrossPostCoordinator::startEagerUploads(uint64_t generation)
{
    if (!state_.asset)
    {
        return;
    }

    Credentials credentials;
    try
    {
        credentials = loadCredentials();
    }
    catch (const std::exception &e)
    {
        Logger::warn("Skipping eager uploads, credentials unavailable: " + std::string(e.what()));
        return;
    }

    const MediaAsset &asset = *state_.asset;
    if (credentials.hasTwitter() && !state_.twitter_handle)
    {
        startEagerUpload(generation, Destination::TWITTER, asset, credentials);
    }
    else if (!credentials.hasTwitter())
    {
        Logger::debug("No Twitter credentials; eager Twitter upload skipped");
    }

    if (state_.blueskyActive() && credentials.hasBluesky() && !state_.bluesky_blob)
    {
        if (asset.byte_size > settings_.bluesky_max_blob_bytes)
        {
            Logger::warn("Media exceeds the Bluesky blob limit; eager Bluesky upload skipped");
        }
        else
        {
            startEagerUpload(generation, Destination::BLUESKY, asset, credentials);
        }
    }
}

void CrossPostCoordinator::startEagerUpload(uint64_t generation, Destination destination, const MediaAsset &asset,
                                            const Credentials &credentials)
{
    CancelToken token;
    if (!session_.beginUpload(generation, destination, token))
    {
        return;
    }
    state_.uploading = true;
    Logger::info("Eager " + toString(destination) + " upload started (generation " + std::to_string(generation) + ")");

    launch([this, generation, destination, asset, credentials, token]()
           {
        std::optional<UploadHandle> handle;
        AttemptState state = AttemptState::FAILED;
        try
        {
            if (destination == Destination::TWITTER)
            {
                ChunkedUploadClient client(transport_, oauthFrom(credentials), settings_.twitter);
                UploadCallbacks callbacks;
                callbacks.cancel = token;
                callbacks.onProgress = [this, generation](double fraction)
                {
                    if (session_.isCurrent(generation))
                        reportProgress(Destination::TWITTER, fraction);
                };
                handle = client.upload(asset, callbacks);
            }
            else
            {
                SingleShotUploadClient client(transport_, settings_.bluesky_pds_url);
                BlueskySession session = client.login(credentials.bluesky_handle, credentials.bluesky_password, token);
                handle = client.uploadBlob(asset, session, token);
            }
            state = AttemptState::SUCCEEDED;
        }
        catch (const UploadCanceledError &e)
        {
            Logger::debug("Eager " + toString(destination) + " upload canceled: " + e.what());
            state = AttemptState::CANCELED;
        }
        catch (const std::exception &e)
        {
            Logger::warn("Eager " + toString(destination) + " upload failed: " + std::string(e.what()));
            state = AttemptState::FAILED;
        }

        actor_.enqueue([this, generation, destination, handle, state]()
                       { onEagerUploadFinished(generation, destination, handle, state); }); });
}

void CrossPostCoordinator::onEagerUploadFinished(uint64_t generation, Destination destination,
                                                 std::optional<UploadHandle> handle, AttemptState state)
{
    session_.finishUpload(generation, destination, state);
    if (!session_.isCurrent(generation))
    {
        Logger::debug("Dropping " + toString(destination) + " upload result of stale generation " +
                      std::to_string(generation));
        return;
    }

    if (handle)
    {
        if (auto *twitter = std::get_if<TwitterMediaHandle>(&*handle))
        {
            state_.twitter_handle = *twitter;
        }
        else if (auto *blob = std::get_if<BlueskyBlob>(&*handle))
        {
            state_.bluesky_blob = *blob;
        }
    }
    state_.uploading = session_.isInFlight(generation);
    settle();
}

void CrossPostCoordinator::settle()
{
    if (!pending_post_)
    {
        return;
    }
    if (shutting_down_)
    {
        supersedePendingPost("Shutting down");
        return;
    }
    if (pending_post_->generation != session_.currentGeneration())
    {
        supersedePendingPost("A newer attempt started");
        return;
    }
    if (!uploadsSettled())
    {
        return;
    }

    auto promise = pending_post_->promise;
    pending_post_.reset();
    Logger::info("Uploads settled; starting queued post");
    startPost(promise);
}

void CrossPostCoordinator::startPost(std::shared_ptr<std::promise<PostResult>> promise)
{
    PublishRequest request;
    try
    {
        request.credentials = loadCredentials();
    }
    catch (const std::exception &e)
    {
        promise->set_value(PostResult::make(PostResultKind::FAILURE, "Could not read credentials: " + std::string(e.what())));
        return;
    }
    request.text = state_.text;
    request.asset = state_.asset;
    request.bluesky_requested = state_.bluesky_enabled;
    request.twitter_handle = state_.twitter_handle;
    request.bluesky_blob = state_.bluesky_blob;

    const uint64_t generation = state_.generation;
    state_.posting = true;

    CancelToken token;
    {
        std::lock_guard<std::mutex> lock(post_cancel_mutex_);
        post_cancel_ = token;
    }

    launch([this, generation, promise, request, token]()
           {
        std::optional<PostOutcome> outcome;
        std::optional<PostResult> error_result;
        try
        {
            outcome = publish(request, token);
        }
        catch (const ValidationError &e)
        {
            error_result = PostResult::make(PostResultKind::REJECTED, e.what());
        }
        catch (const CredentialError &e)
        {
            error_result = PostResult::make(PostResultKind::MISSING_CREDENTIALS, e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error("Publish failed: " + std::string(e.what()));
            error_result = PostResult::make(PostResultKind::FAILURE, e.what());
        }
        actor_.enqueue([this, generation, promise, outcome, error_result]()
                       { onPostFinished(generation, promise, outcome, error_result); }); });
}

void CrossPostCoordinator::onPostFinished(uint64_t generation, std::shared_ptr<std::promise<PostResult>> promise,
                                          std::optional<PostOutcome> outcome, std::optional<PostResult> error_result)
{
    {
        std::lock_guard<std::mutex> lock(post_cancel_mutex_);
        post_cancel_.reset();
    }
    state_.posting = false;
    removeRetiredFiles();

    if (error_result)
    {
        promise->set_value(*error_result);
        return;
    }

    PostResult result = PostResult::fromOutcome(*outcome);
    if (!session_.isCurrent(generation))
    {
        // The composer moved on; report what happened without touching its state
        if (outcome->kind() == OutcomeKind::FAILURE)
        {
            result = PostResult::make(PostResultKind::SUPERSEDED, "A newer attempt replaced this post.");
            result.outcome = outcome;
        }
        promise->set_value(result);
        return;
    }

    if (outcome->kind() == OutcomeKind::FAILURE)
    {
        // Keep the composer for a retry; reuse whatever was uploaded
        if (outcome->twitter_handle)
            state_.twitter_handle = outcome->twitter_handle;
        if (outcome->bluesky_blob)
            state_.bluesky_blob = outcome->bluesky_blob;
    }
    else
    {
        resetComposer();
    }
    promise->set_value(result);
}

void CrossPostCoordinator::resetComposer()
{
    uint64_t generation = session_.beginAttempt();
    retireOptimizedFile();
    state_.generation = generation;
    state_.text.clear();
    state_.asset.reset();
    state_.twitter_handle.reset();
    state_.bluesky_blob.reset();
    state_.optimization_warning.reset();
    state_.optimizing = false;
    state_.uploading = false;
    twitter_progress_ = 0.0;
    refreshEligibility();
}

void CrossPostCoordinator::retireOptimizedFile()
{
    if (optimized_file_.empty())
        return;
    retired_files_.push_back(optimized_file_);
    optimized_file_.clear();
    if (!state_.posting)
        removeRetiredFiles();
}

void CrossPostCoordinator::removeRetiredFiles()
{
    for (const auto &path : retired_files_)
    {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec) && ec)
            Logger::warn("Could not remove optimized file " + path + ": " + ec.message());
    }
    retired_files_.clear();
}

PostOutcome CrossPostCoordinator::publish(const PublishRequest &request, const CancelToken &cancel)
{
    if (isBlank(request.text) && !request.asset)
    {
        throw ValidationError("Nothing to post: text and media are both empty");
    }
    if (!request.credentials.hasTwitter())
    {
        throw CredentialError("Twitter credentials are incomplete");
    }

    PostOutcome outcome;
    const Credentials &credentials = request.credentials;

    // Twitter first; any failure here ends the publish
    try
    {
        ChunkedUploadClient twitter(transport_, oauthFrom(credentials), settings_.twitter);
        std::vector<std::string> media_ids;
        if (request.asset)
        {
            if (request.twitter_handle)
            {
                Logger::info("Reusing Twitter media " + request.twitter_handle->media_id);
                outcome.twitter_handle = request.twitter_handle;
            }
            else
            {
                UploadCallbacks callbacks;
                callbacks.cancel = cancel;
                callbacks.onProgress = [this](double fraction)
                { reportProgress(Destination::TWITTER, fraction); };
                outcome.twitter_handle = twitter.upload(*request.asset, callbacks);
            }
            media_ids.push_back(outcome.twitter_handle->media_id);
        }
        outcome.twitter.post_id = twitter.postTweet(request.text, media_ids, cancel);
        outcome.twitter.status = DestinationStatus::SUCCESS;
    }
    catch (const std::exception &e)
    {
        Logger::error("Twitter publish failed: " + std::string(e.what()));
        outcome.twitter.status = DestinationStatus::FAILURE;
        outcome.twitter.error = e.what();
        outcome.bluesky.status = DestinationStatus::SKIPPED;
        outcome.bluesky.error = "Twitter post failed";
        return outcome;
    }

    BlueskyEligibility eligibility =
        evaluateBlueskyEligibility(request.text, request.asset, settings_.bluesky_text_limit);
    if (!request.bluesky_requested)
    {
        outcome.bluesky.error = "Bluesky is turned off";
    }
    else if (!eligibility.eligible)
    {
        outcome.bluesky.error = eligibility.reason;
    }
    else if (!credentials.hasBluesky())
    {
        outcome.bluesky.error = "Bluesky credentials are not configured";
    }
    else
    {
        try
        {
            SingleShotUploadClient bluesky(transport_, settings_.bluesky_pds_url);
            BlueskySession session = bluesky.login(credentials.bluesky_handle, credentials.bluesky_password, cancel);

            std::optional<BlueskyBlob> blob;
            if (request.asset)
            {
                if (request.bluesky_blob)
                {
                    blob = request.bluesky_blob;
                }
                else
                {
                    if (request.asset->byte_size > settings_.bluesky_max_blob_bytes)
                    {
                        throw ValidationError("Media is larger than Bluesky's " +
                                              std::to_string(settings_.bluesky_max_blob_bytes) + " byte limit");
                    }
                    blob = bluesky.uploadBlob(*request.asset, session, cancel);
                }
                outcome.bluesky_blob = blob;
            }
            outcome.bluesky.post_id = bluesky.post(request.text, blob, session, cancel);
            outcome.bluesky.status = DestinationStatus::SUCCESS;
        }
        catch (const std::exception &e)
        {
            Logger::warn("Bluesky publish failed after tweet " + outcome.twitter.post_id + ": " + e.what());
            outcome.bluesky.status = DestinationStatus::FAILURE;
            outcome.bluesky.error = e.what();
        }
    }

    if (outcome.bluesky.status == DestinationStatus::SKIPPED)
    {
        Logger::info("Bluesky skipped: " + outcome.bluesky.error);
    }
    return outcome;
}
