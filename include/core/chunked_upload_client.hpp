#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cancel_token.hpp"
#include "core/media_asset.hpp"
#include "net/http_transport.hpp"
#include "net/oauth1_signer.hpp"

struct ChunkSpan
{
    int index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
};

/**
 * @brief Split [0, total) into consecutive spans of at most chunk_size bytes
 */
class ChunkPlan
{
public:
    static std::vector<ChunkSpan> partition(uint64_t total_bytes, uint64_t chunk_size);
};

struct UploadCallbacks
{
    CancelToken cancel;
    std::function<void(double)> onProgress; // fraction in [0, 1]
};

struct ChunkedUploadOptions
{
    std::string upload_url = "https://upload.twitter.com/1.1/media/upload.json";
    std::string post_url = "https://api.twitter.com/2/tweets";
    uint64_t small_chunk_bytes = 1024 * 1024;
    uint64_t large_chunk_bytes = 4ULL * 1024 * 1024;
    uint64_t large_video_threshold_bytes = 64ULL * 1024 * 1024;
    std::chrono::milliseconds status_min_interval{1000};
    int status_max_polls = 120;
};

/**
 * @brief Twitter chunked media upload (INIT, APPEND, FINALIZE, STATUS) plus the v2 post call
 */
class ChunkedUploadClient
{
public:
    using Options = ChunkedUploadOptions;

    ChunkedUploadClient(std::shared_ptr<HttpTransport> transport, OAuth1Credentials credentials);
    ChunkedUploadClient(std::shared_ptr<HttpTransport> transport, OAuth1Credentials credentials,
                        Options options);

    /**
     * @brief Upload the asset and wait until the server reports it usable
     * @throws TransportError, ProtocolError, UploadCanceledError
     */
    TwitterMediaHandle upload(const MediaAsset &asset, const UploadCallbacks &callbacks);

    /**
     * @brief Create a tweet with the given text and media
     * @return The id of the created tweet
     */
    std::string postTweet(const std::string &text, const std::vector<std::string> &media_ids,
                          const CancelToken &cancel = CancelToken());

    uint64_t chunkSizeFor(const MediaAsset &asset) const;

    static int concurrencyFor(uint64_t total_bytes);
    static std::string mediaCategoryFor(const MediaAsset &asset);

private:
    std::string init(const MediaAsset &asset, const CancelToken &cancel);
    void append(const std::string &media_id, const ChunkSpan &span, const std::string &data,
                const CancelToken &cancel);
    std::optional<nlohmann::json> finalize(const std::string &media_id, const CancelToken &cancel);
    void pollStatus(const std::string &media_id, nlohmann::json processing_info, const CancelToken &cancel);

    HttpResponse sendForm(const QueryParams &params, const CancelToken &cancel);
    nlohmann::json parseBody(const HttpResponse &response, const std::string &operation) const;

    std::shared_ptr<HttpTransport> transport_;
    OAuth1Signer signer_;
    Options options_;
};
