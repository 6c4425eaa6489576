#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cancel_token.hpp"
#include "core/media_asset.hpp"
#include "net/http_transport.hpp"

/**
 * @brief Result of com.atproto.server.createSession
 */
struct BlueskySession
{
    std::string did;
    std::string handle;
    std::string access_jwt;
    std::string refresh_jwt;
    std::optional<std::chrono::system_clock::time_point> access_expires_at;
};

/**
 * @brief Bluesky client: createSession, uploadBlob, createRecord
 *
 * Calls are independent and never retried internally.
 */
class SingleShotUploadClient
{
public:
    explicit SingleShotUploadClient(std::shared_ptr<HttpTransport> transport,
                                    std::string pds_url = "https://bsky.social");

    BlueskySession login(const std::string &identifier, const std::string &password,
                         const CancelToken &cancel = CancelToken());

    BlueskyBlob uploadBlob(const MediaAsset &asset, const BlueskySession &session,
                           const CancelToken &cancel = CancelToken());

    /**
     * @brief Create an app.bsky.feed.post record
     * @param blob Optional attachment; embedded as images or video depending on its mime type
     * @return at:// URI of the new record
     */
    std::string post(const std::string &text, const std::optional<BlueskyBlob> &blob,
                     const BlueskySession &session, const CancelToken &cancel = CancelToken());

    /**
     * @brief The record sent by post(); exposed for inspection
     */
    static nlohmann::json buildPostRecord(const std::string &text, const std::optional<BlueskyBlob> &blob,
                                          const std::string &created_at);

    /**
     * @brief Current UTC time as ISO-8601 with milliseconds, e.g. 2024-01-02T03:04:05.678Z
     */
    static std::string isoTimestampNow();

private:
    std::string xrpcUrl(const std::string &method) const;
    nlohmann::json sendJson(const std::string &method, const nlohmann::json &payload,
                            const std::string &bearer, const CancelToken &cancel);
    static nlohmann::json parseBody(const HttpResponse &response, const std::string &operation);

    std::shared_ptr<HttpTransport> transport_;
    std::string pds_url_;
};
