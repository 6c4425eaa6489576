#include "core/single_shot_upload_client.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <jwt-cpp/jwt.h>

SingleShotUploadClient::SingleShotUploadClient(std::shared_ptr<HttpTransport> transport, std::string pds_url)
    : transport_(std::move(transport)), pds_url_(std::move(pds_url))
{
    while (!pds_url_.empty() && pds_url_.back() == '/')
    {
        pds_url_.pop_back();
    }
}

std::string SingleShotUploadClient::xrpcUrl(const std::string &method) const
{
    return pds_url_ + "/xrpc/" + method;
}

BlueskySession SingleShotUploadClient::login(const std::string &identifier, const std::string &password,
                                             const CancelToken &cancel)
{
    nlohmann::json body = sendJson("com.atproto.server.createSession",
                                   {{"identifier", identifier}, {"password", password}}, "", cancel);

    BlueskySession session;
    for (const char *field : {"did", "accessJwt"})
    {
        if (!body.contains(field) || !body[field].is_string())
        {
            throw ProtocolError(std::string("createSession response is missing ") + field);
        }
    }
    session.did = body["did"].get<std::string>();
    session.handle = body.value("handle", identifier);
    session.access_jwt = body["accessJwt"].get<std::string>();
    session.refresh_jwt = body.value("refreshJwt", "");

    try
    {
        auto decoded = jwt::decode(session.access_jwt);
        if (decoded.has_expires_at())
        {
            session.access_expires_at = decoded.get_expires_at();
        }
    }
    catch (const std::exception &e)
    {
        Logger::debug("Bluesky access token is not a decodable JWT: " + std::string(e.what()));
    }

    std::string expiry;
    if (session.access_expires_at)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::seconds>(*session.access_expires_at -
                                                                          std::chrono::system_clock::now());
        expiry = ", token valid for " + std::to_string(remaining.count()) + "s";
    }
    Logger::info("Bluesky session created for " + session.handle + " (" + session.did + ")" + expiry);
    return session;
}

BlueskyBlob SingleShotUploadClient::uploadBlob(const MediaAsset &asset, const BlueskySession &session,
                                               const CancelToken &cancel)
{
    cancel.throwIfCancelled("bluesky uploadBlob");

    std::ifstream file(asset.local_ref, std::ios::binary);
    if (!file.is_open())
    {
        throw TransportError("Cannot open media file: " + asset.local_ref);
    }

    HttpRequest request;
    request.method = "POST";
    request.url = xrpcUrl("com.atproto.repo.uploadBlob");
    request.content_type = asset.mime_type;
    request.body.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    request.headers.emplace_back("Authorization", "Bearer " + session.access_jwt);

    Logger::info("Bluesky blob upload starting: " + asset.local_ref + " (" + std::to_string(request.body.size()) +
                 " bytes)");
    HttpResponse response = transport_->send(request, cancel);
    nlohmann::json body = parseBody(response, "uploadBlob");
    if (!body.contains("blob"))
    {
        throw ProtocolError("uploadBlob response is missing blob", response.status);
    }

    BlueskyBlob blob = BlueskyBlob::fromJson(body["blob"]);
    if (blob.mime_type.empty())
        blob.mime_type = asset.mime_type;
    if (blob.size == 0)
        blob.size = request.body.size();
    Logger::info("Bluesky blob uploaded: " + blob.link);
    return blob;
}

std::string SingleShotUploadClient::post(const std::string &text, const std::optional<BlueskyBlob> &blob,
                                         const BlueskySession &session, const CancelToken &cancel)
{
    nlohmann::json payload = {
        {"repo", session.did},
        {"collection", "app.bsky.feed.post"},
        {"record", buildPostRecord(text, blob, isoTimestampNow())}};

    nlohmann::json body = sendJson("com.atproto.repo.createRecord", payload, session.access_jwt, cancel);
    if (!body.contains("uri") || !body["uri"].is_string())
    {
        throw ProtocolError("createRecord response is missing uri");
    }
    std::string uri = body["uri"].get<std::string>();
    Logger::info("Bluesky post created: " + uri);
    return uri;
}

nlohmann::json SingleShotUploadClient::buildPostRecord(const std::string &text, const std::optional<BlueskyBlob> &blob,
                                                       const std::string &created_at)
{
    nlohmann::json record = {
        {"$type", "app.bsky.feed.post"},
        {"text", text},
        {"createdAt", created_at}};

    if (blob)
    {
        if (blob->mime_type.rfind("video/", 0) == 0)
        {
            record["embed"] = {
                {"$type", "app.bsky.embed.video"},
                {"video", blob->toJson()}};
        }
        else
        {
            nlohmann::json image = {{"alt", ""}, {"image", blob->toJson()}};
            nlohmann::json images = nlohmann::json::array();
            images.push_back(image);
            record["embed"] = {
                {"$type", "app.bsky.embed.images"},
                {"images", images}};
        }
    }
    return record;
}

std::string SingleShotUploadClient::isoTimestampNow()
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

nlohmann::json SingleShotUploadClient::sendJson(const std::string &method, const nlohmann::json &payload,
                                                const std::string &bearer, const CancelToken &cancel)
{
    HttpRequest request;
    request.method = "POST";
    request.url = xrpcUrl(method);
    request.content_type = "application/json";
    request.body = payload.dump();
    if (!bearer.empty())
    {
        request.headers.emplace_back("Authorization", "Bearer " + bearer);
    }
    HttpResponse response = transport_->send(request, cancel);
    return parseBody(response, method);
}

nlohmann::json SingleShotUploadClient::parseBody(const HttpResponse &response, const std::string &operation)
{
    nlohmann::json body;
    try
    {
        body = response.body.empty() ? nlohmann::json::object() : nlohmann::json::parse(response.body);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ProtocolError(operation + " returned invalid JSON (HTTP " + std::to_string(response.status) +
                                "): " + e.what(),
                            response.status);
    }

    if (!response.isSuccess())
    {
        std::string message = operation + " failed with HTTP " + std::to_string(response.status);
        if (body.is_object() && body.contains("message") && body["message"].is_string())
        {
            message += ": " + body["message"].get<std::string>();
        }
        throw ProtocolError(message, response.status);
    }
    if (!body.is_object())
    {
        throw ProtocolError(operation + " response is not a JSON object", response.status);
    }
    return body;
}
