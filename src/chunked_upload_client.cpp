#include "core/chunked_upload_client.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <exception>
#include <chrono>
#include <fstream>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

std::vector<ChunkSpan> ChunkPlan::partition(uint64_t total_bytes, uint64_t chunk_size)
{
    if (chunk_size == 0)
    {
        throw std::invalid_argument("chunk_size must be positive");
    }
    std::vector<ChunkSpan> spans;
    int index = 0;
    for (uint64_t offset = 0; offset < total_bytes; offset += chunk_size)
    {
        ChunkSpan span;
        span.index = index++;
        span.offset = offset;
        span.length = std::min(chunk_size, total_bytes - offset);
        spans.push_back(span);
    }
    return spans;
}

ChunkedUploadClient::ChunkedUploadClient(std::shared_ptr<HttpTransport> transport, OAuth1Credentials credentials)
    : ChunkedUploadClient(std::move(transport), std::move(credentials), Options())
{
}

ChunkedUploadClient::ChunkedUploadClient(std::shared_ptr<HttpTransport> transport, OAuth1Credentials credentials,
                                         Options options)
    : transport_(std::move(transport)), signer_(std::move(credentials)), options_(std::move(options))
{
}

uint64_t ChunkedUploadClient::chunkSizeFor(const MediaAsset &asset) const
{
    if (asset.isVideo() && asset.byte_size >= options_.large_video_threshold_bytes)
        return options_.large_chunk_bytes;
    return options_.small_chunk_bytes;
}

int ChunkedUploadClient::concurrencyFor(uint64_t total_bytes)
{
    if (total_bytes < 8ULL * 1024 * 1024)
        return 2;
    if (total_bytes < 64ULL * 1024 * 1024)
        return 3;
    return 4;
}

std::string ChunkedUploadClient::mediaCategoryFor(const MediaAsset &asset)
{
    if (asset.isVideo())
        return "tweet_video";
    if (asset.isGif())
        return "tweet_gif";
    return "tweet_image";
}

TwitterMediaHandle ChunkedUploadClient::upload(const MediaAsset &asset, const UploadCallbacks &callbacks)
{
    const CancelToken &cancel = callbacks.cancel;
    cancel.throwIfCancelled("twitter upload");

    std::ifstream file(asset.local_ref, std::ios::binary);
    if (!file.is_open())
    {
        throw TransportError("Cannot open media file: " + asset.local_ref);
    }

    Logger::info("Twitter upload starting: " + asset.local_ref + " (" + std::to_string(asset.byte_size) +
                 " bytes, " + asset.mime_type + ")");

    std::string media_id = init(asset, cancel);

    const uint64_t chunk_size = chunkSizeFor(asset);
    const std::vector<ChunkSpan> spans = ChunkPlan::partition(asset.byte_size, chunk_size);
    const int concurrency = concurrencyFor(asset.byte_size);

    // First failing chunk cancels its siblings through this token
    auto abort_link = CancelToken::linkedTo(cancel);
    const CancelToken abort_token = abort_link.first;

    std::mutex progress_mutex;
    uint64_t appended_bytes = 0;
    auto report = [&](uint64_t bytes)
    {
        std::lock_guard<std::mutex> lock(progress_mutex);
        appended_bytes += bytes;
        if (callbacks.onProgress && asset.byte_size > 0)
        {
            double fraction = static_cast<double>(appended_bytes) / static_cast<double>(asset.byte_size);
            callbacks.onProgress(std::min(fraction, 0.99));
        }
    };

    // APPENDs block on the network, so the pool must not be capped by the core count.
    // Every upload asks for the same floor because concurrent global_control limits combine by minimum.
    const int parallelism = std::max(concurrencyFor(std::numeric_limits<uint64_t>::max()),
                                     tbb::this_task_arena::max_concurrency());
    tbb::global_control pool_size(tbb::global_control::max_allowed_parallelism, static_cast<size_t>(parallelism));
    tbb::task_arena arena(concurrency, 1);

    std::mutex error_mutex;
    std::exception_ptr failure; // First real chunk failure
    bool aborted = false;

    for (size_t batch_start = 0; batch_start < spans.size(); batch_start += static_cast<size_t>(concurrency))
    {
        const size_t batch_end = std::min(spans.size(), batch_start + static_cast<size_t>(concurrency));

        // Chunks of a batch are read up front; the file stream is not shared across tasks
        std::vector<std::string> payloads(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i)
        {
            std::string &buffer = payloads[i - batch_start];
            buffer.resize(static_cast<size_t>(spans[i].length));
            file.seekg(static_cast<std::streamoff>(spans[i].offset));
            if (!file.read(&buffer[0], static_cast<std::streamsize>(spans[i].length)))
            {
                throw TransportError("Short read on " + asset.local_ref + " at offset " +
                                     std::to_string(spans[i].offset));
            }
        }

        arena.execute([&]()
                      { tbb::parallel_for(tbb::blocked_range<size_t>(batch_start, batch_end, 1),
                                          [&](const tbb::blocked_range<size_t> &range)
                                          {
                                              for (size_t i = range.begin(); i != range.end(); ++i)
                                              {
                                                  try
                                                  {
                                                      append(media_id, spans[i], payloads[i - batch_start], abort_token);
                                                      report(spans[i].length);
                                                  }
                                                  catch (const UploadCanceledError &)
                                                  {
                                                      std::lock_guard<std::mutex> lock(error_mutex);
                                                      aborted = true;
                                                  }
                                                  catch (const std::exception &)
                                                  {
                                                      {
                                                          std::lock_guard<std::mutex> lock(error_mutex);
                                                          if (!failure)
                                                              failure = std::current_exception();
                                                      }
                                                      abort_token.cancel();
                                                  }
                                              }
                                          }); });

        // Siblings stopped by abort_token report the failure that stopped them
        if (failure)
        {
            std::rethrow_exception(failure);
        }
        if (aborted)
        {
            cancel.throwIfCancelled("twitter upload");
            throw UploadCanceledError("twitter upload");
        }
    }

    abort_link.second.reset();
    cancel.throwIfCancelled("twitter upload");

    std::optional<nlohmann::json> processing_info = finalize(media_id, cancel);
    if (processing_info)
    {
        pollStatus(media_id, *processing_info, cancel);
    }

    if (callbacks.onProgress)
    {
        callbacks.onProgress(1.0);
    }
    Logger::info("Twitter upload complete: media_id=" + media_id + " in " + std::to_string(spans.size()) + " chunk(s)");
    return TwitterMediaHandle{media_id};
}

std::string ChunkedUploadClient::init(const MediaAsset &asset, const CancelToken &cancel)
{
    QueryParams params = {
        {"command", "INIT"},
        {"total_bytes", std::to_string(asset.byte_size)},
        {"media_type", asset.mime_type},
        {"media_category", mediaCategoryFor(asset)}};

    HttpResponse response = sendForm(params, cancel);
    nlohmann::json body = parseBody(response, "INIT");
    if (!body.contains("media_id_string") || !body["media_id_string"].is_string())
    {
        throw ProtocolError("INIT response is missing media_id_string", response.status);
    }
    std::string media_id = body["media_id_string"].get<std::string>();
    Logger::debug("INIT ok: media_id=" + media_id);
    return media_id;
}

void ChunkedUploadClient::append(const std::string &media_id, const ChunkSpan &span, const std::string &data,
                                 const CancelToken &cancel)
{
    QueryParams params = {
        {"command", "APPEND"},
        {"media_id", media_id},
        {"segment_index", std::to_string(span.index)},
        {"media_data", base64Encode(data)}};

    HttpResponse response = sendForm(params, cancel);
    if (!response.isSuccess())
    {
        throw ProtocolError("APPEND segment " + std::to_string(span.index) + " failed with HTTP " +
                                std::to_string(response.status),
                            response.status);
    }
    Logger::trace("APPEND ok: segment " + std::to_string(span.index) + " (" + std::to_string(span.length) + " bytes)");
}

std::optional<nlohmann::json> ChunkedUploadClient::finalize(const std::string &media_id, const CancelToken &cancel)
{
    QueryParams params = {{"command", "FINALIZE"}, {"media_id", media_id}};
    HttpResponse response = sendForm(params, cancel);
    nlohmann::json body = parseBody(response, "FINALIZE");

    if (body.contains("processing_info") && body["processing_info"].is_object())
    {
        std::string state = body["processing_info"].value("state", "");
        if (state != "succeeded")
        {
            Logger::debug("FINALIZE reports processing state '" + state + "' for media_id=" + media_id);
            return body["processing_info"];
        }
    }
    return std::nullopt;
}

void ChunkedUploadClient::pollStatus(const std::string &media_id, nlohmann::json processing_info,
                                     const CancelToken &cancel)
{
    for (int poll = 0; poll < options_.status_max_polls; ++poll)
    {
        std::string state = processing_info.value("state", "");
        if (state == "succeeded")
        {
            return;
        }
        if (state == "failed")
        {
            std::string message = "Media processing failed";
            if (processing_info.contains("error") && processing_info["error"].is_object())
            {
                message += ": " + processing_info["error"].value("message", processing_info["error"].value("name", ""));
            }
            throw ProtocolError(message);
        }

        int64_t check_after_secs = processing_info.value("check_after_secs", static_cast<int64_t>(1));
        std::chrono::milliseconds delay = std::max(options_.status_min_interval,
                                                   std::chrono::milliseconds(check_after_secs * 1000));
        if (cancel.waitFor(delay))
        {
            throw UploadCanceledError("twitter STATUS");
        }

        QueryParams query = {{"command", "STATUS"}, {"media_id", media_id}};
        HttpRequest request;
        request.method = "GET";
        request.url = options_.upload_url + "?" + formEncode(query);
        request.headers.emplace_back("Authorization", signer_.authorizationHeader("GET", request.url));

        HttpResponse response = transport_->send(request, cancel);
        nlohmann::json body = parseBody(response, "STATUS");
        if (!body.contains("processing_info") || !body["processing_info"].is_object())
        {
            // No processing_info means there is nothing left to wait for
            return;
        }
        processing_info = body["processing_info"];
        Logger::debug("STATUS poll " + std::to_string(poll + 1) + ": state=" + processing_info.value("state", "") +
                      " progress=" + std::to_string(processing_info.value("progress_percent", 0)) + "%");
    }

    if (processing_info.value("state", "") == "succeeded")
    {
        return;
    }
    throw ProtocolError("Media processing did not finish after " + std::to_string(options_.status_max_polls) +
                        " status checks");
}

std::string ChunkedUploadClient::postTweet(const std::string &text, const std::vector<std::string> &media_ids,
                                           const CancelToken &cancel)
{
    nlohmann::json payload = {{"text", text}};
    if (!media_ids.empty())
    {
        payload["media"] = {{"media_ids", media_ids}};
    }

    HttpRequest request;
    request.method = "POST";
    request.url = options_.post_url;
    request.content_type = "application/json";
    request.body = payload.dump();
    request.headers.emplace_back("Authorization", signer_.authorizationHeader("POST", request.url));

    HttpResponse response = transport_->send(request, cancel);
    nlohmann::json body = parseBody(response, "tweet");
    if (!body.contains("data") || !body["data"].is_object() || !body["data"].contains("id"))
    {
        throw ProtocolError("Tweet response is missing data.id", response.status);
    }
    std::string id = body["data"]["id"].is_string() ? body["data"]["id"].get<std::string>()
                                                     : body["data"]["id"].dump();
    Logger::info("Tweet posted: id=" + id);
    return id;
}

HttpResponse ChunkedUploadClient::sendForm(const QueryParams &params, const CancelToken &cancel)
{
    HttpRequest request;
    request.method = "POST";
    request.url = options_.upload_url;
    request.content_type = "application/x-www-form-urlencoded";
    request.body = formEncode(params);
    request.headers.emplace_back("Authorization", signer_.authorizationHeader("POST", request.url, params));
    return transport_->send(request, cancel);
}

nlohmann::json ChunkedUploadClient::parseBody(const HttpResponse &response, const std::string &operation) const
{
    if (!response.isSuccess())
    {
        std::string detail = response.body.substr(0, 200);
        throw ProtocolError(operation + " failed with HTTP " + std::to_string(response.status) +
                                (detail.empty() ? "" : ": " + detail),
                            response.status);
    }
    if (response.body.empty())
    {
        return nlohmann::json::object();
    }
    try
    {
        nlohmann::json body = nlohmann::json::parse(response.body);
        if (!body.is_object())
        {
            throw ProtocolError(operation + " response is not a JSON object", response.status);
        }
        return body;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ProtocolError(operation + " response is not valid JSON: " + std::string(e.what()), response.status);
    }
}
