#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/credential_store.hpp"
#include "core/media_asset.hpp"
#include "core/media_transcoder.hpp"
#include "core/upload_errors.hpp"
#include "net/http_transport.hpp"
#include "net/url.hpp"

namespace test_support
{
    inline std::string param(const QueryParams &params, const std::string &key)
    {
        for (const auto &[k, v] : params)
        {
            if (k == key)
                return v;
        }
        return "";
    }

    /**
     * @brief Form body params, or the URL query for GET requests
     */
    inline QueryParams paramsOf(const HttpRequest &request)
    {
        if (request.method == "GET")
            return parseFormEncoded(Url::parse(request.url).query);
        if (request.content_type == "application/x-www-form-urlencoded")
            return parseFormEncoded(request.body);
        return {};
    }

    inline std::string commandOf(const HttpRequest &request)
    {
        return param(paramsOf(request), "command");
    }

    inline HttpResponse jsonResponse(int status, const nlohmann::json &body)
    {
        HttpResponse response;
        response.status = status;
        response.body = body.dump();
        return response;
    }

    /**
     * @brief Blocks matching requests until opened; cancellation unblocks with UploadCanceledError
     */
    class Gate
    {
    public:
        void open()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = true;
            }
            cv_.notify_all();
        }

        void pass(const CancelToken &cancel, const std::string &operation)
        {
            waiting_++;
            std::unique_lock<std::mutex> lock(mutex_);
            while (!open_)
            {
                if (cancel.isCancelled())
                {
                    waiting_--;
                    throw UploadCanceledError(operation);
                }
                cv_.wait_for(lock, std::chrono::milliseconds(5));
            }
            waiting_--;
        }

        int waiting() const { return waiting_.load(); }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool open_ = false;
        std::atomic<int> waiting_{0};
    };

    /**
     * @brief Scripted in-process transport
     *
     * Routes are matched on method and URL without query string. Unrouted
     * requests get a 404.
     */
    class FakeTransport : public HttpTransport
    {
    public:
        using Handler = std::function<HttpResponse(const HttpRequest &)>;

        void on(const std::string &method, const std::string &base_url, Handler handler)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            routes_[method + " " + base_url] = std::move(handler);
        }

        /**
         * @brief Hold every request for which @p matcher returns true until the gate opens
         */
        std::shared_ptr<Gate> gate(std::function<bool(const HttpRequest &)> matcher)
        {
            auto gate = std::make_shared<Gate>();
            std::lock_guard<std::mutex> lock(mutex_);
            gates_.emplace_back(std::move(matcher), gate);
            return gate;
        }

        HttpResponse send(const HttpRequest &request, const CancelToken &cancel) override
        {
            const std::string operation = request.method + " " + request.url;
            cancel.throwIfCancelled(operation);

            Handler handler;
            std::vector<std::shared_ptr<Gate>> gates;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(request);
                auto it = routes_.find(request.method + " " + Url::parse(request.url).baseUrl());
                if (it != routes_.end())
                    handler = it->second;
                for (const auto &entry : gates_)
                {
                    if (entry.first(request))
                        gates.push_back(entry.second);
                }
            }

            for (const auto &gate : gates)
            {
                gate->pass(cancel, operation);
            }
            cancel.throwIfCancelled(operation);

            if (!handler)
            {
                HttpResponse missing;
                missing.status = 404;
                missing.body = "{\"error\":\"no route\"}";
                return missing;
            }
            return handler(request);
        }

        std::vector<HttpRequest> requests() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

        size_t count(const std::function<bool(const HttpRequest &)> &predicate) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto &request : requests_)
            {
                if (predicate(request))
                    ++n;
            }
            return n;
        }

        size_t countUrl(const std::string &base_url) const
        {
            return count([&](const HttpRequest &r)
                         { return Url::parse(r.url).baseUrl() == base_url; });
        }

        size_t countCommand(const std::string &command) const
        {
            return count([&](const HttpRequest &r)
                         { return commandOf(r) == command; });
        }

    private:
        mutable std::mutex mutex_;
        std::map<std::string, Handler> routes_;
        std::vector<std::pair<std::function<bool(const HttpRequest &)>, std::shared_ptr<Gate>>> gates_;
        std::vector<HttpRequest> requests_;
    };

    const std::string TWITTER_UPLOAD_URL = "https://upload.twitter.com/1.1/media/upload.json";
    const std::string TWITTER_POST_URL = "https://api.twitter.com/2/tweets";
    const std::string BLUESKY_URL = "https://bsky.social";
    const std::string BSKY_SESSION_URL = BLUESKY_URL + "/xrpc/com.atproto.server.createSession";
    const std::string BSKY_BLOB_URL = BLUESKY_URL + "/xrpc/com.atproto.repo.uploadBlob";
    const std::string BSKY_RECORD_URL = BLUESKY_URL + "/xrpc/com.atproto.repo.createRecord";

    /**
     * @brief Happy-path Twitter upload endpoint; media ids are M1, M2, ...
     */
    inline void installTwitterUpload(FakeTransport &transport)
    {
        auto counter = std::make_shared<std::atomic<int>>(0);
        transport.on("POST", TWITTER_UPLOAD_URL, [counter](const HttpRequest &request)
                     {
            std::string command = commandOf(request);
            if (command == "INIT")
                return jsonResponse(202, {{"media_id_string", "M" + std::to_string(++(*counter))}});
            if (command == "APPEND")
                return HttpResponse{204, ""};
            if (command == "FINALIZE")
                return jsonResponse(201, {{"media_id_string", param(paramsOf(request), "media_id")}});
            return jsonResponse(400, {{"error", "unknown command"}}); });
    }

    inline void installTweetEndpoint(FakeTransport &transport)
    {
        auto counter = std::make_shared<std::atomic<int>>(0);
        transport.on("POST", TWITTER_POST_URL, [counter](const HttpRequest &)
                     { return jsonResponse(201, {{"data", {{"id", "T" + std::to_string(++(*counter))}, {"text", "ok"}}}}); });
    }

    /**
     * @brief Happy-path Bluesky endpoints; blob links are bafy1, bafy2, ...
     */
    inline void installBluesky(FakeTransport &transport)
    {
        transport.on("POST", BSKY_SESSION_URL, [](const HttpRequest &)
                     { return jsonResponse(200, {{"did", "did:plc:test"},
                                                 {"handle", "tester.bsky.social"},
                                                 {"accessJwt", "access-token"},
                                                 {"refreshJwt", "refresh-token"}}); });
        auto blobs = std::make_shared<std::atomic<int>>(0);
        transport.on("POST", BSKY_BLOB_URL, [blobs](const HttpRequest &request)
                     { return jsonResponse(200, {{"blob", {{"$type", "blob"},
                                                           {"ref", {{"$link", "bafy" + std::to_string(++(*blobs))}}},
                                                           {"mimeType", request.content_type},
                                                           {"size", request.body.size()}}}}); });
        auto records = std::make_shared<std::atomic<int>>(0);
        transport.on("POST", BSKY_RECORD_URL, [records](const HttpRequest &)
                     { return jsonResponse(200, {{"uri", "at://did:plc:test/app.bsky.feed.post/" + std::to_string(++(*records))},
                                                 {"cid", "bafyrecord"}}); });
    }

    class InMemoryCredentialStore : public CredentialStore
    {
    public:
        std::map<std::string, std::optional<std::string>> get(const std::vector<std::string> &keys) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::map<std::string, std::optional<std::string>> result;
            for (const auto &key : keys)
            {
                auto it = values_.find(key);
                result[key] = it == values_.end() ? std::nullopt : std::optional<std::string>(it->second);
            }
            return result;
        }

        void set(const std::vector<std::pair<std::string, std::string>> &pairs) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &[key, value] : pairs)
                values_[key] = value;
        }

    private:
        std::mutex mutex_;
        std::map<std::string, std::string> values_;
    };

    inline std::shared_ptr<InMemoryCredentialStore> fullCredentials()
    {
        auto store = std::make_shared<InMemoryCredentialStore>();
        store->set({{"apiKey", "ck"},
                    {"apiSecret", "cs"},
                    {"accessToken", "at"},
                    {"accessSecret", "as"},
                    {"blueskyHandle", "tester.bsky.social"},
                    {"blueskyPassword", "app-password"}});
        return store;
    }

    /**
     * @brief Per-test scratch directory removed in TearDown
     */
    class TempDirTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir_ = std::filesystem::temp_directory_path() /
                   ("crosspost_test_" + std::string(info->test_suite_name()) + "_" + info->name());
            std::filesystem::remove_all(dir_);
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(dir_, ec);
        }

        std::string writeFile(const std::string &name, size_t size, char fill = 'x')
        {
            std::filesystem::path path = dir_ / name;
            std::ofstream out(path, std::ios::binary);
            std::string data(size, fill);
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            return path.string();
        }

        MediaAsset makeAsset(const std::string &name, size_t size, MediaKind kind, const std::string &mime)
        {
            MediaAsset asset;
            asset.local_ref = writeFile(name, size);
            asset.kind = kind;
            asset.mime_type = mime;
            asset.byte_size = size;
            return asset;
        }

        std::filesystem::path dir_;
    };

    /**
     * @brief Image transcoder whose output size is a function of the pass
     */
    class FakeImageTranscoder : public ImageTranscoder
    {
    public:
        std::function<size_t(int, double)> size_for = [](int, double)
        { return size_t(1000); };
        std::vector<std::pair<int, double>> calls;
        std::vector<std::string> inputs;
        bool fail = false;

        PixelSize reencode(const std::string &input, const std::string &output, int max_dimension,
                           double quality) override
        {
            calls.emplace_back(max_dimension, quality);
            inputs.push_back(input);
            if (fail)
                throw std::runtime_error("decode failed");
            std::ofstream out(output, std::ios::binary);
            std::string data(size_for(max_dimension, quality), 'j');
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            return PixelSize{max_dimension, max_dimension * 3 / 4};
        }

        std::optional<PixelSize> dimensions(const std::string &) override
        {
            return PixelSize{4000, 3000};
        }
    };

    class FakeVideoTranscoder : public VideoTranscoder
    {
    public:
        std::optional<PixelSize> probed = PixelSize{1920, 1080};
        std::function<size_t(const VideoProfile &)> size_for = [](const VideoProfile &)
        { return size_t(1000); };
        std::vector<VideoProfile> calls;

        std::optional<PixelSize> probe(const std::string &) override { return probed; }

        PixelSize transcode(const std::string &, const std::string &output, const VideoProfile &profile) override
        {
            calls.push_back(profile);
            std::ofstream out(output, std::ios::binary);
            std::string data(size_for(profile), 'v');
            out.write(data.data(), static_cast<std::streamsize>(data.size()));
            return PixelSize{profile.max_side, profile.max_side * 9 / 16};
        }
    };
}
