#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "core/cancel_token.hpp"

struct HttpRequest
{
    std::string method = "GET";
    std::string url; // Absolute, including any query string
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string content_type;

    std::string header(const std::string &name) const;
};

struct HttpResponse
{
    int status = 0;
    std::string body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * @brief Transport seam between the upload clients and the network
 *
 * Implementations throw TransportError when no response was received and
 * UploadCanceledError when @p cancel fires before or during the exchange.
 * Any received response, whatever its status, is returned.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse send(const HttpRequest &request, const CancelToken &cancel) = 0;
};

/**
 * @brief cpp-httplib client transport; one client per exchange
 */
class HttplibTransport : public HttpTransport
{
public:
    struct Timeouts
    {
        std::chrono::milliseconds connect{10000};
        std::chrono::milliseconds read{60000};
        std::chrono::milliseconds write{60000};
    };

    HttplibTransport() = default;
    explicit HttplibTransport(Timeouts timeouts) : timeouts_(timeouts) {}

    HttpResponse send(const HttpRequest &request, const CancelToken &cancel) override;

private:
    Timeouts timeouts_;
};
