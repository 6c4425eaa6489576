#include "net/http_transport.hpp"
#include "net/url.hpp"
#include "core/upload_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <httplib.h>

namespace
{
    bool equalsIgnoreCase(const std::string &a, const std::string &b)
    {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
                          { return std::tolower(static_cast<unsigned char>(x)) ==
                                   std::tolower(static_cast<unsigned char>(y)); });
    }
}

std::string HttpRequest::header(const std::string &name) const
{
    for (const auto &[key, value] : headers)
    {
        if (equalsIgnoreCase(key, name))
        {
            return value;
        }
    }
    return "";
}

HttpResponse HttplibTransport::send(const HttpRequest &request, const CancelToken &cancel)
{
    const std::string operation = request.method + " " + request.url;
    cancel.throwIfCancelled(operation);

    Url url;
    try
    {
        url = Url::parse(request.url);
    }
    catch (const std::invalid_argument &e)
    {
        throw TransportError("Invalid request URL: " + std::string(e.what()));
    }

    httplib::Client client(url.origin());
    client.set_connection_timeout(timeouts_.connect);
    client.set_read_timeout(timeouts_.read);
    client.set_write_timeout(timeouts_.write);
    client.set_keep_alive(false);

    httplib::Headers headers;
    for (const auto &[key, value] : request.headers)
    {
        headers.emplace(key, value);
    }

    // Closing the socket from another thread is how an in-flight call is aborted
    auto registration = cancel.onCancel([&client]()
                                        { client.stop(); });

    Logger::trace("HTTP " + operation + " (" + std::to_string(request.body.size()) + " body bytes)");

    if (request.method != "GET" && request.method != "POST")
    {
        throw TransportError("Unsupported HTTP method: " + request.method);
    }
    httplib::Result result = request.method == "GET"
                                 ? client.Get(url.pathWithQuery(), headers)
                                 : client.Post(url.pathWithQuery(), headers, request.body, request.content_type);

    registration.reset();
    cancel.throwIfCancelled(operation);

    if (!result)
    {
        throw TransportError(operation + " failed: " + httplib::to_string(result.error()));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    Logger::trace("HTTP " + operation + " -> " + std::to_string(response.status));
    return response;
}
