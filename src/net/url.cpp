#include "net/url.hpp"
#include <cctype>
#include <stdexcept>

Url Url::parse(const std::string &url)
{
    Url result;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
    {
        throw std::invalid_argument("URL without scheme: " + url);
    }
    result.scheme = url.substr(0, scheme_end);
    if (result.scheme != "http" && result.scheme != "https")
    {
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find_first_of("/?", host_start);
    if (path_start == std::string::npos)
    {
        result.host = url.substr(host_start);
        result.path = "/";
        return result;
    }

    result.host = url.substr(host_start, path_start - host_start);
    auto query_start = url.find('?', path_start);
    if (query_start == std::string::npos)
    {
        result.path = url.substr(path_start);
    }
    else
    {
        result.path = url.substr(path_start, query_start - path_start);
        result.query = url.substr(query_start + 1);
    }
    if (result.path.empty())
    {
        result.path = "/";
    }
    if (result.host.empty())
    {
        throw std::invalid_argument("URL without host: " + url);
    }
    return result;
}

std::string percentEncode(const std::string &value)
{
    static const char *hex = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
        {
            encoded.push_back(static_cast<char>(c));
        }
        else
        {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string percentDecode(const std::string &value)
{
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size() &&
            std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(value[i + 2])))
        {
            decoded.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else if (value[i] == '+')
        {
            decoded.push_back(' ');
        }
        else
        {
            decoded.push_back(value[i]);
        }
    }
    return decoded;
}

std::string formEncode(const QueryParams &params)
{
    std::string encoded;
    for (const auto &[key, value] : params)
    {
        if (!encoded.empty())
        {
            encoded.push_back('&');
        }
        encoded += percentEncode(key) + "=" + percentEncode(value);
    }
    return encoded;
}

QueryParams parseFormEncoded(const std::string &encoded)
{
    QueryParams params;
    size_t start = 0;
    while (start <= encoded.size())
    {
        size_t end = encoded.find('&', start);
        if (end == std::string::npos)
        {
            end = encoded.size();
        }
        std::string pair = encoded.substr(start, end - start);
        if (!pair.empty())
        {
            size_t eq = pair.find('=');
            if (eq == std::string::npos)
            {
                params.emplace_back(percentDecode(pair), "");
            }
            else
            {
                params.emplace_back(percentDecode(pair.substr(0, eq)), percentDecode(pair.substr(eq + 1)));
            }
        }
        start = end + 1;
    }
    return params;
}
