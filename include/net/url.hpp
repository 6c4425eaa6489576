#pragma once

#include <string>
#include <utility>
#include <vector>

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Minimal absolute-URL splitter for http and https endpoints
 */
struct Url
{
    std::string scheme; // "http" or "https"
    std::string host;   // host[:port]
    std::string path;   // begins with '/'
    std::string query;  // without the leading '?'

    static Url parse(const std::string &url);

    std::string origin() const { return scheme + "://" + host; }
    std::string baseUrl() const { return origin() + path; }
    std::string pathWithQuery() const { return query.empty() ? path : path + "?" + query; }
};

/**
 * @brief RFC 3986 percent-encoding; only ALPHA, DIGIT and "-._~" pass through
 */
std::string percentEncode(const std::string &value);
std::string percentDecode(const std::string &value);

/**
 * @brief Encode pairs as key=value&key=value with percentEncode on both sides
 */
std::string formEncode(const QueryParams &params);

/**
 * @brief Split an x-www-form-urlencoded string (or a URL query) into pairs
 */
QueryParams parseFormEncoded(const std::string &encoded);
