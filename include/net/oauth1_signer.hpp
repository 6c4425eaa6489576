#pragma once

#include <cstdint>
#include <string>
#include "net/url.hpp"

/**
 * @brief Consumer and access-token key pairs for OAuth 1.0a user context
 */
struct OAuth1Credentials
{
    std::string consumer_key;
    std::string consumer_secret;
    std::string access_token;
    std::string access_token_secret;
};

/**
 * @brief Computes OAuth 1.0a HMAC-SHA1 Authorization headers
 *
 * Each request is signed on its own from the long-lived credential pair,
 * the method, the base URL, the URL query and any form-encoded body params.
 * JSON bodies are never part of the signature base.
 */
class OAuth1Signer
{
public:
    explicit OAuth1Signer(OAuth1Credentials credentials);

    /**
     * @brief Build the Authorization header value with a fresh nonce and timestamp
     * @param method HTTP method in upper case
     * @param url Absolute URL; its query parameters are signed
     * @param body_params Decoded x-www-form-urlencoded body parameters
     */
    std::string authorizationHeader(const std::string &method, const std::string &url,
                                    const QueryParams &body_params = {}) const;

    /**
     * @brief Deterministic variant used for reproducible signatures
     */
    std::string authorizationHeader(const std::string &method, const std::string &url,
                                    const QueryParams &body_params, const std::string &nonce,
                                    int64_t timestamp) const;

    /**
     * @brief OAuth signature base string (section 3.4.1)
     */
    static std::string signatureBaseString(const std::string &method, const std::string &url,
                                           const QueryParams &params);

    /**
     * @brief Base64(HMAC-SHA1(key, base)) using OpenSSL
     */
    static std::string hmacSha1Base64(const std::string &key, const std::string &data);

    static std::string generateNonce();

private:
    OAuth1Credentials credentials_;
};

/**
 * @brief Standard base64 with padding
 */
std::string base64Encode(const std::string &data);
std::string base64Encode(const unsigned char *data, size_t length);
