#include "net/oauth1_signer.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

std::string base64Encode(const unsigned char *data, size_t length)
{
    if (length == 0)
    {
        return "";
    }
    std::string encoded(4 * ((length + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]), data, static_cast<int>(length));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::string base64Encode(const std::string &data)
{
    return base64Encode(reinterpret_cast<const unsigned char *>(data.data()), data.size());
}

OAuth1Signer::OAuth1Signer(OAuth1Credentials credentials) : credentials_(std::move(credentials))
{
}

std::string OAuth1Signer::authorizationHeader(const std::string &method, const std::string &url,
                                              const QueryParams &body_params) const
{
    auto now = std::chrono::system_clock::now();
    int64_t timestamp = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return authorizationHeader(method, url, body_params, generateNonce(), timestamp);
}

std::string OAuth1Signer::authorizationHeader(const std::string &method, const std::string &url,
                                              const QueryParams &body_params, const std::string &nonce,
                                              int64_t timestamp) const
{
    QueryParams oauth_params = {
        {"oauth_consumer_key", credentials_.consumer_key},
        {"oauth_nonce", nonce},
        {"oauth_signature_method", "HMAC-SHA1"},
        {"oauth_timestamp", std::to_string(timestamp)},
        {"oauth_token", credentials_.access_token},
        {"oauth_version", "1.0"}};

    QueryParams all_params = oauth_params;
    all_params.insert(all_params.end(), body_params.begin(), body_params.end());
    QueryParams query_params = parseFormEncoded(Url::parse(url).query);
    all_params.insert(all_params.end(), query_params.begin(), query_params.end());

    std::string base = signatureBaseString(method, url, all_params);
    std::string signing_key = percentEncode(credentials_.consumer_secret) + "&" +
                              percentEncode(credentials_.access_token_secret);
    oauth_params.emplace_back("oauth_signature", hmacSha1Base64(signing_key, base));
    std::sort(oauth_params.begin(), oauth_params.end());

    std::string header = "OAuth ";
    for (size_t i = 0; i < oauth_params.size(); ++i)
    {
        if (i > 0)
        {
            header += ", ";
        }
        header += percentEncode(oauth_params[i].first) + "=\"" + percentEncode(oauth_params[i].second) + "\"";
    }
    return header;
}

std::string OAuth1Signer::signatureBaseString(const std::string &method, const std::string &url,
                                              const QueryParams &params)
{
    // Parameters are sorted by encoded key, then by encoded value
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(params.size());
    for (const auto &[key, value] : params)
    {
        encoded.emplace_back(percentEncode(key), percentEncode(value));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string normalized;
    for (const auto &[key, value] : encoded)
    {
        if (!normalized.empty())
        {
            normalized.push_back('&');
        }
        normalized += key + "=" + value;
    }

    std::string upper_method = method;
    std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(), ::toupper);
    return upper_method + "&" + percentEncode(Url::parse(url).baseUrl()) + "&" + percentEncode(normalized);
}

std::string OAuth1Signer::hmacSha1Base64(const std::string &key, const std::string &data)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    unsigned char *result = HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char *>(data.data()), data.size(),
                                 digest, &digest_length);
    if (!result)
    {
        throw std::runtime_error("HMAC-SHA1 computation failed");
    }
    return base64Encode(digest, digest_length);
}

std::string OAuth1Signer::generateNonce()
{
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1)
    {
        throw std::runtime_error("RAND_bytes failed to produce an OAuth nonce");
    }
    static const char *hex = "0123456789abcdef";
    std::string nonce;
    nonce.reserve(sizeof(bytes) * 2);
    for (unsigned char b : bytes)
    {
        nonce.push_back(hex[b >> 4]);
        nonce.push_back(hex[b & 0x0F]);
    }
    return nonce;
}
