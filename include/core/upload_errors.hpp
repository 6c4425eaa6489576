#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Root of every error raised by the cross-post engine
 */
class CrossPostError : public std::runtime_error
{
public:
    explicit CrossPostError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Network or transport failure (connection refused, reset, timeout)
 */
class TransportError : public CrossPostError
{
public:
    explicit TransportError(const std::string &message) : CrossPostError(message) {}
};

/**
 * @brief The operation was stopped through its CancelToken
 *
 * Callers treat this as "no handle obtained", never as a failure that needs
 * to be shown to the user.
 */
class UploadCanceledError : public TransportError
{
public:
    explicit UploadCanceledError(const std::string &operation)
        : TransportError("Canceled: " + operation) {}
};

/**
 * @brief Well-formed exchange with an unexpected or semantically invalid response
 */
class ProtocolError : public CrossPostError
{
public:
    explicit ProtocolError(const std::string &message, int http_status = 0)
        : CrossPostError(message), http_status_(http_status) {}

    int httpStatus() const { return http_status_; }

private:
    int http_status_;
};

/**
 * @brief Content violates a known limit; raised before any network call
 */
class ValidationError : public CrossPostError
{
public:
    explicit ValidationError(const std::string &message) : CrossPostError(message) {}
};

/**
 * @brief A required secret is missing from the credential store
 */
class CredentialError : public CrossPostError
{
public:
    explicit CredentialError(const std::string &message) : CrossPostError(message) {}
};
