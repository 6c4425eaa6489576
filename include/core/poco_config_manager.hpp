#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-file backed configuration with dotted-key access
 *
 * Every getter falls back to a built-in default when the key is absent, so an
 * empty or missing config file yields a working setup.
 */
class PocoConfigManager
{
public:
    // Twitter asks clients not to poll STATUS more often than once a second
    static constexpr int STATUS_MIN_INTERVAL_FLOOR_MS = 1000;

    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;
    void reset();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    int64_t getInt64(const std::string &key, int64_t def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    bool hasKey(const std::string &key) const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFile() const;

    // Endpoints
    std::string getTwitterUploadUrl() const;
    std::string getTwitterPostUrl() const;
    std::string getBlueskyPdsUrl() const;

    // Destination limits
    uint64_t getTwitterImageLimitBytes() const;
    uint64_t getTwitterGifLimitBytes() const;
    uint64_t getTwitterVideoLimitBytes() const;
    size_t getBlueskyTextLimit() const;
    uint64_t getBlueskyMaxBlobBytes() const;

    // Chunked upload tuning
    uint64_t getSmallChunkBytes() const;
    uint64_t getLargeChunkBytes() const;
    uint64_t getLargeVideoThresholdBytes() const;
    int getStatusMinIntervalMs() const; // Never below STATUS_MIN_INTERVAL_FLOOR_MS
    int getStatusMaxPolls() const;

    // HTTP
    int getHttpConnectTimeoutMs() const;
    int getHttpReadTimeoutMs() const;

    // Optimizer
    uint64_t getOptimizerMinTransformBytes() const;
    std::string getOptimizerWorkDir() const;

    // Credential store
    std::string getCredentialsDbPath() const;

    bool validateConfig() const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    uint64_t getBytes(const std::string &key, uint64_t def) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
