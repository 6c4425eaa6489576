#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <Poco/Exception.h>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Config file not found: " + path + ", using defaults");
        return false;
    }
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse config file " + path + ": " + e.displayText());
        return false;
    }
    Logger::info("Loaded configuration from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

void PocoConfigManager::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    std::string text = ss.str();
    return text.empty() ? nlohmann::json::object() : nlohmann::json::parse(text);
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten nested objects into dotted keys
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_unsigned())
                cfg_->setUInt64(prefix, node.get<uint64_t>());
            else if (node.is_number_integer())
                cfg_->setInt64(prefix, node.get<int64_t>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t PocoConfigManager::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

uint64_t PocoConfigManager::getBytes(const std::string &key, uint64_t def) const
{
    int64_t value = getInt64(key, static_cast<int64_t>(def));
    if (value <= 0)
    {
        Logger::warn("Ignoring non-positive byte value for " + key + ", using " + std::to_string(def));
        return def;
    }
    return static_cast<uint64_t>(value);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getLogFile() const
{
    return getString("logging.file", "");
}

std::string PocoConfigManager::getTwitterUploadUrl() const
{
    return getString("twitter.upload_url", "https://upload.twitter.com/1.1/media/upload.json");
}

std::string PocoConfigManager::getTwitterPostUrl() const
{
    return getString("twitter.post_url", "https://api.twitter.com/2/tweets");
}

std::string PocoConfigManager::getBlueskyPdsUrl() const
{
    return getString("bluesky.pds_url", "https://bsky.social");
}

uint64_t PocoConfigManager::getTwitterImageLimitBytes() const
{
    return getBytes("twitter.image_limit_bytes", 5ULL * 1024 * 1024);
}

uint64_t PocoConfigManager::getTwitterGifLimitBytes() const
{
    return getBytes("twitter.gif_limit_bytes", 15ULL * 1024 * 1024);
}

uint64_t PocoConfigManager::getTwitterVideoLimitBytes() const
{
    return getBytes("twitter.video_limit_bytes", 512ULL * 1024 * 1024);
}

size_t PocoConfigManager::getBlueskyTextLimit() const
{
    return static_cast<size_t>(getBytes("bluesky.text_limit", 300));
}

uint64_t PocoConfigManager::getBlueskyMaxBlobBytes() const
{
    return getBytes("bluesky.max_blob_bytes", 50ULL * 1024 * 1024);
}

uint64_t PocoConfigManager::getSmallChunkBytes() const
{
    return getBytes("upload.small_chunk_bytes", 1024 * 1024);
}

uint64_t PocoConfigManager::getLargeChunkBytes() const
{
    return getBytes("upload.large_chunk_bytes", 4ULL * 1024 * 1024);
}

uint64_t PocoConfigManager::getLargeVideoThresholdBytes() const
{
    return getBytes("upload.large_video_threshold_bytes", 64ULL * 1024 * 1024);
}

int PocoConfigManager::getStatusMinIntervalMs() const
{
    return std::max(STATUS_MIN_INTERVAL_FLOOR_MS,
                    getInt("upload.status_min_interval_ms", STATUS_MIN_INTERVAL_FLOOR_MS));
}

int PocoConfigManager::getStatusMaxPolls() const
{
    return getInt("upload.status_max_polls", 120);
}

int PocoConfigManager::getHttpConnectTimeoutMs() const
{
    return getInt("http.connect_timeout_ms", 10000);
}

int PocoConfigManager::getHttpReadTimeoutMs() const
{
    return getInt("http.read_timeout_ms", 60000);
}

uint64_t PocoConfigManager::getOptimizerMinTransformBytes() const
{
    return getBytes("optimizer.min_transform_bytes", 256 * 1024);
}

std::string PocoConfigManager::getOptimizerWorkDir() const
{
    return getString("optimizer.work_dir", (std::filesystem::temp_directory_path() / "crosspost").string());
}

std::string PocoConfigManager::getCredentialsDbPath() const
{
    return getString("credentials.db_path", "crosspost_credentials.db");
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;
    if (getSmallChunkBytes() > getLargeChunkBytes())
    {
        Logger::error("upload.small_chunk_bytes must not exceed upload.large_chunk_bytes");
        valid = false;
    }
    if (getStatusMaxPolls() < 1)
    {
        Logger::error("upload.status_max_polls must be at least 1");
        valid = false;
    }
    if (getInt("upload.status_min_interval_ms", STATUS_MIN_INTERVAL_FLOOR_MS) < STATUS_MIN_INTERVAL_FLOOR_MS)
    {
        Logger::error("upload.status_min_interval_ms must be at least " +
                      std::to_string(STATUS_MIN_INTERVAL_FLOOR_MS));
        valid = false;
    }
    if (getHttpConnectTimeoutMs() <= 0 || getHttpReadTimeoutMs() <= 0)
    {
        Logger::error("Timeouts and intervals must be positive");
        valid = false;
    }
    for (const auto &url : {getTwitterUploadUrl(), getTwitterPostUrl(), getBlueskyPdsUrl()})
    {
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0)
        {
            Logger::error("Endpoint is not an http(s) URL: " + url);
            valid = false;
        }
    }
    return valid;
}
