#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Key/value persistence for named secrets
 */
class CredentialStore
{
public:
    virtual ~CredentialStore() = default;

    /**
     * @brief Look up several keys at once; absent keys map to std::nullopt
     */
    virtual std::map<std::string, std::optional<std::string>> get(const std::vector<std::string> &keys) = 0;

    virtual void set(const std::vector<std::pair<std::string, std::string>> &pairs) = 0;
};

/**
 * @brief SQLite-backed store with a single credentials(key, value) table
 */
class SqliteCredentialStore : public CredentialStore
{
public:
    /**
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit SqliteCredentialStore(const std::string &db_path);
    ~SqliteCredentialStore() override;

    SqliteCredentialStore(const SqliteCredentialStore &) = delete;
    SqliteCredentialStore &operator=(const SqliteCredentialStore &) = delete;

    std::map<std::string, std::optional<std::string>> get(const std::vector<std::string> &keys) override;
    void set(const std::vector<std::pair<std::string, std::string>> &pairs) override;

private:
    void exec(const std::string &sql);

    std::string db_path_;
    sqlite3 *db_ = nullptr;
    std::mutex mutex_;
};

/**
 * @brief The six secrets used by the two destinations
 */
struct Credentials
{
    static constexpr const char *API_KEY = "apiKey";
    static constexpr const char *API_SECRET = "apiSecret";
    static constexpr const char *ACCESS_TOKEN = "accessToken";
    static constexpr const char *ACCESS_SECRET = "accessSecret";
    static constexpr const char *BLUESKY_HANDLE = "blueskyHandle";
    static constexpr const char *BLUESKY_PASSWORD = "blueskyPassword";

    std::string api_key;
    std::string api_secret;
    std::string access_token;
    std::string access_secret;
    std::string bluesky_handle;
    std::string bluesky_password;

    static std::vector<std::string> allKeys();
    static bool isKnownKey(const std::string &key);

    static Credentials load(CredentialStore &store);

    bool hasTwitter() const;
    bool hasBluesky() const;
};
