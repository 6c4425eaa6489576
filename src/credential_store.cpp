#include "core/credential_store.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>

SqliteCredentialStore::SqliteCredentialStore(const std::string &db_path) : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open credential store " + db_path + ": " + message);
    }

    try
    {
        exec("CREATE TABLE IF NOT EXISTS credentials (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
    }
    catch (const std::exception &)
    {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    Logger::debug("Credential store opened: " + db_path);
}

SqliteCredentialStore::~SqliteCredentialStore()
{
    if (db_)
    {
        sqlite3_close(db_);
    }
}

void SqliteCredentialStore::exec(const std::string &sql)
{
    char *error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK)
    {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw std::runtime_error("SQL error in credential store: " + message);
    }
}

std::map<std::string, std::optional<std::string>> SqliteCredentialStore::get(const std::vector<std::string> &keys)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::optional<std::string>> values;

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM credentials WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK)
    {
        throw std::runtime_error("Failed to prepare credential lookup: " + std::string(sqlite3_errmsg(db_)));
    }

    for (const auto &key : keys)
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            values[key] = text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        }
        else if (rc == SQLITE_DONE)
        {
            values[key] = std::nullopt;
        }
        else
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw std::runtime_error("Credential lookup failed for " + key + ": " + message);
        }
    }
    sqlite3_finalize(stmt);
    return values;
}

void SqliteCredentialStore::set(const std::vector<std::pair<std::string, std::string>> &pairs)
{
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN TRANSACTION;");

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "INSERT OR REPLACE INTO credentials (key, value) VALUES (?, ?);", -1, &stmt,
                           nullptr) != SQLITE_OK)
    {
        std::string message = sqlite3_errmsg(db_);
        exec("ROLLBACK;");
        throw std::runtime_error("Failed to prepare credential update: " + message);
    }

    for (const auto &[key, value] : pairs)
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            exec("ROLLBACK;");
            throw std::runtime_error("Failed to store credential " + key + ": " + message);
        }
    }
    sqlite3_finalize(stmt);
    exec("COMMIT;");
    Logger::info("Stored " + std::to_string(pairs.size()) + " credential(s)");
}

std::vector<std::string> Credentials::allKeys()
{
    return {API_KEY, API_SECRET, ACCESS_TOKEN, ACCESS_SECRET, BLUESKY_HANDLE, BLUESKY_PASSWORD};
}

bool Credentials::isKnownKey(const std::string &key)
{
    auto keys = allKeys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

Credentials Credentials::load(CredentialStore &store)
{
    auto values = store.get(allKeys());
    auto valueOf = [&values](const char *key)
    {
        auto it = values.find(key);
        return (it != values.end() && it->second) ? *it->second : std::string();
    };

    Credentials credentials;
    credentials.api_key = valueOf(API_KEY);
    credentials.api_secret = valueOf(API_SECRET);
    credentials.access_token = valueOf(ACCESS_TOKEN);
    credentials.access_secret = valueOf(ACCESS_SECRET);
    credentials.bluesky_handle = valueOf(BLUESKY_HANDLE);
    credentials.bluesky_password = valueOf(BLUESKY_PASSWORD);
    return credentials;
}

bool Credentials::hasTwitter() const
{
    return !api_key.empty() && !api_secret.empty() && !access_token.empty() && !access_secret.empty();
}

bool Credentials::hasBluesky() const
{
    return !bluesky_handle.empty() && !bluesky_password.empty();
}
