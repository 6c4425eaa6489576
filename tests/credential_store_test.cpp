#include <gtest/gtest.h>
#include "core/credential_store.hpp"
#include "test_support.hpp"

using namespace test_support;

class SqliteCredentialStoreTest : public TempDirTest
{
};

TEST_F(SqliteCredentialStoreTest, MissingKeysAreEmpty)
{
    SqliteCredentialStore store((dir_ / "creds.db").string());
    auto values = store.get({Credentials::API_KEY, Credentials::BLUESKY_HANDLE});
    ASSERT_EQ(values.size(), 2u);
    EXPECT_FALSE(values[Credentials::API_KEY].has_value());
    EXPECT_FALSE(values[Credentials::BLUESKY_HANDLE].has_value());
}

TEST_F(SqliteCredentialStoreTest, ValuesPersistAcrossInstances)
{
    std::string path = (dir_ / "creds.db").string();
    {
        SqliteCredentialStore store(path);
        store.set({{Credentials::API_KEY, "ck"}, {Credentials::BLUESKY_HANDLE, "me.bsky.social"}});
        store.set({{Credentials::API_KEY, "ck2"}});
    }

    SqliteCredentialStore reopened(path);
    auto values = reopened.get({Credentials::API_KEY, Credentials::BLUESKY_HANDLE, Credentials::API_SECRET});
    EXPECT_EQ(values[Credentials::API_KEY].value_or(""), "ck2");
    EXPECT_EQ(values[Credentials::BLUESKY_HANDLE].value_or(""), "me.bsky.social");
    EXPECT_FALSE(values[Credentials::API_SECRET].has_value());
}

TEST_F(SqliteCredentialStoreTest, UnopenablePathThrows)
{
    EXPECT_THROW(SqliteCredentialStore((dir_ / "no" / "such" / "dir" / "creds.db").string()), std::runtime_error);
}

TEST(CredentialsTest, LoadAndCompleteness)
{
    InMemoryCredentialStore store;
    Credentials empty = Credentials::load(store);
    EXPECT_FALSE(empty.hasTwitter());
    EXPECT_FALSE(empty.hasBluesky());

    store.set({{Credentials::API_KEY, "ck"},
               {Credentials::API_SECRET, "cs"},
               {Credentials::ACCESS_TOKEN, "at"}});
    EXPECT_FALSE(Credentials::load(store).hasTwitter());

    store.set({{Credentials::ACCESS_SECRET, "as"}});
    Credentials twitter = Credentials::load(store);
    EXPECT_TRUE(twitter.hasTwitter());
    EXPECT_FALSE(twitter.hasBluesky());
    EXPECT_EQ(twitter.api_key, "ck");

    EXPECT_TRUE(Credentials::load(*fullCredentials()).hasBluesky());
}

TEST(CredentialsTest, KnownKeys)
{
    EXPECT_EQ(Credentials::allKeys().size(), 6u);
    EXPECT_TRUE(Credentials::isKnownKey("blueskyPassword"));
    EXPECT_FALSE(Credentials::isKnownKey("password"));
}
