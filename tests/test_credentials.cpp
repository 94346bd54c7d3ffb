#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <core/constants.hpp>
#include <cstdlib>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;

class CredentialsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path saved_path;
    std::string saved_env;
    bool had_env = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "docsync_credentials_test";
        fs::remove_all(test_dir);

        auto& creds = CredentialManager::instance();
        saved_path = creds.path();
        creds.set_path(test_dir / "credentials");

        if (const char* env = std::getenv(API_KEY_ENV)) {
            had_env = true;
            saved_env = env;
        }
        unsetenv(API_KEY_ENV);
    }

    void TearDown() override {
        CredentialManager::instance().set_path(saved_path);
        if (had_env) setenv(API_KEY_ENV, saved_env.c_str(), 1);
        fs::remove_all(test_dir);
    }
};

TEST_F(CredentialsTest, SetGetRemove) {
    auto& creds = CredentialManager::instance();
    ASSERT_TRUE(creds.set("api_key", "abc=123").is_ok());

    auto got = creds.get("api_key");
    ASSERT_TRUE(got.is_ok());
    EXPECT_EQ(got.value, "abc=123");

    ASSERT_TRUE(creds.remove("api_key").is_ok());
    EXPECT_TRUE(creds.get("api_key").is_err());
    EXPECT_TRUE(creds.remove("api_key").is_err());
}

TEST_F(CredentialsTest, FileIsOwnerOnly) {
    ASSERT_TRUE(CredentialManager::instance().set("api_key", "k").is_ok());

    struct stat st;
    ASSERT_EQ(stat((test_dir / "credentials").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600);
}

TEST_F(CredentialsTest, ResolveWithoutAnyKey) {
    auto r = resolve_api_key();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("docsync setup"), std::string::npos);
}

TEST_F(CredentialsTest, EnvironmentWinsOverStoredKey) {
    ASSERT_TRUE(CredentialManager::instance().set(API_KEY_CREDENTIAL, "stored").is_ok());
    EXPECT_EQ(resolve_api_key().value, "stored");

    setenv(API_KEY_ENV, "from-env", 1);
    auto r = resolve_api_key();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "from-env");
    unsetenv(API_KEY_ENV);
}
