#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "test_util.hpp"
#include "config/Paths.hpp"
#include "config/Settings.hpp"
#include "utils/logging.hpp"

namespace fs = std::filesystem;

namespace {

class SettingsTest : public testing::Test {
protected:
    ScopedTempDir tmp_;
    fs::path file_ = tmp_.path() / "config";
};

}  // namespace

TEST_F(SettingsTest, MissingFileGivesDefaults) {
    Settings s = Settings::load(file_);
    EXPECT_FALSE(s.defaultUsername().has_value());
    EXPECT_TRUE(s.biometricEnabled());
    EXPECT_EQ(std::chrono::seconds(60), s.biometricTimeout());
    EXPECT_EQ("hidemail-remote", s.remoteHelper());
    EXPECT_EQ("info", s.logLevel());
#if defined(__APPLE__)
    EXPECT_EQ("security", s.secretBackend());
#else
    EXPECT_EQ("secret-tool", s.secretBackend());
#endif
}

TEST_F(SettingsTest, ParsesKeyValueLines) {
    writeFile(file_,
              "# comment\n"
              "\n"
              "default_username = alice@example.com\n"
              "secret_backend=\"file\"\n"
              "  biometric = off  \n"
              "biometric_timeout_seconds = 0\n"
              "this line is ignored\n"
              "log_level = 'debug'\n");

    Settings s = Settings::load(file_);
    EXPECT_EQ("alice@example.com", s.defaultUsername().value_or(""));
    EXPECT_EQ("file", s.secretBackend());
    EXPECT_FALSE(s.biometricEnabled());
    EXPECT_EQ(std::chrono::seconds(0), s.biometricTimeout());
    EXPECT_EQ("debug", s.logLevel());
    EXPECT_FALSE(s.get("this line is ignored").has_value());
}

TEST_F(SettingsTest, InvalidTimeoutFallsBack) {
    writeFile(file_, "biometric_timeout_seconds = soon\n");
    EXPECT_EQ(std::chrono::seconds(60), Settings::load(file_).biometricTimeout());

    writeFile(file_, "biometric_timeout_seconds = -5\n");
    EXPECT_EQ(std::chrono::seconds(60), Settings::load(file_).biometricTimeout());
}

TEST_F(SettingsTest, HugeTimeoutIsCapped) {
    writeFile(file_, "biometric_timeout_seconds = 9223372036854775807\n");
    auto timeout = Settings::load(file_).biometricTimeout();
    EXPECT_EQ(std::chrono::seconds(3600), timeout);
    EXPECT_EQ(std::chrono::milliseconds(3600000),
              std::chrono::duration_cast<std::chrono::milliseconds>(timeout));

    writeFile(file_, "biometric_timeout_seconds = 3600\n");
    EXPECT_EQ(std::chrono::seconds(3600), Settings::load(file_).biometricTimeout());
}

TEST_F(SettingsTest, DefaultUsernamePersists) {
    Settings s = Settings::load(file_);
    ASSERT_TRUE(s.setDefaultUsername("alice@example.com"));
    EXPECT_EQ("alice@example.com", Settings::load(file_).defaultUsername().value_or(""));

    ASSERT_TRUE(s.clearDefaultUsername());
    EXPECT_FALSE(Settings::load(file_).defaultUsername().has_value());
}

TEST_F(SettingsTest, SaveKeepsOtherKeys) {
    writeFile(file_, "remote_helper = /opt/hidemail/helper\n");
    Settings s = Settings::load(file_);
    s.setDefaultUsername("bob@example.com");

    Settings reloaded = Settings::load(file_);
    EXPECT_EQ("/opt/hidemail/helper", reloaded.remoteHelper());
    EXPECT_EQ("bob@example.com", reloaded.defaultUsername().value_or(""));
}

TEST_F(SettingsTest, EmptyDefaultUsernameIsUnset) {
    writeFile(file_, "default_username =\n");
    EXPECT_FALSE(Settings::load(file_).defaultUsername().has_value());
}

TEST(PathsTest, LayoutUnderRoot) {
    Paths p = Paths::under("/var/tmp/hm");
    EXPECT_EQ(fs::path("/var/tmp/hm/config"), p.configFile);
    EXPECT_EQ(fs::path("/var/tmp/hm/session"), p.sessionDir);
    EXPECT_EQ(fs::path("/var/tmp/hm/vault"), p.vaultDir);
    EXPECT_EQ(fs::path("/var/tmp/hm/hidemail.log"), p.logFile);
}

TEST(PathsTest, EnvironmentOverridesHome) {
    ScopedTempDir tmp;
    auto root = tmp.path() / "state";
    ::setenv("HIDEMAIL_HOME", root.c_str(), 1);
    Paths p = Paths::resolve();
    ::unsetenv("HIDEMAIL_HOME");

    EXPECT_EQ(root, p.root);
    p.ensureRoot();
    auto perms = fs::status(root).permissions();
    EXPECT_EQ(fs::perms::owner_all, perms & fs::perms::all);
}

TEST(LoggingTest, LevelNames) {
    EXPECT_EQ(spdlog::level::debug, Log::levelFromName("debug"));
    EXPECT_EQ(spdlog::level::warn, Log::levelFromName("warning"));
    EXPECT_EQ(spdlog::level::off, Log::levelFromName("off"));
    EXPECT_EQ(spdlog::level::info, Log::levelFromName("chatty"));
}
