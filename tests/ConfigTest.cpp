/**
 * ConfigTest.cpp
 */

#include "core/Config.hpp"
#include "core/transfer/TransferSettings.hpp"
#include "utils/FileUtils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using fetchkit::core::Config;
using fetchkit::core::transfer::TransferSettings;
using fetchkit::utils::FileUtils;
using namespace std::chrono_literals;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().setDefaults();
        m_dir = FileUtils::createTempDirectory("fetchkit_config_");
    }

    void TearDown() override {
        Config::instance().setDefaults();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir;
};

} // namespace

TEST_F(ConfigTest, DefaultsAreAvailable) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get<int>("transfers.chunkSize"), 8192);
    EXPECT_EQ(config.get<int>("transfers.maxRetries"), 3);
    EXPECT_EQ(config.get<int>("transfers.retryDelayMs"), 2000);
    EXPECT_TRUE(config.get<bool>("transfers.autoRetry"));
    EXPECT_EQ(config.get<std::string>("logging.level"), "info");
}

TEST_F(ConfigTest, MissingOrMistypedKeysReturnDefault) {
    auto& config = Config::instance();

    EXPECT_EQ(config.get<int>("transfers.nope", 11), 11);
    EXPECT_EQ(config.get<int>("transfers.userAgent", 5), 5);
    EXPECT_FALSE(config.has("transfers.nope"));
}

TEST_F(ConfigTest, SetHasRemove) {
    auto& config = Config::instance();

    EXPECT_TRUE(config.set("custom.nested.value", 42));
    EXPECT_TRUE(config.has("custom.nested.value"));
    EXPECT_EQ(config.get<int>("custom.nested.value"), 42);

    config.remove("custom.nested.value");
    EXPECT_FALSE(config.has("custom.nested.value"));
    EXPECT_TRUE(config.has("custom.nested"));
}

TEST_F(ConfigTest, LoadOverridesOnlyPresentKeys) {
    auto path = (m_dir / "config.json").string();
    ASSERT_TRUE(FileUtils::writeFile(path, R"({"transfers": {"maxRetries": 5}})"));

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.get<int>("transfers.maxRetries"), 5);
    EXPECT_EQ(config.get<int>("transfers.chunkSize"), 8192);
}

TEST_F(ConfigTest, LoadRejectsMissingAndInvalidFiles) {
    auto& config = Config::instance();
    EXPECT_FALSE(config.load((m_dir / "absent.json").string()));

    auto path = (m_dir / "broken.json").string();
    ASSERT_TRUE(FileUtils::writeFile(path, "{ not json"));
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.get<int>("transfers.maxRetries"), 3);

    auto listPath = (m_dir / "list.json").string();
    ASSERT_TRUE(FileUtils::writeFile(listPath, "[1, 2, 3]"));
    EXPECT_FALSE(config.load(listPath));
    EXPECT_EQ(config.get<int>("transfers.chunkSize"), 8192);
}

TEST_F(ConfigTest, SaveWritesLoadableFile) {
    auto& config = Config::instance();
    auto path = (m_dir / "nested" / "config.json").string();

    config.set("transfers.retryDelayMs", 250);
    ASSERT_TRUE(config.save(path));
    ASSERT_TRUE(FileUtils::fileExists(path));

    config.setDefaults();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.get<int>("transfers.retryDelayMs"), 250);
}

TEST_F(ConfigTest, TransferSettingsFromConfig) {
    auto& config = Config::instance();
    config.set("transfers.chunkSize", 4096);
    config.set("transfers.maxRetries", 1);
    config.set("transfers.retryDelayMs", 50);
    config.set("transfers.retryBackoff", 2.0);
    config.set("transfers.autoRetry", false);
    config.set("transfers.timeoutSeconds", 10);

    auto settings = TransferSettings::fromConfig(config);

    EXPECT_EQ(settings.chunkSize, 4096u);
    EXPECT_EQ(settings.timeout, 10s);
    EXPECT_EQ(settings.progressInterval, 100ms);
    EXPECT_EQ(settings.retry.maxRetries, 1);
    EXPECT_EQ(settings.retry.delay, 50ms);
    EXPECT_DOUBLE_EQ(settings.retry.backoffMultiplier, 2.0);
    EXPECT_FALSE(settings.retry.automatic);
}
