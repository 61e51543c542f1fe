#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace peerdrop::core;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "peerdrop_config_test";
        fs::remove_all(dir_);
        path_ = dir_ / "config.toml";
    }

    void TearDown() override { fs::remove_all(dir_); }

    void WriteConfig(const std::string& text) {
        fs::create_directories(dir_);
        std::ofstream out(path_);
        out << text;
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
    InitConfig(path_);

    EXPECT_TRUE(fs::exists(path_));
    EXPECT_EQ(settings.port, transfer::kDefaultPort);
    EXPECT_EQ(settings.pacing_delay_ms, 10);
    EXPECT_EQ(settings.stall_timeout_seconds, 30);
    EXPECT_FALSE(settings.allow_incomplete);
    EXPECT_EQ(settings.log_level, "info");
    EXPECT_FALSE(settings.save_dir.empty());

    auto table = toml::parse_file(path_.string());
    EXPECT_EQ(table["transfer"]["port"].value_or<std::int64_t>(0), transfer::kDefaultPort);
    EXPECT_EQ(table["transfer"]["pacing-delay-ms"].value_or<std::int64_t>(0), 10);
}

TEST_F(ConfigTest, ReadsTransferTable) {
    WriteConfig(R"(
[transfer]
port = 40000
save-dir = "/tmp/incoming"
pacing-delay-ms = 0
stall-timeout-seconds = 5
allow-incomplete = true
log-level = "debug"
)");
    InitConfig(path_);

    EXPECT_EQ(settings.port, 40000);
    EXPECT_EQ(settings.save_dir, fs::path("/tmp/incoming"));
    EXPECT_EQ(settings.pacing_delay_ms, 0);
    EXPECT_EQ(settings.stall_timeout_seconds, 5);
    EXPECT_TRUE(settings.allow_incomplete);
    EXPECT_EQ(settings.log_level, "debug");
}

TEST_F(ConfigTest, InvalidValuesFallBackToDefaults) {
    WriteConfig(R"(
[transfer]
port = 70000
pacing-delay-ms = -1
stall-timeout-seconds = -3
)");
    InitConfig(path_);

    EXPECT_EQ(settings.port, transfer::kDefaultPort);
    EXPECT_EQ(settings.pacing_delay_ms, 10);
    EXPECT_EQ(settings.stall_timeout_seconds, 30);
}

TEST_F(ConfigTest, UnparsableFileFallsBackToDefaults) {
    WriteConfig("[transfer\nport = = 1\n");
    InitConfig(path_);

    EXPECT_EQ(settings.port, transfer::kDefaultPort);
    EXPECT_EQ(settings.log_level, "info");
}

TEST_F(ConfigTest, SaveConfigPersistsSettings) {
    InitConfig(path_);
    settings.port = 41000;
    settings.allow_incomplete = true;
    settings.save_dir = "/tmp/elsewhere";
    SaveConfig(path_);

    settings.port = 1;
    settings.allow_incomplete = false;
    InitConfig(path_);

    EXPECT_EQ(settings.port, 41000);
    EXPECT_TRUE(settings.allow_incomplete);
    EXPECT_EQ(settings.save_dir, fs::path("/tmp/elsewhere"));
}
