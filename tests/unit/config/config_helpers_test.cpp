#include <gtest/gtest.h>

#include <partstream/config/config_helpers.h>
#include <partstream/config/settings.h>

#include <cstdlib>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace partstream;
using namespace partstream::config;

namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = std::filesystem::temp_directory_path() /
               ("partstream-config-test-" + std::to_string(stamp));
        std::filesystem::create_directories(dir_);
        for (const char* name : kEnvVars)
            ::unsetenv(name);
    }

    void TearDown() override {
        for (const char* name : kEnvVars)
            ::unsetenv(name);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& body) {
        auto path = dir_ / "config.toml";
        std::ofstream out(path, std::ios::trunc);
        out << body;
        return path;
    }

    static constexpr const char* kEnvVars[] = {
        "PARTSTREAM_PART_SIZE", "PARTSTREAM_CONCURRENCY", "PARTSTREAM_S3_ENDPOINT",
        "PARTSTREAM_CONFIG",    "AWS_REGION",             "AWS_ACCESS_KEY_ID",
        "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN"};

    std::filesystem::path dir_;
};

} // namespace

TEST_F(ConfigFileTest, ParseConfigValueReadsSectionsAndDottedKeys) {
    auto path = write("# partstream\n"
                      "[downloader]\n"
                      "part_size = \"8M\"   # per request\n"
                      "concurrency = 4\n"
                      "\n"
                      "[s3]\n"
                      "region = 'eu-west-1'\n"
                      "s3.endpoint = localhost:9000\n");

    EXPECT_EQ(parse_config_value(path, "downloader", "part_size"), "8M");
    EXPECT_EQ(parse_config_value(path, "downloader", "concurrency"), "4");
    EXPECT_EQ(parse_config_value(path, "s3", "region"), "eu-west-1");
    EXPECT_EQ(parse_config_value(path, "s3", "endpoint"), "localhost:9000");
    EXPECT_EQ(parse_config_value(path, "s3", "concurrency"), "");
    EXPECT_EQ(parse_config_value(dir_ / "missing.toml", "s3", "region"), "");
}

TEST_F(ConfigFileTest, LoadSettingsAppliesFileValues) {
    auto path = write("[downloader]\n"
                      "part_size = 8M\n"
                      "concurrency = 6\n"
                      "high_water_mark = 64M\n"
                      "[s3]\n"
                      "endpoint = http://localhost:9000\n"
                      "region = eu-west-1\n"
                      "use_path_style = true\n"
                      "request_timeout = 90\n"
                      "io_threads = 8\n");

    auto loaded = loadSettings(path);
    ASSERT_TRUE(loaded);
    const auto& s = loaded.value();
    EXPECT_EQ(s.downloader.partSizeBytes.value_or(0), 8 * 1024 * 1024);
    EXPECT_EQ(s.downloader.concurrency.value_or(0), 6);
    EXPECT_EQ(s.downloader.highWaterMarkBytes, 64u * 1024u * 1024u);
    EXPECT_EQ(s.s3.endpoint, "http://localhost:9000");
    EXPECT_EQ(s.s3.region, "eu-west-1");
    EXPECT_TRUE(s.s3.usePathStyle);
    EXPECT_EQ(s.s3.requestTimeout, 90u);
    EXPECT_EQ(s.s3.ioThreads, 8u);
    EXPECT_EQ(s.sourcePath, path);
}

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    auto loaded = loadSettings(dir_ / "nope.toml");
    ASSERT_TRUE(loaded);
    EXPECT_FALSE(loaded.value().downloader.partSizeBytes.has_value());
    EXPECT_FALSE(loaded.value().downloader.concurrency.has_value());
    EXPECT_EQ(loaded.value().s3.endpoint, "s3.amazonaws.com");
    EXPECT_TRUE(loaded.value().sourcePath.empty());
}

TEST_F(ConfigFileTest, InvalidValueNamesTheKey) {
    auto path = write("[downloader]\nconcurrency = 0\n");
    auto loaded = loadSettings(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidConfiguration);
    EXPECT_NE(loaded.error().message.find("downloader.concurrency"), std::string::npos);

    auto badBool = loadSettings(write("[s3]\nuse_path_style = maybe\n"));
    ASSERT_FALSE(badBool);
    EXPECT_NE(badBool.error().message.find("s3.use_path_style"), std::string::npos);
}

TEST_F(ConfigFileTest, EnvironmentOverridesFile) {
    auto path = write("[downloader]\npart_size = 8M\nconcurrency = 2\n[s3]\nregion = eu-west-1\n");
    ::setenv("PARTSTREAM_PART_SIZE", "1M", 1);
    ::setenv("PARTSTREAM_CONCURRENCY", "16", 1);
    ::setenv("AWS_REGION", "us-west-2", 1);
    ::setenv("PARTSTREAM_S3_ENDPOINT", "minio.local:9000", 1);

    auto loaded = loadSettings(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().downloader.partSizeBytes.value_or(0), 1024 * 1024);
    EXPECT_EQ(loaded.value().downloader.concurrency.value_or(0), 16);
    EXPECT_EQ(loaded.value().s3.region, "us-west-2");
    EXPECT_EQ(loaded.value().s3.endpoint, "minio.local:9000");
}

TEST_F(ConfigFileTest, ConfigPathResolutionOrder) {
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), std::filesystem::path("/tmp/explicit.toml"));

    ::setenv("PARTSTREAM_CONFIG", "/tmp/from-env.toml", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/tmp/from-env.toml"));
    ::unsetenv("PARTSTREAM_CONFIG");

    EXPECT_EQ(get_config_path().filename(), "config.toml");
    EXPECT_EQ(get_config_path().parent_path().filename(), "partstream");
}

TEST(ConfigHelpersTest, ParseSizeSuffixes) {
    EXPECT_EQ(parse_size("5242880", "part_size").value(), 5242880);
    EXPECT_EQ(parse_size("512K", "part_size").value(), 512 * 1024);
    EXPECT_EQ(parse_size("5m", "part_size").value(), 5 * 1024 * 1024);
    EXPECT_EQ(parse_size(" 1G ", "part_size").value(), 1024ll * 1024ll * 1024ll);
}

TEST(ConfigHelpersTest, ParseSizeRejectsBadInput) {
    auto notNumber = parse_size("lots", "part_size");
    ASSERT_FALSE(notNumber);
    EXPECT_EQ(notNumber.error().code, ErrorCode::InvalidConfiguration);
    EXPECT_EQ(notNumber.error().message, "part_size must be a number, got 'lots'");

    auto zero = parse_size("0", "part_size");
    ASSERT_FALSE(zero);
    EXPECT_EQ(zero.error().message, "part_size must be a positive number");

    EXPECT_FALSE(parse_size("-4M", "part_size"));
    EXPECT_FALSE(parse_size("", "part_size"));
    EXPECT_FALSE(parse_size("K", "part_size"));
    EXPECT_FALSE(parse_size("99999999999G", "part_size"));
}

TEST(ConfigHelpersTest, ParsePositiveIntAndBool) {
    EXPECT_EQ(parse_positive_int("8", "concurrency").value(), 8);
    EXPECT_FALSE(parse_positive_int("0", "concurrency"));
    EXPECT_FALSE(parse_positive_int("2.5", "concurrency"));

    EXPECT_TRUE(parse_bool("Yes", "flag").value());
    EXPECT_FALSE(parse_bool("off", "flag").value());
    EXPECT_FALSE(parse_bool("sure", "flag"));
}
