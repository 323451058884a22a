#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    isoboot::Config cfg;
    EXPECT_EQ(cfg.system_disk, "/dev/sda");
    EXPECT_EQ(cfg.device_pattern, "^/dev/sd[a-z]$");
    EXPECT_EQ(cfg.image_extension, ".iso");
    EXPECT_EQ(cfg.download_dir, "~/Downloads");
    EXPECT_EQ(cfg.block_size_bytes, 4u * 1024u * 1024u);
    EXPECT_EQ(cfg.fsync_interval_bytes, 64u * 1024u * 1024u);
    EXPECT_EQ(cfg.write_backend, isoboot::WriteBackend::Auto);
    EXPECT_EQ(cfg.mount_table, "/proc/self/mounts");
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, LoadsEveryKey) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, R"({
        "SystemDisk": "/dev/nvme0n1",
        "DevicePattern": "^/dev/sd[c-z]$",
        "ImageExtension": ".img",
        "DownloadDir": "/srv/images",
        "BlockSizeBytes": 1048576,
        "FsyncIntervalBytes": 0,
        "WriteBackend": "DD",
        "MountTable": "/etc/mtab",
        "LogLevel": "debug"
    })");

    isoboot::Config cfg;
    auto res = isoboot::Config::LoadFromFile(path, cfg);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(cfg.system_disk, "/dev/nvme0n1");
    EXPECT_EQ(cfg.device_pattern, "^/dev/sd[c-z]$");
    EXPECT_EQ(cfg.image_extension, ".img");
    EXPECT_EQ(cfg.download_dir, "/srv/images");
    EXPECT_EQ(cfg.block_size_bytes, 1048576u);
    EXPECT_EQ(cfg.fsync_interval_bytes, 0u);
    EXPECT_EQ(cfg.write_backend, isoboot::WriteBackend::Dd);
    EXPECT_EQ(cfg.mount_table, "/etc/mtab");
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, isoboot::LogLevel::Debug);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, R"({"SystemDisk": "/dev/sdz"})");

    isoboot::Config cfg;
    ASSERT_TRUE(isoboot::Config::LoadFromFile(path, cfg).is_ok());
    EXPECT_EQ(cfg.system_disk, "/dev/sdz");
    EXPECT_EQ(cfg.image_extension, ".iso");
    EXPECT_EQ(cfg.block_size_bytes, 4u * 1024u * 1024u);
}

TEST(ConfigTest, AcceptsLargestBlockSizeAndFullRangeInterval) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, R"({"BlockSizeBytes": 1073741824, "FsyncIntervalBytes": 18446744073709551615})");

    isoboot::Config cfg;
    auto res = isoboot::Config::LoadFromFile(path, cfg);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(cfg.block_size_bytes, 1073741824u);
    EXPECT_EQ(cfg.fsync_interval_bytes, 18446744073709551615ULL);
}

TEST(ConfigTest, MissingFileIsIoError) {
    isoboot::Config cfg;
    cfg.system_disk = "changed";
    auto res = isoboot::Config::LoadFromFile("/nonexistent/isoboot.json", cfg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, isoboot::ErrorKind::IoError);
    EXPECT_EQ(cfg.system_disk, "/dev/sda");
}

TEST(ConfigTest, InvalidJsonIsRejected) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, "{ not json");

    isoboot::Config cfg;
    EXPECT_FALSE(isoboot::Config::LoadFromFile(path, cfg).is_ok());
}

TEST(ConfigTest, NonObjectRootIsRejected) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, "[1, 2]");

    isoboot::Config cfg;
    EXPECT_FALSE(isoboot::Config::LoadFromFile(path, cfg).is_ok());
}

struct BadConfigCase {
    const char* json;
    const char* expected_fragment;
};

class ConfigValidationTest : public ::testing::TestWithParam<BadConfigCase> {};

TEST_P(ConfigValidationTest, RejectsAndResetsToDefaults) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("isoboot.json");
    testutil::WriteFile(path, GetParam().json);

    isoboot::Config cfg;
    auto res = isoboot::Config::LoadFromFile(path, cfg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, isoboot::ErrorKind::ValidationRejected);
    EXPECT_NE(res.msg.find(GetParam().expected_fragment), std::string::npos) << res.msg;
    EXPECT_NE(res.msg.find(path), std::string::npos);
    EXPECT_EQ(cfg.device_pattern, "^/dev/sd[a-z]$");
}

INSTANTIATE_TEST_SUITE_P(
    BadValues,
    ConfigValidationTest,
    ::testing::Values(BadConfigCase{R"({"SystemDisk": 5})", "SystemDisk must be a string"},
                      BadConfigCase{R"({"SystemDisk": ""})", "SystemDisk must not be empty"},
                      BadConfigCase{R"({"ImageExtension": ""})", "ImageExtension must not be empty"},
                      BadConfigCase{R"({"DownloadDir": ""})", "DownloadDir must not be empty"},
                      BadConfigCase{R"({"BlockSizeBytes": 0})", "BlockSizeBytes must be greater than zero"},
                      BadConfigCase{R"({"BlockSizeBytes": "4M"})", "BlockSizeBytes must be an integer"},
                      BadConfigCase{R"({"BlockSizeBytes": 1073741825})", "BlockSizeBytes must not exceed"},
                      BadConfigCase{R"({"BlockSizeBytes": 18446744073709551615})", "BlockSizeBytes must not exceed"},
                      BadConfigCase{R"({"FsyncIntervalBytes": -1})", "must not be negative"},
                      BadConfigCase{R"({"DevicePattern": "^/dev/sd[b-z$"})", "DevicePattern"},
                      BadConfigCase{R"({"WriteBackend": "rsync"})", "WriteBackend"},
                      BadConfigCase{R"({"LogLevel": "loud"})", "LogLevel"}));

TEST(ConfigTest, ConfigPathFromEnvironment) {
    EXPECT_EQ(isoboot::ConfigPathFromEnvironment(testutil::MapEnv({})), isoboot::kDefaultConfigPath);
    EXPECT_EQ(isoboot::ConfigPathFromEnvironment(testutil::MapEnv({{"ISOBOOT_CONFIG", ""}})),
              isoboot::kDefaultConfigPath);
    EXPECT_EQ(isoboot::ConfigPathFromEnvironment(testutil::MapEnv({{"ISOBOOT_CONFIG", "/tmp/x.json"}})),
              "/tmp/x.json");
}

TEST(ConfigTest, ResolveWriteBackend) {
    using isoboot::WriteBackend;
    EXPECT_EQ(isoboot::ResolveWriteBackend(WriteBackend::Auto, true), WriteBackend::Direct);
    EXPECT_EQ(isoboot::ResolveWriteBackend(WriteBackend::Auto, false), WriteBackend::Dd);
    EXPECT_EQ(isoboot::ResolveWriteBackend(WriteBackend::Direct, true), WriteBackend::Direct);
    EXPECT_EQ(isoboot::ResolveWriteBackend(WriteBackend::Direct, false), WriteBackend::Dd);
    EXPECT_EQ(isoboot::ResolveWriteBackend(WriteBackend::Dd, true), WriteBackend::Dd);
}

TEST(ConfigTest, ParseLogLevel) {
    EXPECT_EQ(isoboot::ParseLogLevel("DEBUG"), isoboot::LogLevel::Debug);
    EXPECT_EQ(isoboot::ParseLogLevel("warning"), isoboot::LogLevel::Warn);
    EXPECT_EQ(isoboot::ParseLogLevel("none"), isoboot::LogLevel::None);
    EXPECT_FALSE(isoboot::ParseLogLevel("verbose").has_value());
}
