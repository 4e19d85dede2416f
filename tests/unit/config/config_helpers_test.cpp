#include <gtest/gtest.h>
#include <dlcore/config/config_helpers.h>

#include "common/test_helpers.h"

#include <cstdlib>
#include <optional>
#include <string>

using namespace dlcore;
using namespace dlcore::config;

namespace {

// Saves an environment variable and restores it on scope exit.
class EnvGuard {
public:
    explicit EnvGuard(const char* name) : name_(name) {
        if (const char* v = std::getenv(name))
            saved_ = v;
    }
    ~EnvGuard() {
        if (saved_)
            ::setenv(name_, saved_->c_str(), 1);
        else
            ::unsetenv(name_);
    }
    void set(const std::string& value) { ::setenv(name_, value.c_str(), 1); }
    void unset() { ::unsetenv(name_); }

private:
    const char* name_;
    std::optional<std::string> saved_;
};

} // namespace

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override {
        downloadDirEnv_.unset();
        logLevelEnv_.unset();
        configEnv_.unset();
        dataDirEnv_.set((dir_.path / "data").string());
    }

    std::filesystem::path writeConfig(const std::string& body) {
        return tests::write_file(dir_.path / "config.toml", body);
    }

    tests::TempDir dir_{"dlcore_cfg_"};
    EnvGuard downloadDirEnv_{"DLCORE_DOWNLOAD_DIR"};
    EnvGuard logLevelEnv_{"DLCORE_LOG_LEVEL"};
    EnvGuard configEnv_{"DLCORE_CONFIG"};
    EnvGuard dataDirEnv_{"DLCORE_DATA_DIR"};
};

TEST(ConfigStringHelpersTest, TrimAndUnquote) {
    std::string s = "  padded \t";
    trim(s);
    EXPECT_EQ(s, "padded");
    EXPECT_EQ(unquote("\"quoted value\""), "quoted value");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
}

TEST(ConfigStringHelpersTest, TildeExpansion) {
    EnvGuard home("HOME");
    home.set("/home/tester");
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("~/Downloads"), std::filesystem::path("/home/tester/Downloads"));
    EXPECT_EQ(expand_tilde("~other/x"), std::filesystem::path("~other/x"));
    EXPECT_EQ(expand_tilde("/abs/path"), std::filesystem::path("/abs/path"));
}

TEST(ConfigStringHelpersTest, NumberAndBoolParsing) {
    EXPECT_EQ(parse_uint("65536"), std::optional<std::uint64_t>{65536});
    EXPECT_EQ(parse_uint("0"), std::optional<std::uint64_t>{0});
    EXPECT_FALSE(parse_uint("").has_value());
    EXPECT_FALSE(parse_uint("-1").has_value());
    EXPECT_FALSE(parse_uint("12kb").has_value());

    EXPECT_EQ(parse_bool("TRUE"), std::optional<bool>{true});
    EXPECT_EQ(parse_bool("yes"), std::optional<bool>{true});
    EXPECT_EQ(parse_bool("off"), std::optional<bool>{false});
    EXPECT_EQ(parse_bool("0"), std::optional<bool>{false});
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST_F(ConfigHelpersTest, ConfigPathResolution) {
    EXPECT_EQ(get_config_path("/explicit/config.toml"),
              std::filesystem::path("/explicit/config.toml"));

    configEnv_.set("/from/env.toml");
    EXPECT_EQ(get_config_path(), std::filesystem::path("/from/env.toml"));

    configEnv_.unset();
    EnvGuard xdg("XDG_CONFIG_HOME");
    xdg.set("/xdg/config");
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/config/dlcore/config.toml"));
}

TEST_F(ConfigHelpersTest, DataAndDownloadDirs) {
    EXPECT_EQ(get_data_dir(), dir_.path / "data");

    downloadDirEnv_.set("/srv/downloads");
    EXPECT_EQ(get_default_download_dir(), std::filesystem::path("/srv/downloads"));

    downloadDirEnv_.unset();
    EnvGuard home("HOME");
    home.set("/home/tester");
    EXPECT_EQ(get_default_download_dir(), std::filesystem::path("/home/tester/Downloads/dlcore"));
}

TEST_F(ConfigHelpersTest, ParseConfigValueReadsSectionsAndComments) {
    auto path = writeConfig(R"(# top comment
[downloader]
download_dir = "/data/dl"   # trailing comment
user_agent = "agent # not a comment"

[storage]
backend = json
)");
    EXPECT_EQ(parse_config_value(path, "downloader", "download_dir"), "/data/dl");
    EXPECT_EQ(parse_config_value(path, "downloader", "user_agent"), "agent # not a comment");
    EXPECT_EQ(parse_config_value(path, "storage", "backend"), "json");
    EXPECT_EQ(parse_config_value(path, "storage", "missing"), "");
    EXPECT_EQ(parse_config_value(dir_.path / "nope.toml", "storage", "backend"), "");
}

TEST_F(ConfigHelpersTest, MissingFileYieldsDefaults) {
    auto cfg = load_config((dir_.path / "absent.toml").string());
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg.value().storage.backend, downloader::StoreBackend::Sqlite);
    EXPECT_EQ(cfg.value().storage.path, dir_.path / "data" / "tasks.db");
    EXPECT_EQ(cfg.value().downloader.chunkSizeBytes, DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(cfg.value().downloader.speedWindow, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.value().downloader.userAgent.rfind("dlcore/", 0), 0u);
    EXPECT_EQ(cfg.value().logging.level, "info");
}

TEST_F(ConfigHelpersTest, LoadsAllSections) {
    auto path = writeConfig(R"(
[downloader]
download_dir = "/data/dl"
chunk_size_bytes = 131072
connect_timeout_ms = 5000
low_speed_timeout_ms = 60000
speed_window_ms = 2000
persist_interval_ms = 250
rate_limit_bps = 1048576
per_task_rate_limit_bps = 65536
user_agent = "custom/1.0"
proxy = "http://proxy.local:3128"
tls_insecure = true
ca_path = "/etc/ssl/custom.pem"

[storage]
backend = "JSON"

[logging]
level = debug
file = "/var/log/dlcore.log"
max_size_mb = 2
max_files = 3
)");
    auto result = load_config(path.string());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& cfg = result.value();
    const auto& d = cfg.downloader;
    EXPECT_EQ(cfg.sourcePath, path);
    EXPECT_EQ(d.downloadDir, std::filesystem::path("/data/dl"));
    EXPECT_EQ(d.chunkSizeBytes, 131072u);
    EXPECT_EQ(d.connectTimeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(d.lowSpeedTimeout, std::chrono::milliseconds(60000));
    EXPECT_EQ(d.speedWindow, std::chrono::milliseconds(2000));
    EXPECT_EQ(d.persistInterval, std::chrono::milliseconds(250));
    EXPECT_EQ(d.globalRateLimitBps, 1048576u);
    EXPECT_EQ(d.perTaskRateLimitBps, 65536u);
    EXPECT_EQ(d.userAgent, "custom/1.0");
    ASSERT_TRUE(d.proxy.has_value());
    EXPECT_EQ(*d.proxy, "http://proxy.local:3128");
    EXPECT_TRUE(d.tls.insecure);
    EXPECT_EQ(d.tls.caPath, "/etc/ssl/custom.pem");

    EXPECT_EQ(cfg.storage.backend, downloader::StoreBackend::Json);
    EXPECT_EQ(cfg.storage.path, dir_.path / "data" / "tasks.json");

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, std::filesystem::path("/var/log/dlcore.log"));
    EXPECT_EQ(cfg.logging.maxFileBytes, 2u * 1024 * 1024);
    EXPECT_EQ(cfg.logging.maxFiles, 3u);
}

TEST_F(ConfigHelpersTest, DottedKeysOutsideSections) {
    auto path = writeConfig("storage.backend = memory\ndownloader.chunk_size_bytes = 4096\n");
    auto result = load_config(path.string());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().storage.backend, downloader::StoreBackend::Memory);
    EXPECT_EQ(result.value().downloader.chunkSizeBytes, 4096u);
}

TEST_F(ConfigHelpersTest, EnvironmentOverridesFile) {
    auto path = writeConfig(R"(
[downloader]
download_dir = "/from/file"
[logging]
level = "warn"
)");
    downloadDirEnv_.set("/from/env");
    logLevelEnv_.set("trace");

    auto result = load_config(path.string());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().downloader.downloadDir, std::filesystem::path("/from/env"));
    EXPECT_EQ(result.value().logging.level, "trace");
}

TEST_F(ConfigHelpersTest, ConfigFromEnvironmentVariable) {
    auto path = writeConfig("[storage]\nbackend = memory\n");
    configEnv_.set(path.string());
    auto result = load_config();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().storage.backend, downloader::StoreBackend::Memory);
}

TEST_F(ConfigHelpersTest, MalformedNumberNamesKey) {
    auto path = writeConfig("[downloader]\nconnect_timeout_ms = soon\n");
    auto result = load_config(path.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(result.error().message.find("downloader.connect_timeout_ms"), std::string::npos);
}

TEST_F(ConfigHelpersTest, MalformedBoolRejected) {
    auto path = writeConfig("[downloader]\ntls_insecure = sometimes\n");
    auto result = load_config(path.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigHelpersTest, ChunkSizeOutOfRangeRejected) {
    auto path = writeConfig("[downloader]\nchunk_size_bytes = 16\n");
    auto result = load_config(path.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigHelpersTest, ZeroSpeedWindowRejected) {
    auto path = writeConfig("[downloader]\nspeed_window_ms = 0\n");
    auto result = load_config(path.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigHelpersTest, UnknownBackendRejected) {
    auto path = writeConfig("[storage]\nbackend = postgres\n");
    auto result = load_config(path.string());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(result.error().message.find("postgres"), std::string::npos);
}
