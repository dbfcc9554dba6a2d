#include "config.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>
#include <stdlib.h>

#include <stdexcept>
#include <string>

#include "test_util.hpp"

namespace sd {

namespace fs = std::filesystem;

// Clears the environment overrides for the duration of a test
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnv) ::unsetenv(name);
    }
    void TearDown() override {
        for (const char* name : kEnv) ::unsetenv(name);
    }

    static constexpr const char* kEnv[] = {"SERVE_DIR_ROOT", "SERVE_DIR_PORT", "SERVE_DIR_BIND", "LOG_LEVEL"};
    test::ScopedTempDir tmpDir;
};

TEST_F(ConfigTest, DefaultsMatchCommandLineDefaults) {
    AppConfig cfg = default_config();
    EXPECT_EQ(cfg.server.port, 8080);
    EXPECT_EQ(cfg.server.root_directory, ".");
    EXPECT_EQ(cfg.server.index_file, "index.html");
    EXPECT_EQ(cfg.server.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.access_log.enabled);
}

TEST_F(ConfigTest, LoadsYamlAndKeepsMissingDefaults) {
    auto path = tmpDir.write("serve.yaml",
                             "server:\n"
                             "  root: /srv/www\n"
                             "  port: 9000\n"
                             "logging:\n"
                             "  level: debug\n"
                             "access_log:\n"
                             "  enabled: false\n");

    AppConfig cfg = load_config(path.string());

    EXPECT_EQ(cfg.server.root_directory, "/srv/www");
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.index_file, "index.html");
    EXPECT_EQ(cfg.server.max_header_bytes, 8192u);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_FALSE(cfg.access_log.enabled);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = tmpDir.write("serve.yaml", "server:\n  port: 9000\n");
    ::setenv("SERVE_DIR_PORT", "9100", 1);
    ::setenv("SERVE_DIR_ROOT", "/tmp", 1);
    ::setenv("LOG_LEVEL", "warn", 1);

    AppConfig cfg = load_config(path.string());

    EXPECT_EQ(cfg.server.port, 9100);
    EXPECT_EQ(cfg.server.root_directory, "/tmp");
    EXPECT_EQ(cfg.logging.level, "warn");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(load_config((tmpDir.path() / "absent.yaml").string()), std::runtime_error);
}

TEST_F(ConfigTest, OutOfRangePortThrows) {
    auto path = tmpDir.write("serve.yaml", "server:\n  port: 70000\n");
    EXPECT_THROW(load_config(path.string()), std::runtime_error);

    ::setenv("SERVE_DIR_PORT", "0", 1);
    EXPECT_THROW(default_config(), std::runtime_error);
}

TEST_F(ConfigTest, ValidateCanonicalizesRoot) {
    tmpDir.mkdir("public");
    AppConfig cfg;
    cfg.server.root_directory = (tmpDir.path() / "public" / ".." / "public").string();

    validate_config(cfg);

    EXPECT_EQ(cfg.server.root_directory, (tmpDir.path() / "public").string());
}

TEST_F(ConfigTest, ValidateRejectsMissingOrFileRoot) {
    AppConfig missing;
    missing.server.root_directory = (tmpDir.path() / "nope").string();
    EXPECT_THROW(validate_config(missing), std::runtime_error);

    AppConfig file;
    file.server.root_directory = tmpDir.write("plain.txt", "x").string();
    try {
        validate_config(file);
        FAIL() << "expected a non-directory root to be rejected";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("is not a directory"), std::string::npos);
    }
}

TEST_F(ConfigTest, ValidateRejectsBadIndexFile) {
    AppConfig cfg;
    cfg.server.root_directory = tmpDir.str();
    cfg.server.index_file = "../index.html";
    EXPECT_THROW(validate_config(cfg), std::runtime_error);
}

TEST(ParseLevelTest, KnownAndUnknownLevels) {
    EXPECT_EQ(parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_level("loud"), spdlog::level::info);
}

TEST(AccessLoggerTest, DisabledLoggerDropsEverything) {
    AccessLogConfig cfg;
    cfg.enabled = false;
    auto logger = make_access_logger(cfg);
    EXPECT_FALSE(logger->should_log(spdlog::level::info));
    EXPECT_EQ(logger->name(), "access");
}

} // namespace sd
