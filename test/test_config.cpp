#include "config.hpp"
#include "errors.hpp"
#include "temp_tree.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

namespace {

using namespace wvb;

using testing::ElementsAre;

class TestConfig : public testing::Test {
protected:
    void SetUp() override {
        unsetenv("BRIDGE_PORT");
        unsetenv("BRIDGE_LIBRARY_ROOT");
        unsetenv("LOG_LEVEL");
    }

    void TearDown() override { SetUp(); }

    test::TempTree tree_;
};

// MARK: - Tests:

TEST_F(TestConfig, defaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.server.port, 8001);
    EXPECT_TRUE(cfg.server.directories.empty());
    EXPECT_FALSE(cfg.server.library_root.empty());
    EXPECT_TRUE(cfg.commands.builtin);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST_F(TestConfig, load_yaml) {
    const auto path = tree_.write("bridge.yaml",
        "server:\n"
        "  port: 9123\n"
        "  read_timeout_ms: 2500\n"
        "  library_root: /opt/lib\n"
        "  directories: [web, shared/web]\n"
        "commands:\n"
        "  builtin: false\n"
        "logging:\n"
        "  level: debug\n"
        "notice:\n"
        "  exempt_extensions: [.bin]\n"
        "  header_lines: 4\n");

    auto cfg = load_config(path.string());
    EXPECT_EQ(cfg.server.port, 9123);
    EXPECT_EQ(cfg.server.read_timeout_ms, 2500);
    EXPECT_EQ(cfg.server.library_root, "/opt/lib");
    EXPECT_THAT(cfg.server.directories, ElementsAre("web", "shared/web"));
    EXPECT_FALSE(cfg.commands.builtin);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_THAT(cfg.notice.exempt_extensions, ElementsAre(".bin"));
    EXPECT_EQ(cfg.notice.header_lines, 4);
    // Untouched sections keep their defaults
    EXPECT_THAT(cfg.notice.exempt_names, ElementsAre("LICENSE", ".gitignore"));
}

TEST_F(TestConfig, environment_overrides_file) {
    const auto path = tree_.write("bridge.yaml", "server:\n  port: 9123\n");
    setenv("BRIDGE_PORT", "9200", 1);
    setenv("BRIDGE_LIBRARY_ROOT", "/srv/library", 1);
    setenv("LOG_LEVEL", "warn", 1);

    auto cfg = load_config(path.string());
    EXPECT_EQ(cfg.server.port, 9200);
    EXPECT_EQ(cfg.server.library_root, "/srv/library");
    EXPECT_EQ(cfg.logging.level, "warn");
}

TEST_F(TestConfig, bad_files_are_configuration_errors) {
    EXPECT_THROW(load_config((tree_.path() / "missing.yaml").string()), ConfigurationError);

    const auto bad_value = tree_.write("bad.yaml", "server:\n  port: lots\n");
    EXPECT_THROW(load_config(bad_value.string()), ConfigurationError);

    AppConfig cfg;
    setenv("BRIDGE_PORT", "eighty", 1);
    EXPECT_THROW(apply_env_overrides(cfg), ConfigurationError);
}

TEST_F(TestConfig, server_version_token) {
    EXPECT_EQ(server_version_token(), std::string("WebViewBridge/") + WVB_VERSION);
}

} // namespace
