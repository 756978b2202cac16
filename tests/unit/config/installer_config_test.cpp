#include <gtest/gtest.h>

#include <provision/config/config_helpers.h>
#include <provision/config/installer_config.h>

#include "../../common/install_test_doubles.h"

#include <filesystem>
#include <fstream>
#include <random>

using namespace provision;
using namespace provision::config;

namespace fs = std::filesystem;

class InstallerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("provision_config_test_" + std::to_string(rd()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeConfig(const std::string& body) {
        auto path = dir_ / "config.toml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    fs::path dir_;
};

TEST_F(InstallerConfigTest, DefaultsWhenFileMissing) {
    auto cfg = loadInstallerConfig(dir_ / "missing.toml", test::envFrom({}));
    EXPECT_TRUE(cfg.autoInstall);
    EXPECT_EQ(cfg.commandTimeout, std::chrono::seconds{300});
    EXPECT_EQ(cfg.verifyTimeout, std::chrono::seconds{5});
    EXPECT_FALSE(cfg.preferredManager.has_value());
}

TEST_F(InstallerConfigTest, ReadsInstallSection) {
    auto path = writeConfig(R"(
# unrelated section first
[daemon]
auto_install = true

[install]
auto_install = false   # opt out
command_timeout_seconds = 120
verify_timeout_seconds = 9
package_manager = "dnf"
)");
    auto cfg = loadInstallerConfig(path, test::envFrom({}));
    EXPECT_FALSE(cfg.autoInstall);
    EXPECT_EQ(cfg.commandTimeout, std::chrono::seconds{120});
    EXPECT_EQ(cfg.verifyTimeout, std::chrono::seconds{9});
    ASSERT_TRUE(cfg.preferredManager.has_value());
    EXPECT_EQ(*cfg.preferredManager, "dnf");
}

TEST_F(InstallerConfigTest, InvalidNumbersKeepDefaults) {
    auto path = writeConfig("[install]\ncommand_timeout_seconds = soon\nverify_timeout_seconds = -3\n");
    auto cfg = loadInstallerConfig(path, test::envFrom({}));
    EXPECT_EQ(cfg.commandTimeout, InstallerConfig::kDefaultCommandTimeout);
    EXPECT_EQ(cfg.verifyTimeout, InstallerConfig::kDefaultVerifyTimeout);
}

TEST_F(InstallerConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[install]\npackage_manager = \"dnf\"\ncommand_timeout_seconds = 60\n");
    auto cfg = loadInstallerConfig(path, test::envFrom({{"PROVISION_PACKAGE_MANAGER", "pacman"},
                                                        {"PROVISION_COMMAND_TIMEOUT_SECONDS", "42"}}));
    ASSERT_TRUE(cfg.preferredManager.has_value());
    EXPECT_EQ(*cfg.preferredManager, "pacman");
    EXPECT_EQ(cfg.commandTimeout, std::chrono::seconds{42});
}

TEST_F(InstallerConfigTest, ConfigPathFromEnvironment) {
    auto path = writeConfig("[install]\nauto_install = off\n");
    auto cfg = loadInstallerConfig({}, test::envFrom({{"PROVISION_CONFIG", path.string()}}));
    EXPECT_FALSE(cfg.autoInstall);
}

TEST_F(InstallerConfigTest, DottedKeysAtTopLevel) {
    auto path = writeConfig("install.package_manager = 'brew'\n");
    EXPECT_EQ(parse_config_value(path, "install", "package_manager"), "brew");
}

TEST(ConfigHelpersTest, EnvTruthy) {
    EXPECT_TRUE(env_truthy("1"));
    EXPECT_TRUE(env_truthy("yes"));
    EXPECT_TRUE(env_truthy("TRUE"));
    EXPECT_FALSE(env_truthy(""));
    EXPECT_FALSE(env_truthy("0"));
    EXPECT_FALSE(env_truthy("False"));
    EXPECT_FALSE(env_truthy(" off "));
    EXPECT_FALSE(env_truthy("no"));
}

TEST(ConfigHelpersTest, UnquoteAndTrim) {
    EXPECT_EQ(unquote("  \"apt\" "), "apt");
    EXPECT_EQ(unquote("'brew'"), "brew");
    EXPECT_EQ(unquote("plain"), "plain");
}
