#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <provision/config/config_helpers.h>

namespace provision::config {

/**
 * @brief Tunables for automatic tool installation.
 *
 * Resolution order: built-in defaults, then the `[install]` section of
 * config.toml, then environment overrides.
 *
 * ```toml
 * [install]
 * auto_install = true
 * command_timeout_seconds = 300
 * verify_timeout_seconds = 5
 * package_manager = "apt"
 * ```
 */
struct InstallerConfig {
    static constexpr std::chrono::seconds kDefaultCommandTimeout{300};
    static constexpr std::chrono::seconds kDefaultVerifyTimeout{5};

    bool autoInstall{true};
    std::chrono::seconds commandTimeout{kDefaultCommandTimeout};
    std::chrono::seconds verifyTimeout{kDefaultVerifyTimeout};
    /// Package manager name forced by config or PROVISION_PACKAGE_MANAGER.
    std::optional<std::string> preferredManager;
};

/**
 * @brief Load the installer configuration.
 * @param configPath Explicit config.toml; empty uses get_config_path()
 * @param env Environment lookup; empty reads the process environment
 */
InstallerConfig loadInstallerConfig(const std::filesystem::path& configPath = {},
                                    EnvLookup env = {});

} // namespace provision::config
