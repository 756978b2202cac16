#pragma once

#include <array>
#include <string_view>

#include <provision/config/config_helpers.h>

namespace provision::install {

/// Set to a truthy value to turn automatic installation off entirely.
inline constexpr std::string_view kDisableAutoInstallEnv = "PROVISION_NO_AUTO_INSTALL";

/// Variables whose non-empty presence marks a CI run. Unlisted CI systems are not detected.
inline constexpr std::array<std::string_view, 13> kCiIndicatorEnv = {
    "CI",        "CONTINUOUS_INTEGRATION", "GITHUB_ACTIONS", "GITLAB_CI",
    "JENKINS_URL", "TRAVIS",               "CIRCLECI",       "BUILDKITE",
    "TF_BUILD",  "TEAMCITY_VERSION",       "BITBUCKET_BUILD_NUMBER", "APPVEYOR",
    "DRONE"};

/**
 * @brief Reads the environment switches that gate automatic installation.
 *
 * Both queries are side-effect free. The CI check only suppresses privileged
 * commands; it never blocks unprivileged installs.
 */
class EnvironmentProbe {
public:
    EnvironmentProbe();
    explicit EnvironmentProbe(config::EnvLookup lookup);

    bool isAutoInstallDisabled() const;
    bool isCiEnvironment() const;

private:
    config::EnvLookup lookup_;
};

} // namespace provision::install
