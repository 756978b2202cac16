#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <provision/core/types.h>
#include <provision/install/environment_probe.h>
#include <provision/process/command_runner.h>

namespace provision::install {

enum class PackageManager : uint8_t {
    Apt,
    Dnf,
    Yum,
    Pacman,
    Zypper,
    Apk,
    Brew,
    MacPorts,
    Chocolatey,
    Winget,
    Scoop,
};

/// Canonical lowercase name ("apt", "brew", ...).
std::string_view packageManagerName(PackageManager manager) noexcept;

/// Accepts canonical names and common aliases ("apt-get", "choco", "port").
Result<PackageManager> parsePackageManager(std::string_view name);

/// Managers probed on the current platform, in preference order. Empty when unsupported.
std::vector<PackageManager> platformPackageManagers();

struct PackageInstallOutcome {
    bool installed{false};
    /// Set when nothing was executed, e.g. ErrorCode::SkippedCiPrivilege.
    std::optional<Error> skipped;
    std::string stdoutText;
};

/**
 * @brief Maps (manager, package, privilege) to an argv and runs it.
 *
 * Privileged installs are never started inside CI: the call returns a
 * skipped outcome without touching the command runner. Every invocation is
 * bounded by the configured timeout and attempted exactly once.
 */
class PackageManagerAdapter {
public:
    PackageManagerAdapter(std::shared_ptr<process::ICommandRunner> runner, EnvironmentProbe probe,
                          std::chrono::milliseconds timeout = std::chrono::seconds{300});

    Result<PackageInstallOutcome> installPackage(PackageManager manager, const std::string& package,
                                                 bool requiresPrivilege);

    Result<PackageInstallOutcome> installPackage(std::string_view manager,
                                                 const std::string& package,
                                                 bool requiresPrivilege);

    /// Full argv that installPackage would run, privilege prefix included.
    Result<std::vector<std::string>> installCommand(PackageManager manager,
                                                    const std::string& package,
                                                    bool requiresPrivilege) const;

    /**
     * @brief First platform manager present on PATH.
     * @return PlatformUnsupported when the platform has no known manager,
     *         PackageManagerUnavailable when none of them is installed
     */
    Result<PackageManager> detectPackageManager() const;

    /// Whether the manager's executable is on PATH.
    bool isAvailable(PackageManager manager) const;

private:
    std::shared_ptr<process::ICommandRunner> runner_;
    EnvironmentProbe probe_;
    std::chrono::milliseconds timeout_;
};

/// One-line command a user can run by hand, e.g. "sudo apt-get install -y radare2".
std::string manualInstallHint(PackageManager manager, const std::string& package,
                              bool requiresPrivilege);

} // namespace provision::install
