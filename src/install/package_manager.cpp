#include <provision/install/package_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace provision::install {

namespace {

constexpr std::size_t kMaxErrorDetail = 2000;

struct ManagerEntry {
    PackageManager manager;
    std::string_view name;
    std::string_view alias;
};

const ManagerEntry kManagers[] = {
    {PackageManager::Apt, "apt", "apt-get"},
    {PackageManager::Dnf, "dnf"},
    {PackageManager::Yum, "yum"},
    {PackageManager::Pacman, "pacman"},
    {PackageManager::Zypper, "zypper"},
    {PackageManager::Apk, "apk"},
    {PackageManager::Brew, "brew", "homebrew"},
    {PackageManager::MacPorts, "macports", "port"},
    {PackageManager::Chocolatey, "choco", "chocolatey"},
    {PackageManager::Winget, "winget"},
    {PackageManager::Scoop, "scoop"},
};

// Argv template without privilege prefix; nullopt for values outside the enum.
std::optional<std::vector<std::string>> commandTemplate(PackageManager manager,
                                                        const std::string& package) {
    switch (manager) {
        case PackageManager::Apt:
            return std::vector<std::string>{"apt-get", "install", "-y", package};
        case PackageManager::Dnf:
            return std::vector<std::string>{"dnf", "install", "-y", package};
        case PackageManager::Yum:
            return std::vector<std::string>{"yum", "install", "-y", package};
        case PackageManager::Pacman:
            return std::vector<std::string>{"pacman", "-S", "--noconfirm", "--needed", package};
        case PackageManager::Zypper:
            return std::vector<std::string>{"zypper", "--non-interactive", "install", package};
        case PackageManager::Apk:
            return std::vector<std::string>{"apk", "add", package};
        case PackageManager::Brew:
            return std::vector<std::string>{"brew", "install", package};
        case PackageManager::MacPorts:
            return std::vector<std::string>{"port", "-N", "install", package};
        case PackageManager::Chocolatey:
            return std::vector<std::string>{"choco", "install", package, "-y"};
        case PackageManager::Winget:
            return std::vector<std::string>{"winget",
                                            "install",
                                            "--id",
                                            package,
                                            "-e",
                                            "--accept-source-agreements",
                                            "--accept-package-agreements"};
        case PackageManager::Scoop:
            return std::vector<std::string>{"scoop", "install", package};
    }
    return std::nullopt;
}

bool needsElevationPrefix() {
#ifdef _WIN32
    return false;
#else
    return ::geteuid() != 0;
#endif
}

std::string tailOf(std::string text) {
    config::trim(text);
    if (text.size() > kMaxErrorDetail) {
        text = "..." + text.substr(text.size() - kMaxErrorDetail);
    }
    return text;
}

std::string lowercase(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string_view packageManagerName(PackageManager manager) noexcept {
    for (const auto& entry : kManagers) {
        if (entry.manager == manager) {
            return entry.name;
        }
    }
    return "unknown";
}

Result<PackageManager> parsePackageManager(std::string_view name) {
    std::string key = lowercase(name);
    config::trim(key);
    for (const auto& entry : kManagers) {
        if (entry.name == key) {
            return entry.manager;
        }
        if (!entry.alias.empty() && entry.alias == key) {
            return entry.manager;
        }
    }
    return Error{ErrorCode::UnknownManager, "Unknown package manager: '" + std::string(name) + "'"};
}

std::vector<PackageManager> platformPackageManagers() {
#if defined(__APPLE__)
    return {PackageManager::Brew, PackageManager::MacPorts};
#elif defined(_WIN32)
    return {PackageManager::Winget, PackageManager::Chocolatey, PackageManager::Scoop};
#elif defined(__linux__)
    return {PackageManager::Apt,    PackageManager::Dnf,    PackageManager::Yum,
            PackageManager::Pacman, PackageManager::Zypper, PackageManager::Apk,
            PackageManager::Brew};
#else
    return {};
#endif
}

std::string manualInstallHint(PackageManager manager, const std::string& package,
                              bool requiresPrivilege) {
    auto argv = commandTemplate(manager, package);
    if (!argv) {
        return {};
    }
    std::string hint = requiresPrivilege && needsElevationPrefix() ? "sudo " : "";
    for (std::size_t i = 0; i < argv->size(); ++i) {
        if (i > 0)
            hint.push_back(' ');
        hint += (*argv)[i];
    }
    return hint;
}

PackageManagerAdapter::PackageManagerAdapter(std::shared_ptr<process::ICommandRunner> runner,
                                             EnvironmentProbe probe,
                                             std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), probe_(std::move(probe)), timeout_(timeout) {}

Result<std::vector<std::string>>
PackageManagerAdapter::installCommand(PackageManager manager, const std::string& package,
                                      bool requiresPrivilege) const {
    auto argv = commandTemplate(manager, package);
    if (!argv) {
        return Error{ErrorCode::UnknownManager,
                     "No install command for package manager id " +
                         std::to_string(static_cast<int>(manager))};
    }
    if (requiresPrivilege && needsElevationPrefix()) {
        argv->insert(argv->begin(), "sudo");
    }
    return std::move(*argv);
}

Result<PackageInstallOutcome> PackageManagerAdapter::installPackage(std::string_view manager,
                                                                    const std::string& package,
                                                                    bool requiresPrivilege) {
    auto parsed = parsePackageManager(manager);
    if (!parsed) {
        return parsed.error();
    }
    return installPackage(parsed.value(), package, requiresPrivilege);
}

Result<PackageInstallOutcome> PackageManagerAdapter::installPackage(PackageManager manager,
                                                                    const std::string& package,
                                                                    bool requiresPrivilege) {
    if (package.empty()) {
        return Error{ErrorCode::InvalidArgument, "Package name is empty"};
    }

    auto argv = installCommand(manager, package, requiresPrivilege);
    if (!argv) {
        return argv.error();
    }

    if (requiresPrivilege && probe_.isCiEnvironment()) {
        spdlog::warn("[PackageManager] CI environment detected; not running privileged install of "
                     "'{}' via {}",
                     package, packageManagerName(manager));
        PackageInstallOutcome outcome;
        outcome.skipped =
            Error{ErrorCode::SkippedCiPrivilege,
                  "Skipped privileged install of '" + package + "' via " +
                      std::string(packageManagerName(manager)) + " in CI environment"};
        return outcome;
    }

    process::CommandSpec spec;
    spec.argv = std::move(argv).value();
    spec.timeout = timeout_;
    if (manager == PackageManager::Apt) {
        spec.with_env("DEBIAN_FRONTEND", "noninteractive");
    } else if (manager == PackageManager::Brew) {
        spec.with_env("HOMEBREW_NO_AUTO_UPDATE", "1");
    }

    spdlog::info("[PackageManager] Installing '{}' with {}", package, packageManagerName(manager));
    auto run = runner_->run(spec);
    if (!run) {
        const auto& err = run.error();
        if (err.code == ErrorCode::NotFound) {
            return Error{ErrorCode::PackageManagerUnavailable, err.message};
        }
        return Error{ErrorCode::ExecutionError, err.message};
    }

    const auto& out = run.value();
    if (out.timedOut) {
        return Error{ErrorCode::Timeout,
                     process::describe(spec) + " timed out after " +
                         std::to_string(std::chrono::duration_cast<std::chrono::seconds>(timeout_)
                                            .count()) +
                         "s"};
    }
    if (out.exitCode != 0) {
        std::string detail = tailOf(out.stderrText);
        if (detail.empty()) {
            detail = "exit " + std::to_string(out.exitCode);
        }
        spdlog::debug("[PackageManager] {} failed (exit {}): {}", process::describe(spec),
                      out.exitCode, detail);
        return Error{ErrorCode::CommandFailed, detail};
    }

    PackageInstallOutcome outcome;
    outcome.installed = true;
    outcome.stdoutText = out.stdoutText;
    return outcome;
}

Result<PackageManager> PackageManagerAdapter::detectPackageManager() const {
    auto candidates = platformPackageManagers();
    if (candidates.empty()) {
        return Error{ErrorCode::PlatformUnsupported,
                     "No supported package manager is known for this platform"};
    }
    for (auto manager : candidates) {
        if (isAvailable(manager)) {
            spdlog::debug("[PackageManager] Detected {}", packageManagerName(manager));
            return manager;
        }
    }
    return Error{ErrorCode::PackageManagerUnavailable,
                 "None of the supported package managers were found on PATH"};
}

bool PackageManagerAdapter::isAvailable(PackageManager manager) const {
    auto argv = commandTemplate(manager, "");
    return argv && runner_->findExecutable(argv->front()).has_value();
}

} // namespace provision::install
