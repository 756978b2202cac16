#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <provision/config/installer_config.h>
#include <provision/core/clock.h>
#include <provision/install/environment_probe.h>
#include <provision/install/install_verifier.h>
#include <provision/install/installation_state.h>
#include <provision/install/package_manager.h>

namespace provision::install {

struct PackageSpec {
    std::string name;
    bool requiresPrivilege{true};
};

/**
 * @brief The external tool to provision.
 *
 * Example: radare2, probed with `r2 -v`, falling back to objdump while the
 * install runs.
 */
struct ToolRequirement {
    std::string displayName;
    std::string binary;
    std::vector<std::string> probeArgs{"--version"};
    std::string expectedMarker;
    std::optional<std::string> fallbackBinary;
    std::map<PackageManager, PackageSpec> packages;
};

struct ToolHandle {
    std::string name;
    std::filesystem::path executable;
};

enum class InstallMode : uint8_t {
    Skipped,        ///< Auto-install disabled; guidance logged only
    AlreadyRunning, ///< Another attempt is in progress
    Foreground,     ///< Ran inline on the caller's thread
    Background,     ///< Posted to the installer's worker
};

/**
 * @brief Installs a missing tool and tracks the attempt.
 *
 * One attempt at a time per instance. With a fallback tool on PATH the
 * attempt runs on a dedicated background worker and can be cancelled
 * cooperatively; without one it runs inline and cannot be cancelled.
 *
 * All attempt state lives in one InstallationState guarded by one mutex.
 * getInstallStatus() and cancelInstall() never observe a half-applied
 * transition. The worker checks for cancellation before resolving the
 * package manager, before running the install command, and after the
 * command returns; a package manager process that already started always
 * runs to completion or to its timeout.
 *
 * Post-install verification is advisory: an installed tool that fails its
 * probe still ends the attempt as Succeeded, with a warning logged.
 */
class ToolInstaller {
public:
    struct Dependencies {
        std::shared_ptr<process::ICommandRunner> runner;
        std::shared_ptr<IClock> clock;
        EnvironmentProbe probe;
        config::InstallerConfig config;
    };

    ToolInstaller(ToolRequirement requirement, Dependencies deps);

    /// Signals cancellation and joins the worker; bounded by the command timeout.
    ~ToolInstaller();

    ToolInstaller(const ToolInstaller&) = delete;
    ToolInstaller& operator=(const ToolInstaller&) = delete;
    ToolInstaller(ToolInstaller&&) = delete;
    ToolInstaller& operator=(ToolInstaller&&) = delete;

    /**
     * @brief Locate and verify the tool; start an install when it is missing.
     * @return isToolReady() after the call. Background installs return false
     *         immediately; poll getInstallStatus() and call reloadTool().
     */
    bool initialize();

    /// Entry point when the tool is known to be missing.
    InstallMode ensureInstalled();

    bool isToolReady() const;

    /**
     * @brief Re-run tool initialization after a successful install.
     * @return true when the tool is (already or now) ready
     */
    bool reloadTool();

    std::shared_ptr<const ToolHandle> toolHandle() const;

    /// True when the fallback binary is on PATH.
    bool usingFallback() const;

    /// Consistent snapshot of the current attempt; never throws.
    InstallStatus getInstallStatus() const noexcept;

    /**
     * @brief Request cooperative cancellation of a background attempt.
     * @return false when nothing is running or the attempt runs in the
     *         foreground; true once the request is recorded. Never blocks.
     */
    bool cancelInstall();

    InstallPhase phase() const;

    /// Wait for a background worker to finish. Returns true when no attempt is running.
    bool waitForCompletion(std::chrono::milliseconds timeout) const;

    const ToolRequirement& requirement() const noexcept { return requirement_; }

    /// Runs at the start of every later attempt, before its first cancellation check.
    void setWorkerStartHookForTest(std::function<void()> hook) {
        workerStartHook_ = std::move(hook);
    }

private:
    // Owned copy of everything the worker needs, taken when the attempt starts.
    struct WorkerContext {
        ToolRequirement requirement;
        std::optional<std::string> preferredManager;
        std::chrono::milliseconds verifyTimeout;
        std::function<void()> onStart;
    };

    void runAttempt(const WorkerContext& ctx) noexcept;
    void performInstall(const WorkerContext& ctx);
    Result<PackageManager> resolveManager(const WorkerContext& ctx) const;
    bool cancelledAt(const char* checkpoint);
    void finish(std::optional<Error> failure);
    void logGuidance() const;
    std::shared_ptr<const ToolHandle> locateTool() const;
    WorkerContext makeContext() const;

    ToolRequirement requirement_;
    std::shared_ptr<process::ICommandRunner> runner_;
    std::shared_ptr<IClock> clock_;
    EnvironmentProbe probe_;
    config::InstallerConfig config_;
    PackageManagerAdapter adapter_;
    InstallVerifier verifier_;
    std::function<void()> workerStartHook_;

    mutable std::mutex stateMutex_;
    InstallationState state_;

    mutable std::mutex toolMutex_;
    std::shared_ptr<const ToolHandle> tool_;

    // Declared last: joined first on destruction, while the members above are alive.
    boost::asio::thread_pool worker_{1};
};

} // namespace provision::install
