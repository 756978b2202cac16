#include <provision/install/tool_installer.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>

#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

namespace provision::install {

namespace {

double seconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

} // namespace

ToolInstaller::ToolInstaller(ToolRequirement requirement, Dependencies deps)
    : requirement_(std::move(requirement)),
      runner_(deps.runner ? std::move(deps.runner) : process::makeCommandRunner()),
      clock_(deps.clock ? std::move(deps.clock) : makeSystemClock()),
      probe_(std::move(deps.probe)),
      config_(std::move(deps.config)),
      adapter_(runner_, probe_, config_.commandTimeout),
      verifier_(runner_) {
    if (requirement_.binary.empty()) {
        throw std::invalid_argument("ToolRequirement.binary must not be empty");
    }
    if (requirement_.displayName.empty()) {
        requirement_.displayName = requirement_.binary;
    }
}

ToolInstaller::~ToolInstaller() {
    if (cancelInstall()) {
        spdlog::debug("[ToolInstaller] Waiting for {} install worker to stop",
                      requirement_.displayName);
    }
    worker_.join();
}

bool ToolInstaller::initialize() {
    if (isToolReady()) {
        return true;
    }

    if (auto handle = locateTool()) {
        std::lock_guard lock(toolMutex_);
        tool_ = std::move(handle);
        return true;
    }

    spdlog::info("[ToolInstaller] {} ('{}') is not available", requirement_.displayName,
                 requirement_.binary);
    (void)ensureInstalled();
    return isToolReady();
}

InstallMode ToolInstaller::ensureInstalled() {
    if (probe_.isAutoInstallDisabled() || !config_.autoInstall) {
        logGuidance();
        return InstallMode::Skipped;
    }

    const bool background = usingFallback();
    WorkerContext ctx = makeContext();

    if (background) {
        auto task = std::make_shared<std::packaged_task<void()>>(
            [this, ctx = std::move(ctx)]() { runAttempt(ctx); });
        std::shared_future<void> handle = task->get_future().share();
        {
            std::lock_guard lock(stateMutex_);
            if (state_.inProgress) {
                return InstallMode::AlreadyRunning;
            }
            state_.beginAttempt(clock_->now(), clock_->monotonicNow(), handle);
        }
        spdlog::info("[ToolInstaller] Installing {} in background; using '{}' meanwhile",
                     requirement_.displayName, requirement_.fallbackBinary.value_or(""));
        try {
            boost::asio::post(worker_, [task]() { (*task)(); });
        } catch (const std::exception& e) {
            finish(Error{ErrorCode::UnexpectedException,
                         std::string("Failed to start install worker: ") + e.what()});
        }
        return InstallMode::Background;
    }

    {
        std::lock_guard lock(stateMutex_);
        if (state_.inProgress) {
            return InstallMode::AlreadyRunning;
        }
        state_.beginAttempt(clock_->now(), clock_->monotonicNow(), std::nullopt);
    }
    spdlog::info("[ToolInstaller] Installing {} (no fallback available, waiting)",
                 requirement_.displayName);
    runAttempt(ctx);

    bool succeeded = false;
    {
        std::lock_guard lock(stateMutex_);
        succeeded = state_.outcome.value_or(false);
    }
    if (succeeded) {
        (void)reloadTool();
    }
    return InstallMode::Foreground;
}

bool ToolInstaller::isToolReady() const {
    std::lock_guard lock(toolMutex_);
    return tool_ != nullptr;
}

bool ToolInstaller::reloadTool() {
    if (isToolReady()) {
        return true;
    }
    {
        std::lock_guard lock(stateMutex_);
        if (!state_.outcome.value_or(false)) {
            return false;
        }
    }

    auto handle = locateTool();
    if (!handle) {
        spdlog::warn("[ToolInstaller] {} was installed but could not be initialized",
                     requirement_.displayName);
        return false;
    }

    std::lock_guard lock(toolMutex_);
    if (!tool_) {
        tool_ = std::move(handle);
        spdlog::info("[ToolInstaller] {} ready at {}", requirement_.displayName,
                     tool_->executable.string());
    }
    return true;
}

std::shared_ptr<const ToolHandle> ToolInstaller::toolHandle() const {
    std::lock_guard lock(toolMutex_);
    return tool_;
}

bool ToolInstaller::usingFallback() const {
    return requirement_.fallbackBinary && !requirement_.fallbackBinary->empty() &&
           runner_->findExecutable(*requirement_.fallbackBinary).has_value();
}

InstallStatus ToolInstaller::getInstallStatus() const noexcept {
    std::lock_guard lock(stateMutex_);
    return state_.snapshot(clock_->monotonicNow());
}

bool ToolInstaller::cancelInstall() {
    std::lock_guard lock(stateMutex_);
    if (!state_.inProgress) {
        return false;
    }
    if (!state_.isBackground()) {
        return false;
    }
    if (!state_.cancelRequested) {
        spdlog::info("[ToolInstaller] Cancellation of {} install requested",
                     requirement_.displayName);
    }
    state_.cancelRequested = true;
    return true;
}

InstallPhase ToolInstaller::phase() const {
    std::lock_guard lock(stateMutex_);
    return state_.phase();
}

bool ToolInstaller::waitForCompletion(std::chrono::milliseconds timeout) const {
    std::optional<std::shared_future<void>> worker;
    {
        std::lock_guard lock(stateMutex_);
        if (!state_.inProgress) {
            return true;
        }
        worker = state_.worker;
    }
    if (!worker || !worker->valid()) {
        return false;
    }
    return worker->wait_for(timeout) == std::future_status::ready;
}

ToolInstaller::WorkerContext ToolInstaller::makeContext() const {
    WorkerContext ctx;
    ctx.requirement = requirement_;
    ctx.preferredManager = config_.preferredManager;
    ctx.verifyTimeout = config_.verifyTimeout;
    ctx.onStart = workerStartHook_;
    return ctx;
}

void ToolInstaller::runAttempt(const WorkerContext& ctx) noexcept {
    try {
        if (ctx.onStart) {
            ctx.onStart();
        }
        performInstall(ctx);
    } catch (const std::exception& e) {
        finish(Error{ErrorCode::UnexpectedException, e.what()});
    } catch (...) {
        finish(Error{ErrorCode::UnexpectedException, "Unknown exception during installation"});
    }
}

void ToolInstaller::performInstall(const WorkerContext& ctx) {
    const auto& req = ctx.requirement;

    if (cancelledAt("before resolving the package manager")) {
        return;
    }

    auto manager = resolveManager(ctx);
    if (!manager) {
        finish(manager.error());
        return;
    }

    auto pkg = req.packages.find(manager.value());
    if (pkg == req.packages.end()) {
        finish(Error{ErrorCode::PackageManagerUnavailable,
                     "No " + std::string(packageManagerName(manager.value())) +
                         " package is known for " + req.displayName});
        return;
    }

    if (cancelledAt("before invoking the install command")) {
        return;
    }

    auto installed =
        adapter_.installPackage(manager.value(), pkg->second.name, pkg->second.requiresPrivilege);

    if (cancelledAt("after the install command returned")) {
        return;
    }

    if (!installed) {
        finish(installed.error());
        return;
    }
    if (installed->skipped) {
        finish(*installed->skipped);
        return;
    }

    ProbeCommand probe;
    probe.argv.push_back(req.binary);
    probe.argv.insert(probe.argv.end(), req.probeArgs.begin(), req.probeArgs.end());
    probe.expectedMarker = req.expectedMarker;
    probe.timeout = ctx.verifyTimeout;

    auto verification = verifier_.probe(probe);
    if (verification != VerificationStatus::Verified) {
        spdlog::warn("[ToolInstaller] {} installed but its probe reported '{}'; keeping the "
                     "install as succeeded",
                     req.displayName, verificationStatusName(verification));
    }

    finish(std::nullopt);
}

Result<PackageManager> ToolInstaller::resolveManager(const WorkerContext& ctx) const {
    if (!ctx.preferredManager) {
        return adapter_.detectPackageManager();
    }
    auto manager = parsePackageManager(*ctx.preferredManager);
    if (manager && !adapter_.isAvailable(manager.value())) {
        return Error{ErrorCode::PackageManagerUnavailable,
                     std::string(packageManagerName(manager.value())) + " is not on PATH"};
    }
    return manager;
}

bool ToolInstaller::cancelledAt(const char* checkpoint) {
    std::lock_guard lock(stateMutex_);
    if (!state_.cancelRequested) {
        return false;
    }
    if (state_.complete(Error{ErrorCode::Cancelled,
                              std::string("Installation cancelled ") + checkpoint},
                        clock_->monotonicNow())) {
        spdlog::warn("[ToolInstaller] {} install cancelled {} after {:.1f}s",
                     requirement_.displayName, checkpoint,
                     seconds(state_.duration.value_or(Duration::zero())));
    }
    return true;
}

void ToolInstaller::finish(std::optional<Error> failure) {
    std::lock_guard lock(stateMutex_);
    const bool ok = !failure.has_value();
    if (!state_.complete(std::move(failure), clock_->monotonicNow())) {
        return;
    }
    const double elapsed = seconds(state_.duration.value_or(Duration::zero()));
    if (ok) {
        spdlog::info("[ToolInstaller] {} installed in {:.1f}s", requirement_.displayName, elapsed);
    } else {
        spdlog::error("[ToolInstaller] {} install failed after {:.1f}s: {} ({})",
                      requirement_.displayName, elapsed, state_.error->message, state_.error->code);
    }
}

void ToolInstaller::logGuidance() const {
    std::string hint;
    Result<PackageManager> manager = config_.preferredManager
                                         ? parsePackageManager(*config_.preferredManager)
                                         : adapter_.detectPackageManager();
    if (manager) {
        if (auto pkg = requirement_.packages.find(manager.value());
            pkg != requirement_.packages.end()) {
            hint = manualInstallHint(manager.value(), pkg->second.name,
                                     pkg->second.requiresPrivilege);
        }
    }
    if (hint.empty()) {
        spdlog::warn("[ToolInstaller] Automatic installation is disabled; install {} ('{}') "
                     "with your system package manager",
                     requirement_.displayName, requirement_.binary);
    } else {
        spdlog::warn("[ToolInstaller] Automatic installation is disabled; install {} with: {}",
                     requirement_.displayName, hint);
    }
}

std::shared_ptr<const ToolHandle> ToolInstaller::locateTool() const {
    auto path = runner_->findExecutable(requirement_.binary);
    if (!path) {
        return nullptr;
    }

    ProbeCommand probe;
    probe.argv.push_back(path->string());
    probe.argv.insert(probe.argv.end(), requirement_.probeArgs.begin(),
                      requirement_.probeArgs.end());
    probe.expectedMarker = requirement_.expectedMarker;
    probe.timeout = config_.verifyTimeout;

    auto status = verifier_.probe(probe);
    if (status != VerificationStatus::Verified) {
        spdlog::warn("[ToolInstaller] {} found at {} but is {}", requirement_.displayName,
                     path->string(), verificationStatusName(status));
        return nullptr;
    }

    auto handle = std::make_shared<ToolHandle>();
    handle->name = requirement_.displayName;
    handle->executable = *path;
    return handle;
}

} // namespace provision::install
