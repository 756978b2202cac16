#include <provision/install/install_verifier.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace provision::install {

const char* verificationStatusName(VerificationStatus status) noexcept {
    switch (status) {
        case VerificationStatus::Verified:
            return "verified";
        case VerificationStatus::Broken:
            return "broken";
        case VerificationStatus::Absent:
            return "absent";
    }
    return "unknown";
}

InstallVerifier::InstallVerifier(std::shared_ptr<process::ICommandRunner> runner)
    : runner_(std::move(runner)) {}

VerificationStatus InstallVerifier::probe(const ProbeCommand& command) const noexcept {
    if (command.argv.empty() || !runner_) {
        return VerificationStatus::Absent;
    }

    try {
        if (!runner_->findExecutable(command.argv.front())) {
            spdlog::debug("[InstallVerifier] '{}' not found on PATH", command.argv.front());
            return VerificationStatus::Absent;
        }

        process::CommandSpec spec;
        spec.argv = command.argv;
        spec.timeout = command.timeout;

        auto run = runner_->run(spec);
        if (!run) {
            spdlog::debug("[InstallVerifier] Probe '{}' could not start: {}",
                          process::describe(spec), run.error().message);
            return run.error().code == ErrorCode::NotFound ? VerificationStatus::Absent
                                                           : VerificationStatus::Broken;
        }

        const auto& out = run.value();
        if (out.timedOut || out.exitCode != 0) {
            spdlog::debug("[InstallVerifier] Probe '{}' failed (exit {}, timed out: {})",
                          process::describe(spec), out.exitCode, out.timedOut);
            return VerificationStatus::Broken;
        }

        if (!command.expectedMarker.empty() &&
            out.stdoutText.find(command.expectedMarker) == std::string::npos &&
            out.stderrText.find(command.expectedMarker) == std::string::npos) {
            spdlog::debug("[InstallVerifier] Probe '{}' output lacks marker '{}'",
                          process::describe(spec), command.expectedMarker);
            return VerificationStatus::Broken;
        }

        return VerificationStatus::Verified;
    } catch (const std::exception& e) {
        spdlog::warn("[InstallVerifier] Probe raised: {}", e.what());
        return VerificationStatus::Broken;
    } catch (...) {
        spdlog::warn("[InstallVerifier] Probe raised a non-standard exception");
        return VerificationStatus::Broken;
    }
}

} // namespace provision::install
