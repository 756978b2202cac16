#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <provision/process/command_runner.h>

namespace provision::install {

/// Trivial invocation proving an installed tool responds, e.g. {"r2", "-v"} expecting "radare2".
struct ProbeCommand {
    std::vector<std::string> argv;
    std::string expectedMarker; ///< Must appear in stdout or stderr; empty accepts any output
    std::chrono::milliseconds timeout{std::chrono::seconds{5}};
};

enum class VerificationStatus : uint8_t {
    Verified, ///< Ran, exited 0, marker present
    Broken,   ///< Binary present but failed, timed out, or printed no marker
    Absent,   ///< Binary not found
};

const char* verificationStatusName(VerificationStatus status) noexcept;

class InstallVerifier {
public:
    explicit InstallVerifier(std::shared_ptr<process::ICommandRunner> runner);

    /// Never throws; any failure while probing counts as Broken.
    VerificationStatus probe(const ProbeCommand& command) const noexcept;

    bool verify(const ProbeCommand& command) const noexcept {
        return probe(command) == VerificationStatus::Verified;
    }

private:
    std::shared_ptr<process::ICommandRunner> runner_;
};

} // namespace provision::install
