#pragma once

#include <provision/core/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace provision::process {

/**
 * @brief A single argv invocation.
 *
 * argv[0] is resolved through PATH. Arguments are passed to exec verbatim and
 * never pass through a shell.
 */
struct CommandSpec {
    std::vector<std::string> argv;
    std::unordered_map<std::string, std::string> env; ///< Added to the inherited environment
    std::chrono::milliseconds timeout{std::chrono::seconds{300}};

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }
};

struct CommandOutput {
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    bool timedOut{false};
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const noexcept { return !timedOut && exitCode == 0; }
};

/// Space-joined argv for log lines.
std::string describe(const CommandSpec& spec);

/**
 * @brief Executes commands and resolves executables.
 *
 * run() reports an Error only when the process could not be started
 * (ErrorCode::ExecutionError, or ErrorCode::NotFound when argv[0] is not
 * executable). Non-zero exits and timeouts are reported in CommandOutput.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual Result<CommandOutput> run(const CommandSpec& spec) = 0;

    virtual std::optional<std::filesystem::path> findExecutable(std::string_view name) const = 0;
};

/**
 * @brief fork/exec implementation.
 *
 * The child runs in its own process group. stdout and stderr are drained with
 * poll() until the child exits; descendants that outlive it do not delay the
 * result. When the timeout expires the whole group receives SIGKILL and the
 * output is marked timedOut. Exec failures travel back to the parent over a
 * close-on-exec pipe.
 */
class PosixCommandRunner final : public ICommandRunner {
public:
    Result<CommandOutput> run(const CommandSpec& spec) override;
    std::optional<std::filesystem::path> findExecutable(std::string_view name) const override;
};

std::shared_ptr<ICommandRunner> makeCommandRunner();

/// PATH search shared by runners. Names containing '/' are checked directly.
std::optional<std::filesystem::path> searchPath(std::string_view name,
                                                std::string_view pathEnv);

} // namespace provision::process
