#include <provision/process/command_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace provision::process {

namespace fs = std::filesystem;

std::string describe(const CommandSpec& spec) {
    std::string out;
    for (const auto& arg : spec.argv) {
        if (!out.empty())
            out.push_back(' ');
        out += arg;
    }
    return out;
}

std::optional<fs::path> searchPath(std::string_view name, std::string_view pathEnv) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto isExecutable = [](const fs::path& candidate) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            return false;
        }
#ifdef _WIN32
        return true;
#else
        return ::access(candidate.c_str(), X_OK) == 0;
#endif
    };

    if (name.find('/') != std::string_view::npos) {
        fs::path direct{std::string(name)};
        if (isExecutable(direct)) {
            return direct;
        }
        return std::nullopt;
    }

#ifdef _WIN32
    constexpr char kSeparator = ';';
#else
    constexpr char kSeparator = ':';
#endif

    std::stringstream ss{std::string(pathEnv)};
    std::string dir;
    while (std::getline(ss, dir, kSeparator)) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / std::string(name);
        if (isExecutable(candidate)) {
            return candidate;
        }
#ifdef _WIN32
        candidate += ".exe";
        if (isExecutable(candidate)) {
            return candidate;
        }
#endif
    }
    return std::nullopt;
}

std::optional<fs::path> PosixCommandRunner::findExecutable(std::string_view name) const {
    const char* pathEnv = std::getenv("PATH");
    return searchPath(name, pathEnv ? std::string_view{pathEnv} : std::string_view{});
}

#ifdef _WIN32

Result<CommandOutput> PosixCommandRunner::run(const CommandSpec& spec) {
    return Error{ErrorCode::PlatformUnsupported,
                 "Command execution is not implemented on this platform: " + describe(spec)};
}

#else

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const noexcept { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

bool makePipe(FdGuard& readEnd, FdGuard& writeEnd) {
    int fds[2];
    if (::pipe(fds) < 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

// Child environment: inherited variables, with CommandSpec::env replacing same-named ones.
std::vector<std::string> buildEnvironment(const CommandSpec& spec) {
    std::vector<std::string> envp;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        std::string key{entry.substr(0, eq)};
        if (spec.env.find(key) == spec.env.end()) {
            envp.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : spec.env) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

// Returns false once the descriptor reports EOF or a hard error.
bool drain(int fd, std::string& sink) {
    std::array<char, 4096> buffer;
    for (;;) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

// SIGKILL the child's whole process group; a privilege wrapper such as sudo
// does not forward SIGKILL to the command it started.
void killProcessGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) < 0) {
        ::kill(pid, SIGKILL);
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

Result<CommandOutput> PosixCommandRunner::run(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty command"};
    }

    auto executable = findExecutable(spec.argv.front());
    if (!executable) {
        return Error{ErrorCode::NotFound, "Executable not found: " + spec.argv.front()};
    }

    FdGuard outRead, outWrite, errRead, errWrite, execRead, execWrite;
    if (!makePipe(outRead, outWrite) || !makePipe(errRead, errWrite) ||
        !makePipe(execRead, execWrite)) {
        return Error{ErrorCode::ExecutionError,
                     std::string("Failed to create pipes: ") + std::strerror(errno)};
    }

    // Everything the child touches is prepared before fork().
    const std::string exePath = executable->string();
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = buildEnvironment(spec);
    std::vector<char*> envp;
    envp.reserve(envStorage.size() + 1);
    for (auto& entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    spdlog::debug("[CommandRunner] Executing: {}", describe(spec));
    const auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::ExecutionError,
                     std::string("fork() failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::setpgid(0, 0);
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        ::execve(exePath.c_str(), argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so a timeout right after fork() still finds the group.
    ::setpgid(pid, pid);

    outWrite.reset();
    errWrite.reset();
    execWrite.reset();

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execRead.get(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Error{ErrorCode::ExecutionError,
                     "Failed to execute " + exePath + ": " + std::strerror(execErrno)};
    }

    ::fcntl(outRead.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(errRead.get(), F_SETFL, O_NONBLOCK);

    CommandOutput output;
    const auto deadline = start + spec.timeout;
    bool outOpen = true;
    bool errOpen = true;
    bool exited = false;
    int status = 0;

    // The child may exit while a process it spawned still holds the pipes open,
    // so completion is decided by waitpid(), not by EOF.
    for (;;) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
            break;
        }
        if (r < 0 && errno != EINTR) {
            spdlog::warn("[CommandRunner] waitpid() failed: {}", std::strerror(errno));
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            output.timedOut = true;
            killProcessGroup(pid);
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int waitMs = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
            remaining.count(), 50));

        if (!outOpen && !errOpen) {
            std::this_thread::sleep_for(std::chrono::milliseconds{waitMs});
            continue;
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (outOpen)
            fds[count++] = pollfd{outRead.get(), POLLIN, 0};
        if (errOpen)
            fds[count++] = pollfd{errRead.get(), POLLIN, 0};

        int ready = ::poll(fds.data(), count, waitMs);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            spdlog::warn("[CommandRunner] poll() failed: {}", std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds{waitMs});
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0)
                continue;
            if (fds[i].fd == outRead.get()) {
                outOpen = drain(outRead.get(), output.stdoutText);
            } else {
                errOpen = drain(errRead.get(), output.stderrText);
            }
        }
    }

    if (exited) {
        // Whatever the child wrote before exiting is already buffered in the pipes.
        if (outOpen)
            drain(outRead.get(), output.stdoutText);
        if (errOpen)
            drain(errRead.get(), output.stderrText);
        output.exitCode = decodeStatus(status);
    } else if (output.timedOut) {
        pid_t r;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            output.exitCode = decodeStatus(status);
        }
    }

    output.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    if (output.timedOut) {
        spdlog::warn("[CommandRunner] '{}' timed out after {} ms", describe(spec),
                     output.elapsed.count());
    } else {
        spdlog::debug("[CommandRunner] '{}' exited with {} in {} ms", describe(spec),
                      output.exitCode, output.elapsed.count());
    }
    return output;
}

#endif // _WIN32

std::shared_ptr<ICommandRunner> makeCommandRunner() {
    return std::make_shared<PosixCommandRunner>();
}

} // namespace provision::process
