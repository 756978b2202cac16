#include <gtest/gtest.h>

#include <provision/process/command_runner.h>

#include <filesystem>
#include <fstream>
#include <random>

#ifndef _WIN32
#include <signal.h>
#include <sys/stat.h>
#include <thread>
#endif

using namespace provision;
using namespace provision::process;

namespace fs = std::filesystem;

#ifndef _WIN32

class PosixCommandRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!fs::exists("/bin/sh")) {
            GTEST_SKIP() << "/bin/sh not available";
        }
    }

    CommandSpec shell(const std::string& script,
                      std::chrono::milliseconds timeout = std::chrono::seconds{10}) {
        CommandSpec spec;
        spec.argv = {"/bin/sh", "-c", script};
        spec.timeout = timeout;
        return spec;
    }

    PosixCommandRunner runner_;
};

TEST_F(PosixCommandRunnerTest, CapturesStdoutAndStderrSeparately) {
    auto result = runner_.run(shell("echo out; echo err 1>&2"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_FALSE(result->timedOut);
    EXPECT_EQ(result->stdoutText, "out\n");
    EXPECT_EQ(result->stderrText, "err\n");
    EXPECT_TRUE(result->succeeded());
}

TEST_F(PosixCommandRunnerTest, ReportsNonZeroExit) {
    auto result = runner_.run(shell("exit 3"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_FALSE(result->succeeded());
}

TEST_F(PosixCommandRunnerTest, KillsCommandAtTimeout) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner_.run(shell("sleep 30", std::chrono::milliseconds{200}));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timedOut);
    EXPECT_FALSE(result->succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds{10});
}

TEST_F(PosixCommandRunnerTest, BackgroundDescendantHoldingPipesDoesNotDelayExit) {
    auto start = std::chrono::steady_clock::now();
    auto result = runner_.run(shell("sleep 5 & echo done; exit 0", std::chrono::seconds{3}));
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->timedOut);
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->stdoutText, "done\n");
    EXPECT_TRUE(result->succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds{2});
}

TEST_F(PosixCommandRunnerTest, TimeoutKillsGrandchildren) {
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("provision_group_test_" + std::to_string(rd()));
    fs::create_directories(dir);
    auto pidFile = dir / "grandchild.pid";

    // The inner shell records its pid and becomes `sleep`; the outer shell waits on it.
    auto result = runner_.run(
        shell("sh -c 'echo $$ > \"" + pidFile.string() + "\"; exec sleep 30'; true",
              std::chrono::milliseconds{500}));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->timedOut);

    pid_t grandchild = 0;
    {
        std::ifstream in(pidFile);
        ASSERT_TRUE(in >> grandchild) << "grandchild never started";
    }

    auto alive = [](pid_t pid) {
        if (::kill(pid, 0) < 0) {
            return false;
        }
        // A killed orphan may linger as a zombie until it is reaped.
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!std::getline(stat, line)) {
            return true;
        }
        auto paren = line.rfind(')');
        return paren == std::string::npos || paren + 2 >= line.size() || line[paren + 2] != 'Z';
    };

    auto until = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (alive(grandchild) && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    EXPECT_FALSE(alive(grandchild));

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_F(PosixCommandRunnerTest, ArgumentsAreNotShellInterpreted) {
    if (!fs::exists("/bin/echo") && !fs::exists("/usr/bin/echo")) {
        GTEST_SKIP() << "echo binary not available";
    }
    CommandSpec spec;
    spec.argv = {"echo", "$HOME;", "`id`"};
    auto result = runner_.run(spec);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "$HOME; `id`\n");
}

TEST_F(PosixCommandRunnerTest, PassesExtraEnvironment) {
    auto spec = shell("printf %s \"$PROVISION_TEST_VALUE\"");
    spec.with_env("PROVISION_TEST_VALUE", "hello");
    auto result = runner_.run(spec);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "hello");
}

TEST_F(PosixCommandRunnerTest, MissingExecutableIsNotFound) {
    CommandSpec spec;
    spec.argv = {"provision-definitely-not-a-real-binary"};
    auto result = runner_.run(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(PosixCommandRunnerTest, EmptyArgvIsRejected) {
    auto result = runner_.run(CommandSpec{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(PosixCommandRunnerTest, ExecFailureIsExecutionError) {
    std::random_device rd;
    auto dir = fs::temp_directory_path() / ("provision_exec_test_" + std::to_string(rd()));
    fs::create_directories(dir);
    auto script = dir / "broken.sh";
    {
        std::ofstream out(script);
        out << "#!/nonexistent/interpreter\n";
    }
    ::chmod(script.c_str(), 0755);

    CommandSpec spec;
    spec.argv = {script.string()};
    auto result = runner_.run(spec);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ExecutionError);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

#endif // _WIN32

TEST(SearchPathTest, FindsExecutableInPathList) {
#ifndef _WIN32
    auto found = searchPath("sh", "/nonexistent-dir:/bin:/usr/bin");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "sh");
#endif
    EXPECT_FALSE(searchPath("provision-definitely-not-a-real-binary", "/bin:/usr/bin").has_value());
    EXPECT_FALSE(searchPath("", "/bin").has_value());
}

TEST(DescribeTest, JoinsArgv) {
    CommandSpec spec;
    spec.argv = {"apt-get", "install", "-y", "radare2"};
    EXPECT_EQ(describe(spec), "apt-get install -y radare2");
}
