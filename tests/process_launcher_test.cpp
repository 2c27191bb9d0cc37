#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandrun/core/errors.hpp"
#include "sandrun/monitors/process_launcher.hpp"
#include "test_utils.hpp"

#include <signal.h>

#include <cerrno>

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;
using namespace sandrun::monitors;
using sandrun::core::EnvironmentError;
using sandrun::testing_utils::TempDir;

LaunchOptions Shell(const std::string& script) {
    LaunchOptions options;
    options.program = "sh";
    options.args = {"-c", script};
    return options;
}

TEST(ResolveExecutableTest, FindsProgramOnSearchPath) {
    auto path = ResolveExecutable("sh", "/nonexistent:/usr/bin:/bin");
    EXPECT_THAT(path.string(), EndsWith("/sh"));
}

TEST(ResolveExecutableTest, PathWithSlashIsUsedAsGiven) {
    EXPECT_EQ(ResolveExecutable("./local-tool", "/bin").string(), "./local-tool");
}

TEST(ResolveExecutableTest, MissingProgramIsEnoent) {
    try {
        ResolveExecutable("sandrun-definitely-missing", "/usr/bin:/bin");
        FAIL() << "expected EnvironmentError";
    } catch (const EnvironmentError& e) {
        EXPECT_EQ(e.code().value(), ENOENT);
    }
}

TEST(ResolveExecutableTest, NonExecutableIsEacces) {
    TempDir dir;
    dir.WriteFile("tool", "#!/bin/sh\n", false);
    try {
        ResolveExecutable("tool", dir.Path().string());
        FAIL() << "expected EnvironmentError";
    } catch (const EnvironmentError& e) {
        EXPECT_EQ(e.code().value(), EACCES);
    }
}

TEST(ResolveExecutableTest, RelativeSearchPathEntryBecomesAbsolute) {
    TempDir dir;
    dir.WriteFile("tool", "#!/bin/sh\n", true);
    const auto relative = std::filesystem::relative(dir.Path(), std::filesystem::current_path());

    auto path = ResolveExecutable("tool", relative.string());
    EXPECT_TRUE(path.is_absolute());
    EXPECT_EQ(std::filesystem::canonical(path), std::filesystem::canonical(dir.Path() / "tool"));
}

TEST(ChildProcessTest, RelativeSearchPathSurvivesWorkingDirectoryChange) {
    TempDir tools;
    TempDir workdir;
    tools.WriteFile("tool", "#!/bin/sh\necho from-tools\n", true);
    const auto relative = std::filesystem::relative(tools.Path(), std::filesystem::current_path());

    LaunchOptions options;
    options.program = "tool";
    options.environment["PATH"] = relative.string() + ":/usr/bin:/bin";
    options.working_directory = workdir.Path();

    ChildProcess child(options);
    auto output = child.DrainOutput(std::nullopt);
    auto status = child.Wait();

    EXPECT_TRUE(status.exited);
    EXPECT_EQ(status.exit_code, 0);
    EXPECT_EQ(output.out.data, "from-tools\n");
}

TEST(ChildProcessTest, CapturesBothStreams) {
    ChildProcess child(Shell("echo out; echo err >&2; exit 7"));
    auto output = child.DrainOutput(std::nullopt);
    auto status = child.Wait();

    EXPECT_EQ(output.out.data, "out\n");
    EXPECT_EQ(output.err.data, "err\n");
    EXPECT_TRUE(status.exited);
    EXPECT_EQ(status.exit_code, 7);
}

TEST(ChildProcessTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    // Far more than a pipe buffer on each stream, stderr written first
    ChildProcess child(Shell("head -c 1000000 /dev/zero >&2; head -c 1000000 /dev/zero"));
    auto output = child.DrainOutput(std::nullopt);
    auto status = child.Wait();

    EXPECT_EQ(output.out.data.size(), 1000000u);
    EXPECT_EQ(output.err.data.size(), 1000000u);
    EXPECT_EQ(status.exit_code, 0);
}

TEST(ChildProcessTest, CapTruncatesButKeepsDraining) {
    ChildProcess child(Shell("head -c 100000 /dev/zero; echo tail >&2"));
    auto output = child.DrainOutput(1000);
    auto status = child.Wait();

    EXPECT_EQ(output.out.data.size(), 1000u);
    EXPECT_TRUE(output.out.truncated);
    EXPECT_EQ(output.err.data, "tail\n");
    EXPECT_FALSE(output.err.truncated);
    EXPECT_EQ(status.exit_code, 0);
}

TEST(ChildProcessTest, EnvironmentOverridesAndWorkingDirectory) {
    TempDir dir;
    auto options = Shell("printf '%s|' \"$SANDRUN_TEST_VAR\"; pwd");
    options.environment["SANDRUN_TEST_VAR"] = "value with spaces";
    options.working_directory = dir.Path();

    ChildProcess child(options);
    auto output = child.DrainOutput(std::nullopt);
    child.Wait();

    EXPECT_EQ(output.out.data,
              "value with spaces|" + std::filesystem::canonical(dir.Path()).string() + "\n");
}

TEST(ChildProcessTest, ArgumentsAreNotShellInterpreted) {
    LaunchOptions options;
    options.program = "echo";
    options.args = {"$HOME", "a;b", "*"};

    ChildProcess child(options);
    auto output = child.DrainOutput(std::nullopt);
    child.Wait();

    EXPECT_EQ(output.out.data, "$HOME a;b *\n");
}

TEST(ChildProcessTest, StdinIsEmpty) {
    ChildProcess child(Shell("cat; echo done"));
    auto output = child.DrainOutput(std::nullopt);
    child.Wait();
    EXPECT_EQ(output.out.data, "done\n");
}

TEST(ChildProcessTest, ExecFailureReportsErrno) {
    LaunchOptions options;
    options.program = "/nonexistent/sandrun-program";
    try {
        ChildProcess child(options);
        FAIL() << "expected EnvironmentError";
    } catch (const EnvironmentError& e) {
        EXPECT_EQ(e.code().value(), ENOENT);
        EXPECT_THAT(e.what(), HasSubstr("sandrun-program"));
    }
}

TEST(ChildProcessTest, SignalDeathIsDecoded) {
    ChildProcess child(Shell("kill -9 $$"));
    child.DrainOutput(std::nullopt);
    auto status = child.Wait();

    EXPECT_FALSE(status.exited);
    EXPECT_EQ(status.term_signal, SIGKILL);
}

TEST(ChildProcessTest, NewProcessGroupIsLedByChild) {
    ChildProcess child(Shell("sleep 0.2"));
    EXPECT_TRUE(child.OwnsProcessGroup());
    EXPECT_EQ(getpgid(child.Pid()), child.Pid());
    EXPECT_FALSE(child.HasExited());
    child.DrainOutput(std::nullopt);
    child.Wait();
    EXPECT_TRUE(child.HasExited());
}

} // namespace
