#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandrun/monitors/timeout_supervisor.hpp"

#include <signal.h>

#include <atomic>
#include <thread>

namespace {

using namespace std::chrono_literals;
using namespace sandrun::monitors;

TEST(TimeoutSupervisorTest, FiresAfterDeadline) {
    int calls = 0;
    const auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point fired_at;

    TimeoutSupervisor supervisor(50ms, [&] {
        fired_at = std::chrono::steady_clock::now();
        ++calls;
        return true;
    });
    std::this_thread::sleep_for(200ms);
    // Cancel joins the watchdog, so its writes are visible afterwards
    supervisor.Cancel();

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(supervisor.Fired());
    EXPECT_GE(fired_at - start, 50ms);
}

TEST(TimeoutSupervisorTest, CancelBeforeDeadlineNeverCallsHook) {
    std::atomic<int> calls{0};
    {
        TimeoutSupervisor supervisor(10s, [&] {
            ++calls;
            return true;
        });
        const auto start = std::chrono::steady_clock::now();
        supervisor.Cancel();
        EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
        EXPECT_FALSE(supervisor.Fired());
    }
    EXPECT_EQ(calls.load(), 0);
}

TEST(TimeoutSupervisorTest, TimeoutBeyondClockRangeNeverFires) {
    std::atomic<int> calls{0};
    TimeoutSupervisor supervisor(std::chrono::milliseconds::max(), [&] {
        ++calls;
        return true;
    });
    std::this_thread::sleep_for(100ms);
    supervisor.Cancel();
    EXPECT_EQ(calls.load(), 0);
    EXPECT_FALSE(supervisor.Fired());
}

TEST(TimeoutSupervisorTest, HookDecliningIsNotATimeout) {
    TimeoutSupervisor supervisor(10ms, [] { return false; });
    std::this_thread::sleep_for(100ms);
    supervisor.Cancel();
    EXPECT_FALSE(supervisor.Fired());
}

TEST(TimeoutSupervisorTest, CancelWaitsForRunningHook) {
    std::atomic<bool> hook_finished{false};
    TimeoutSupervisor supervisor(10ms, [&] {
        std::this_thread::sleep_for(200ms);
        hook_finished = true;
        return true;
    });
    std::this_thread::sleep_for(50ms);
    supervisor.Cancel();
    EXPECT_TRUE(hook_finished.load());
    EXPECT_TRUE(supervisor.Fired());
}

TEST(RunSupervisedTest, KillsAtDeadline) {
    LaunchOptions launch;
    launch.program = "sleep";
    launch.args = {"10"};

    SupervisionOptions supervision;
    supervision.timeout = 300ms;

    auto run = RunSupervised(launch, supervision);
    EXPECT_TRUE(run.timed_out);
    EXPECT_FALSE(run.status.exited);
    EXPECT_EQ(run.status.term_signal, SIGTERM);
    EXPECT_GE(run.duration, 300ms);
    EXPECT_LT(run.duration, 3s);
}

TEST(RunSupervisedTest, FastCommandIsNotTimedOut) {
    LaunchOptions launch;
    launch.program = "echo";
    launch.args = {"fast"};

    SupervisionOptions supervision;
    supervision.timeout = 5s;

    auto run = RunSupervised(launch, supervision);
    EXPECT_FALSE(run.timed_out);
    EXPECT_EQ(run.output.out.data, "fast\n");
    EXPECT_LT(run.duration, 5s);
}

TEST(RunSupervisedTest, BeforeTerminateRunsFirst) {
    LaunchOptions launch;
    launch.program = "sleep";
    launch.args = {"10"};

    std::atomic<bool> called{false};
    SupervisionOptions supervision;
    supervision.timeout = 100ms;
    supervision.before_terminate = [&] { called = true; };

    auto run = RunSupervised(launch, supervision);
    EXPECT_TRUE(run.timed_out);
    EXPECT_TRUE(called.load());
}

TEST(RunSupervisedTest, OutputHeldByBackgroundProcessStillTimesOut) {
    // The shell exits at once but the background sleep keeps stdout open
    LaunchOptions launch;
    launch.program = "sh";
    launch.args = {"-c", "sleep 10 & exit 0"};

    SupervisionOptions supervision;
    supervision.timeout = 300ms;

    auto run = RunSupervised(launch, supervision);
    EXPECT_TRUE(run.timed_out);
    EXPECT_LT(run.duration, 3s);
}

TEST(RunSupervisedTest, ReportsPidThroughCallback) {
    LaunchOptions launch;
    launch.program = "true";

    pid_t seen = 0;
    SupervisionOptions supervision;
    supervision.on_started = [&](pid_t pid) { seen = pid; };

    RunSupervised(launch, supervision);
    EXPECT_GT(seen, 0);
}

} // namespace
