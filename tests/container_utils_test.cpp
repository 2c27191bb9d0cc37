#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandrun/utils/container_utils.hpp"
#include "test_utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;
using namespace std::chrono_literals;
using namespace sandrun::utils;
using sandrun::testing_utils::TempDir;
using sandrun::testing_utils::WriteFakeRuntime;

ContainerRunSpec SampleSpec() {
    ContainerRunSpec spec;
    spec.name = "sandrun-test";
    spec.host_directory = "/srv/project";
    spec.program = "ls";
    spec.args = {"-la", "two words"};
    return spec;
}

// Value that follows flag in args, or "" if flag is absent.
std::string ValueOf(const std::vector<std::string>& args, const std::string& flag) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag) {
            return args[i + 1];
        }
    }
    return "";
}

TEST(BuildRunCommandTest, DefaultLimitsAndHardening) {
    auto args = ContainerUtils::BuildRunCommand(SampleSpec());

    EXPECT_EQ(args.front(), "run");
    EXPECT_EQ(ValueOf(args, "--name"), "sandrun-test");
    EXPECT_EQ(ValueOf(args, "--memory"), "256m");
    EXPECT_EQ(ValueOf(args, "--memory-swap"), "256m");
    EXPECT_EQ(ValueOf(args, "--cpu-quota"), "50000");
    EXPECT_EQ(ValueOf(args, "--cpu-period"), "100000");
    EXPECT_EQ(ValueOf(args, "--pids-limit"), "50");
    EXPECT_EQ(ValueOf(args, "--network"), "none");
    EXPECT_EQ(ValueOf(args, "--cap-drop"), "ALL");
    EXPECT_EQ(ValueOf(args, "--security-opt"), "no-new-privileges");
    EXPECT_EQ(ValueOf(args, "-v"), "/srv/project:/workspace:rw");
    EXPECT_EQ(ValueOf(args, "-w"), "/workspace");
    EXPECT_THAT(args, Not(Contains("--rm")));
    EXPECT_THAT(args, Not(Contains("--read-only")));
}

TEST(BuildRunCommandTest, CommandFollowsImageVerbatim) {
    auto args = ContainerUtils::BuildRunCommand(SampleSpec());
    ASSERT_GE(args.size(), 4u);
    std::vector<std::string> tail(args.end() - 4, args.end());
    EXPECT_THAT(tail, ElementsAre("alpine:latest", "ls", "-la", "two words"));
}

TEST(BuildRunCommandTest, ReadOnlyNetworkAndEnvironment) {
    auto spec = SampleSpec();
    spec.settings.read_only_root = true;
    spec.settings.network_enabled = true;
    spec.settings.memory_limit_mb = 512;
    spec.environment = {{"LANG", "C"}, {"EMPTY", ""}};

    auto args = ContainerUtils::BuildRunCommand(spec);
    EXPECT_THAT(args, Contains("--read-only"));
    EXPECT_EQ(ValueOf(args, "-v"), "/srv/project:/workspace:ro");
    EXPECT_EQ(ValueOf(args, "--network"), "bridge");
    EXPECT_EQ(ValueOf(args, "--memory"), "512m");
    EXPECT_THAT(args, Contains("LANG=C"));
    EXPECT_THAT(args, Contains("EMPTY="));
}

TEST(ParseInspectOutputTest, ReadsStateFromArray) {
    auto info = ContainerUtils::ParseInspectOutput(R"([{
        "Id": "0123abcd",
        "Name": "/sandrun-1",
        "State": {"Status": "exited", "ExitCode": 137, "OOMKilled": true}
    }])");
    EXPECT_EQ(info.id, "0123abcd");
    EXPECT_EQ(info.name, "sandrun-1");
    EXPECT_EQ(info.state, ContainerState::EXITED);
    EXPECT_EQ(info.exit_code, 137);
    EXPECT_TRUE(info.oom_killed);
}

TEST(ParseInspectOutputTest, AcceptsSingleObjectWithoutState) {
    auto info = ContainerUtils::ParseInspectOutput(R"({"Id": "x"})");
    EXPECT_EQ(info.state, ContainerState::UNKNOWN);
    EXPECT_FALSE(info.oom_killed);
}

TEST(ParseInspectOutputTest, StateNamesRoundTripThroughRuntimeSpelling) {
    for (const char* status : {"created", "running", "paused", "exited", "dead"}) {
        auto info = ContainerUtils::ParseInspectOutput(
            std::string(R"({"State": {"Status": ")") + status + R"("}})");
        EXPECT_EQ(ToString(info.state), status);
    }
    EXPECT_EQ(ToString(ContainerState::UNKNOWN), "unknown");
}

TEST(ParseInspectOutputTest, MalformedInputThrows) {
    EXPECT_THROW(ContainerUtils::ParseInspectOutput("not json"), nlohmann::json::exception);
    EXPECT_THROW(ContainerUtils::ParseInspectOutput("[]"), nlohmann::json::exception);
}

TEST(ContainerNameTest, NamesAreUnique) {
    std::set<std::string> names;
    for (int i = 0; i < 100; ++i) {
        auto name = ContainerUtils::GenerateContainerName();
        EXPECT_THAT(name, StartsWith("sandrun-"));
        names.insert(name);
    }
    EXPECT_EQ(names.size(), 100u);
}

TEST(ContainerUtilsTest, MissingRuntimeIsUnavailable) {
    ContainerUtils runtime("sandrun-no-such-runtime");
    EXPECT_FALSE(runtime.IsRuntimeAvailable());
    EXPECT_FALSE(runtime.GetRuntimeVersion().has_value());
    EXPECT_FALSE(runtime.InspectContainer("anything").has_value());
}

TEST(ContainerUtilsTest, TalksToRuntimeCli) {
    TempDir dir;
    ContainerUtils runtime(WriteFakeRuntime(dir, "exit 0", true).string());

    EXPECT_TRUE(runtime.IsRuntimeAvailable());
    EXPECT_EQ(runtime.GetRuntimeVersion().value_or(""), "24.0.7");

    auto info = runtime.InspectContainer("sandbox");
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->oom_killed);

    EXPECT_TRUE(runtime.KillContainer("sandbox", "SIGTERM"));
    EXPECT_TRUE(runtime.RemoveContainer("sandbox"));

    auto calls = dir.ReadFile("calls.log");
    EXPECT_THAT(calls, HasSubstr("version --format {{.Server.Version}}"));
    EXPECT_THAT(calls, HasSubstr("kill --signal SIGTERM sandbox"));
    EXPECT_THAT(calls, HasSubstr("rm -f sandbox"));
}

TEST(ContainerRuntimeProbeTest, CachesWithinTtl) {
    std::atomic<int> checks{0};
    ContainerRuntimeProbe probe(10s, [&](const std::string&) {
        ++checks;
        return true;
    });

    EXPECT_TRUE(probe.IsAvailable("docker"));
    EXPECT_TRUE(probe.IsAvailable("docker"));
    EXPECT_TRUE(probe.IsAvailable("docker"));
    EXPECT_EQ(checks.load(), 1);

    // Cached per runtime
    EXPECT_TRUE(probe.IsAvailable("podman"));
    EXPECT_EQ(checks.load(), 2);
}

TEST(ContainerRuntimeProbeTest, RechecksAfterTtl) {
    std::atomic<int> checks{0};
    ContainerRuntimeProbe probe(50ms, [&](const std::string&) {
        return ++checks > 1;
    });

    EXPECT_FALSE(probe.IsAvailable("docker"));
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(probe.IsAvailable("docker"));
    EXPECT_EQ(checks.load(), 2);
}

TEST(ContainerRuntimeProbeTest, InvalidateForcesRecheck) {
    std::atomic<int> checks{0};
    ContainerRuntimeProbe probe(10s, [&](const std::string&) {
        ++checks;
        return false;
    });

    probe.IsAvailable("docker");
    probe.Invalidate("docker");
    probe.IsAvailable("docker");
    probe.Invalidate();
    probe.IsAvailable("docker");
    EXPECT_EQ(checks.load(), 3);
}

TEST(ContainerRuntimeProbeTest, ThrowingCheckerMeansUnavailable) {
    ContainerRuntimeProbe probe(10s, [](const std::string&) -> bool {
        throw std::runtime_error("socket exploded");
    });
    EXPECT_FALSE(probe.IsAvailable("docker"));
}

TEST(ContainerRuntimeProbeTest, ConcurrentCallersAgree) {
    std::atomic<int> checks{0};
    ContainerRuntimeProbe probe(10s, [&](const std::string&) {
        ++checks;
        return true;
    });

    std::vector<std::thread> threads;
    std::atomic<int> available{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 100; ++j) {
                if (probe.IsAvailable("docker")) {
                    ++available;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(available.load(), 800);
    EXPECT_GE(checks.load(), 1);
    EXPECT_LE(checks.load(), 8);
}

} // namespace
