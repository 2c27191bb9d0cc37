#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandrun/reporters/result_reporter.hpp"

#include <nlohmann/json.hpp>

#include <signal.h>

namespace {

using ::testing::HasSubstr;
using namespace sandrun::core;
using sandrun::reporters::ResultReporter;

ExecutionResult SampleResult() {
    ExecutionResult result;
    result.exit_code = 0;
    result.stdout_output = "hello\n";
    result.backend_used = ExecutionMode::SPAWN;
    result.requested_mode = ExecutionMode::CONTAINER;
    result.fell_back = true;
    result.duration = std::chrono::milliseconds(12);
    return result;
}

TEST(ResultReporterTest, JsonHasAllKeys) {
    auto j = ResultReporter::ToJson(SampleResult());
    for (const char* key : {"exit_code", "stdout", "stderr", "timed_out", "backend_used",
                            "requested_mode", "fell_back", "term_signal", "oom_killed",
                            "stdout_truncated", "stderr_truncated", "duration_ms"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["stdout"], "hello\n");
    EXPECT_EQ(j["backend_used"], "spawn");
    EXPECT_EQ(j["requested_mode"], "container");
    EXPECT_EQ(j["fell_back"], true);
    EXPECT_EQ(j["duration_ms"], 12);
}

TEST(ResultReporterTest, InvalidUtf8DoesNotThrow) {
    auto result = SampleResult();
    result.stdout_output = std::string("\xff\xfe binary", 9);

    ResultReporter reporter(sandrun::reporters::ResultReporterConfig{false, 0});
    std::string text;
    ASSERT_NO_THROW(text = reporter.GenerateJsonString(result));
    auto parsed = nlohmann::json::parse(text);
    EXPECT_THAT(parsed["stdout"].get<std::string>(), HasSubstr("binary"));
}

TEST(ResultReporterTest, DescribeDistinguishesOutcomes) {
    auto exited = SampleResult();
    exited.exit_code = 3;
    EXPECT_THAT(ResultReporter::Describe(exited), HasSubstr("exited with 3"));
    EXPECT_THAT(ResultReporter::Describe(exited), HasSubstr("fell back from container"));

    auto signalled = SampleResult();
    signalled.exit_code = kKilledExitCode;
    signalled.term_signal = SIGKILL;
    EXPECT_THAT(ResultReporter::Describe(signalled), HasSubstr("killed by signal 9"));

    auto timed_out = SampleResult();
    timed_out.exit_code = kKilledExitCode;
    timed_out.timed_out = true;
    timed_out.term_signal = SIGTERM;
    EXPECT_THAT(ResultReporter::Describe(timed_out), HasSubstr("killed after timeout"));
}

} // namespace
