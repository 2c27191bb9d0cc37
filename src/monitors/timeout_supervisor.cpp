/**
 * @file timeout_supervisor.cpp
 * @brief Implementation of the deadline watchdog
 *
 * @date 2025
 */

#include "sandrun/monitors/timeout_supervisor.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

namespace sandrun {
namespace monitors {

namespace {

// steady_clock counts nanoseconds, so now() + timeout overflows long before
// the millisecond count does
std::optional<std::chrono::steady_clock::time_point> DeadlineAfter(std::chrono::milliseconds timeout) {
    if (timeout >= kLongestTimeout) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + timeout;
}

} // anonymous namespace

// ============================================================================
// WATCHDOG
// ============================================================================

TimeoutSupervisor::TimeoutSupervisor(std::chrono::milliseconds timeout, TerminateHook hook)
    : deadline_(DeadlineAfter(timeout)),
      hook_(std::move(hook)),
      thread_(&TimeoutSupervisor::Run, this) {
}

TimeoutSupervisor::~TimeoutSupervisor() {
    Cancel();
}

void TimeoutSupervisor::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void TimeoutSupervisor::Run() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!deadline_) {
            cv_.wait(lock, [this] { return cancelled_; });
            return;
        }
        if (cv_.wait_until(lock, *deadline_, [this] { return cancelled_; })) {
            return;
        }
    }

    try {
        fired_ = hook_();
    } catch (const std::exception& e) {
        spdlog::error("Timeout handler failed: {}", e.what());
    }
}

// ============================================================================
// SUPERVISED EXECUTION
// ============================================================================

SupervisedRun RunSupervised(const LaunchOptions& launch, const SupervisionOptions& supervision) {
    const auto start = std::chrono::steady_clock::now();

    ChildProcess child(launch);
    if (supervision.on_started) {
        supervision.on_started(child.Pid());
    }

    // The run lasts until the output pipes close, which can be after the
    // child itself exited if something it started still holds them
    std::atomic<bool> draining{true};

    std::unique_ptr<TimeoutSupervisor> supervisor;
    if (supervision.timeout) {
        const auto timeout = *supervision.timeout;
        supervisor = std::make_unique<TimeoutSupervisor>(timeout, [&child, &draining, &supervision, timeout]() {
            // Finished right at the deadline: not a timeout
            if (!draining && child.HasExited()) {
                return false;
            }
            spdlog::warn("Process {} exceeded timeout of {} ms, terminating",
                         child.Pid(), timeout.count());
            if (supervision.before_terminate) {
                supervision.before_terminate();
            }
            auto report = TerminateProcessTree(child.Pid(), supervision.grace);
            if (report.force_killed) {
                spdlog::debug("Process {} required SIGKILL", child.Pid());
            }
            return true;
        });
    }

    SupervisedRun run;
    run.output = child.DrainOutput(supervision.max_output_bytes);
    draining = false;
    run.status = child.Wait();

    if (supervisor) {
        supervisor->Cancel();
        run.timed_out = supervisor->Fired();
    }

    run.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return run;
}

} // namespace monitors
} // namespace sandrun
