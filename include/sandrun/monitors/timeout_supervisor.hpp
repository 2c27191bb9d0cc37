/**
 * @file timeout_supervisor.hpp
 * @brief Deadline enforcement for running processes
 *
 * TimeoutSupervisor is a watchdog thread armed when a process starts and
 * cancelled when it ends. RunSupervised() ties it to a ChildProcess and is
 * the single execution path used by every backend and by the container
 * runtime helpers.
 *
 * @date 2025
 */

#pragma once

#include "sandrun/monitors/process_launcher.hpp"
#include "sandrun/monitors/process_tree.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace sandrun {
namespace monitors {

/// Timeouts at or above this (about 100 years) are treated as no deadline.
constexpr std::chrono::milliseconds kLongestTimeout{std::chrono::hours(24 * 365 * 100)};

/**
 * @class TimeoutSupervisor
 * @brief Runs a termination hook if not cancelled before the deadline
 *
 * The hook returns whether it actually terminated something. A hook that
 * finds the process already gone returns false, and the run is not treated
 * as a timeout.
 *
 * Cancel() blocks until a hook that already started has finished, so once
 * it returns the escalation (if any) is complete.
 *
 * A timeout of kLongestTimeout or more never fires; the supervisor then only
 * waits for Cancel().
 */
class TimeoutSupervisor {
public:
    using TerminateHook = std::function<bool()>;

    TimeoutSupervisor(std::chrono::milliseconds timeout, TerminateHook hook);
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    /// Disarm the timer and wait for the watchdog thread.
    void Cancel();

    /// True if the deadline passed and the hook terminated the process.
    bool Fired() const { return fired_.load(); }

private:
    void Run();

    const std::optional<std::chrono::steady_clock::time_point> deadline_;   ///< Absent: never fires
    TerminateHook hook_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
    std::atomic<bool> fired_{false};

    std::thread thread_;   ///< Declared last: started once the rest is initialized
};

/**
 * @struct SupervisionOptions
 * @brief Deadline handling for RunSupervised
 */
struct SupervisionOptions {
    std::optional<std::chrono::milliseconds> timeout;            ///< No deadline when absent
    std::chrono::milliseconds grace{kDefaultGracePeriod};        ///< SIGTERM to SIGKILL delay
    std::optional<std::size_t> max_output_bytes;                 ///< Per-stream capture cap
    std::function<void(pid_t)> on_started;                       ///< Called once the child runs
    std::function<void()> before_terminate;                      ///< Runs before the tree is signalled
};

/**
 * @struct SupervisedRun
 * @brief Raw outcome of RunSupervised
 */
struct SupervisedRun {
    WaitStatus status;
    CapturedOutput output;
    bool timed_out{false};
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Start a process, drain its output, enforce the deadline, reap it
 *
 * On expiry the before_terminate hook runs first (the container backend
 * stops its container there), then the whole process tree is terminated
 * with the grace period.
 *
 * @throws core::EnvironmentError if the process cannot be started
 */
SupervisedRun RunSupervised(const LaunchOptions& launch, const SupervisionOptions& supervision);

} // namespace monitors
} // namespace sandrun
