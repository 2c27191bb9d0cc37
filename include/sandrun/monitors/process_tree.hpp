/**
 * @file process_tree.hpp
 * @brief Process tree inspection and termination through /proc
 *
 * A command started by the executor may fork helpers of its own. Killing
 * only the direct child would orphan them, so termination walks the whole
 * tree: the process group of the child plus every descendant found by
 * following parent links in /proc.
 *
 * **Termination sequence**:
 * ```
 * snapshot descendants
 *   └─ SIGTERM  (process group + descendants)
 *        └─ wait up to grace period
 *             └─ SIGKILL (whatever is still alive)
 * ```
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sandrun {
namespace monitors {

/// Time a process gets between SIGTERM and SIGKILL.
constexpr std::chrono::milliseconds kDefaultGracePeriod{250};

/**
 * @struct ProcessEntry
 * @brief Fields of /proc/<pid>/stat needed for tree walking
 */
struct ProcessEntry {
    pid_t pid{0};
    pid_t ppid{0};
    pid_t pgid{0};
    char state{'?'};      ///< R, S, D, Z, T, ...
    std::string name;     ///< Executable name (comm)
};

/**
 * @struct TerminationReport
 * @brief What TerminateProcessTree did
 */
struct TerminationReport {
    bool found{false};                  ///< The target existed when signalled
    bool exited_gracefully{false};      ///< Everything stopped within the grace period
    bool force_killed{false};           ///< SIGKILL was needed
    std::size_t descendants{0};         ///< Descendants found in the snapshot
};

/**
 * @brief Read /proc/<pid>/stat
 * @return Entry, or std::nullopt if the process does not exist
 */
std::optional<ProcessEntry> ReadProcessEntry(pid_t pid);

/**
 * @brief All live processes whose parent chain leads to root
 *
 * Root itself is not included. Order is breadth-first.
 */
std::vector<pid_t> CollectDescendants(pid_t root);

/**
 * @brief Check whether a process exists and is not a zombie
 */
bool IsProcessAlive(pid_t pid);

/**
 * @brief Terminate a process and everything it started
 *
 * Sends SIGTERM to the process (its whole group when it leads one) and
 * to every descendant, waits up to grace for all of them to exit, then
 * sends SIGKILL to whatever is left. Returns once the signals have been
 * delivered. Reaping stays the job of the parent.
 *
 * @param pid Process to terminate
 * @param grace Time allowed between SIGTERM and SIGKILL
 * @return Report of the actions taken
 */
TerminationReport TerminateProcessTree(pid_t pid,
                                       std::chrono::milliseconds grace = kDefaultGracePeriod);

} // namespace monitors
} // namespace sandrun
