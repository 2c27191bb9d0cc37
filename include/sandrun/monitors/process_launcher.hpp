/**
 * @file process_launcher.hpp
 * @brief Child process creation with captured stdout/stderr
 *
 * Starts a program with fork/execve, never through a shell, and exposes its
 * two output pipes for concurrent draining. Exec failures are reported back
 * through a close-on-exec error pipe so the caller sees the real errno
 * instead of a child that exits with 127.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandrun {
namespace monitors {

/**
 * @struct LaunchOptions
 * @brief What to start and how
 */
struct LaunchOptions {
    std::string program;                                   ///< Name (PATH lookup) or path
    std::vector<std::string> args;                         ///< Arguments after argv[0]
    std::optional<std::filesystem::path> working_directory;
    std::map<std::string, std::string> environment;        ///< Overrides on top of the inherited environment
    bool new_process_group{true};                          ///< Make the child a group leader
};

/**
 * @struct CapturedStream
 * @brief Bytes read from one output pipe
 */
struct CapturedStream {
    std::string data;
    bool truncated{false};   ///< More bytes arrived than the cap allowed
};

/**
 * @struct CapturedOutput
 * @brief Both output streams of a child
 */
struct CapturedOutput {
    CapturedStream out;
    CapturedStream err;
};

/**
 * @struct WaitStatus
 * @brief Decoded waitpid() status
 */
struct WaitStatus {
    bool exited{false};      ///< Normal exit, exit_code is valid
    int exit_code{0};
    int term_signal{0};      ///< Signal that killed the process, 0 if it exited
};

/**
 * @brief Locate an executable the way execvp would
 *
 * Names containing '/' are used as given. Other names are searched in the
 * colon-separated search_path.
 *
 * @throws core::EnvironmentError ENOENT when nothing matches, EACCES when
 *         only non-executable candidates exist
 */
std::filesystem::path ResolveExecutable(const std::string& program, const std::string& search_path);

/**
 * @class ChildProcess
 * @brief One running child with piped stdout/stderr
 *
 * The constructor starts the child; stdin is connected to /dev/null. The
 * destructor kills and reaps a child that was never waited for, so an
 * exception between launch and Wait() does not leak a process.
 *
 * **Usage**:
 * @code
 * ChildProcess child(options);
 * auto output = child.DrainOutput(std::nullopt);
 * auto status = child.Wait();
 * @endcode
 */
class ChildProcess {
public:
    /**
     * @brief Start the child
     * @throws core::EnvironmentError if the program cannot be started
     */
    explicit ChildProcess(const LaunchOptions& options);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid_; }

    /// True when the child leads its own process group.
    bool OwnsProcessGroup() const { return own_group_; }

    /**
     * @brief Check for exit without reaping
     *
     * Safe to call from another thread while Wait() is pending.
     */
    bool HasExited() const;

    /**
     * @brief Read both pipes until every writer has closed them
     *
     * Both pipes are read concurrently so a child filling one of them can
     * never block on the other. Bytes beyond max_bytes per stream are read
     * and dropped.
     *
     * @param max_bytes Per-stream capture cap, std::nullopt for unlimited
     */
    CapturedOutput DrainOutput(std::optional<std::size_t> max_bytes);

    /**
     * @brief Reap the child, blocking until it exits
     */
    WaitStatus Wait();

private:
    void CloseDescriptors();

    pid_t pid_{-1};
    bool own_group_{false};
    bool reaped_{false};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
};

} // namespace monitors
} // namespace sandrun
