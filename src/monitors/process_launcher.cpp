/**
 * @file process_launcher.cpp
 * @brief fork/execve launcher with poll-based output draining
 *
 * **Startup handshake**:
 * ```
 * parent                          child
 *   pipe2(O_CLOEXEC) x3
 *   fork ───────────────────────► setpgid(0,0)
 *                                  chdir(working_directory)
 *                                  dup2 stdin/stdout/stderr
 *                                  execve ──► success: error pipe closes (EOF)
 *                                         └─► failure: write errno, _exit(127)
 *   read(error pipe)
 *     EOF      -> running
 *     4 bytes  -> reap, throw EnvironmentError(errno)
 * ```
 *
 * @date 2025
 */

#include "sandrun/monitors/process_launcher.hpp"
#include "sandrun/core/errors.hpp"
#include "sandrun/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

extern char** environ;

namespace sandrun {
namespace monitors {

namespace {

constexpr int kExecFailureExitCode = 127;
constexpr std::size_t kReadChunkSize = 64 * 1024;
constexpr const char* kFallbackSearchPath = "/usr/local/bin:/usr/bin:/bin";

// Inherited environment with overrides applied, as KEY=VALUE entries
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        if (auto kv = utils::StringUtils::ParseKeyValue(*entry)) {
            merged.emplace(kv->first, kv->second);
        }
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::string SearchPathFor(const std::map<std::string, std::string>& overrides) {
    auto it = overrides.find("PATH");
    if (it != overrides.end()) {
        return it->second;
    }
    const char* path = std::getenv("PATH");
    return path ? path : kFallbackSearchPath;
}

std::array<int, 2> MakePipe() {
    std::array<int, 2> fds{-1, -1};
    if (pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw core::EnvironmentError(errno, "pipe2 failed");
    }
    return fds;
}

void CloseIfOpen(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls from here until execve
[[noreturn]] void ReportChildFailure(int error_fd) {
    int err = errno;
    ssize_t ignored = write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(kExecFailureExitCode);
}

WaitStatus DecodeStatus(int status) {
    WaitStatus decoded;
    if (WIFEXITED(status)) {
        decoded.exited = true;
        decoded.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        decoded.term_signal = WTERMSIG(status);
    }
    return decoded;
}

void AppendCapped(CapturedStream& stream, const char* data, std::size_t size,
                  std::optional<std::size_t> max_bytes) {
    if (!max_bytes) {
        stream.data.append(data, size);
        return;
    }
    std::size_t room = *max_bytes > stream.data.size() ? *max_bytes - stream.data.size() : 0;
    if (size > room) {
        stream.truncated = true;
        size = room;
    }
    stream.data.append(data, size);
}

} // anonymous namespace

// ============================================================================
// EXECUTABLE LOOKUP
// ============================================================================

std::filesystem::path ResolveExecutable(const std::string& program, const std::string& search_path) {
    if (program.find('/') != std::string::npos) {
        return program;
    }

    bool found_non_executable = false;
    for (const auto& dir : utils::StringUtils::Split(search_path, ':')) {
        std::filesystem::path candidate = std::filesystem::path(dir) / program;
        struct stat st;
        if (stat(candidate.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }
        if (access(candidate.c_str(), X_OK) == 0) {
            // execve runs after the child's chdir, so a relative PATH entry
            // must be pinned to the directory it was checked in
            return std::filesystem::absolute(candidate);
        }
        found_non_executable = true;
    }

    if (found_non_executable) {
        throw core::EnvironmentError(EACCES, "Program '" + program + "' is not executable");
    }
    throw core::EnvironmentError(ENOENT, "Program '" + program + "' not found in PATH");
}

// ============================================================================
// LAUNCH
// ============================================================================

ChildProcess::ChildProcess(const LaunchOptions& options)
    : own_group_(options.new_process_group) {
    const std::filesystem::path executable =
        ResolveExecutable(options.program, SearchPathFor(options.environment));

    // Everything the child needs is prepared before fork
    std::vector<std::string> argv_storage;
    argv_storage.reserve(options.args.size() + 1);
    argv_storage.push_back(options.program);
    argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = BuildEnvironment(options.environment);
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string exec_path = executable.string();
    const std::string cwd = options.working_directory ? options.working_directory->string() : "";

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        throw core::EnvironmentError(errno, "Cannot open /dev/null");
    }

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    std::array<int, 2> error_pipe{-1, -1};
    try {
        out_pipe = MakePipe();
        err_pipe = MakePipe();
        error_pipe = MakePipe();
    } catch (const core::EnvironmentError&) {
        for (int fd : {null_fd, out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            if (fd >= 0) {
                close(fd);
            }
        }
        throw;
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {null_fd, out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
                       error_pipe[0], error_pipe[1]}) {
            close(fd);
        }
        throw core::EnvironmentError(err, "fork failed");
    }

    if (pid == 0) {
        // Child
        if (options.new_process_group && setpgid(0, 0) != 0) {
            ReportChildFailure(error_pipe[1]);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            ReportChildFailure(error_pipe[1]);
        }
        if (dup2(null_fd, STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[1], STDERR_FILENO) < 0) {
            ReportChildFailure(error_pipe[1]);
        }

        // Undo anything the parent changed that the child would inherit
        signal(SIGPIPE, SIG_DFL);
        sigset_t all_signals;
        sigemptyset(&all_signals);
        sigprocmask(SIG_SETMASK, &all_signals, nullptr);

        execve(exec_path.c_str(), argv.data(), envp.data());
        ReportChildFailure(error_pipe[1]);
    }

    // Parent
    pid_ = pid;
    if (options.new_process_group) {
        // Also set from the parent so the group exists before anyone signals it.
        // EACCES once the child has already exec'd is expected.
        setpgid(pid, pid);
    }

    close(null_fd);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(error_pipe[1]);
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    int child_errno = 0;
    ssize_t bytes_read;
    do {
        bytes_read = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (bytes_read < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (bytes_read > 0) {
        Wait();
        CloseDescriptors();
        throw core::EnvironmentError(child_errno, "Failed to start '" + options.program + "'");
    }

    spdlog::debug("Started pid {}: {}", pid_,
                  utils::StringUtils::FormatCommandLine(options.program, options.args));
}

ChildProcess::~ChildProcess() {
    CloseDescriptors();
    if (pid_ > 0 && !reaped_) {
        spdlog::debug("Killing unreaped child {}", pid_);
        kill(own_group_ ? -pid_ : pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
}

void ChildProcess::CloseDescriptors() {
    CloseIfOpen(stdout_fd_);
    CloseIfOpen(stderr_fd_);
}

// ============================================================================
// STATE
// ============================================================================

bool ChildProcess::HasExited() const {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        // ECHILD: already reaped
        return true;
    }
    return info.si_pid != 0;
}

CapturedOutput ChildProcess::DrainOutput(std::optional<std::size_t> max_bytes) {
    CapturedOutput output;
    std::array<char, kReadChunkSize> buffer;

    while (stdout_fd_ >= 0 || stderr_fd_ >= 0) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (stdout_fd_ >= 0) {
            fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw core::EnvironmentError(errno, "poll failed while reading child output");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            const bool is_stdout = fds[i].fd == stdout_fd_;
            int& fd = is_stdout ? stdout_fd_ : stderr_fd_;
            CapturedStream& stream = is_stdout ? output.out : output.err;

            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                AppendCapped(stream, buffer.data(), static_cast<std::size_t>(n), max_bytes);
            } else if (n == 0 || errno != EINTR) {
                // EOF, or the pipe is unusable
                CloseIfOpen(fd);
            }
        }
    }

    return output;
}

WaitStatus ChildProcess::Wait() {
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        throw core::EnvironmentError(errno, "waitpid failed for pid " + std::to_string(pid_));
    }

    reaped_ = true;
    return DecodeStatus(status);
}

} // namespace monitors
} // namespace sandrun
