/**
 * @file process_tree.cpp
 * @brief Implementation of /proc based process tree walking and termination
 *
 * @date 2025
 */

#include "sandrun/monitors/process_tree.hpp"

#include <spdlog/spdlog.h>

#include <dirent.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <thread>

namespace sandrun {
namespace monitors {

namespace {

constexpr std::chrono::milliseconds kPollInterval{5};

bool IsNumeric(const char* name) {
    if (*name == '\0') {
        return false;
    }
    for (const char* p = name; *p != '\0'; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) {
            return false;
        }
    }
    return true;
}

// Every pid listed under /proc
std::vector<pid_t> ListPids() {
    std::vector<pid_t> pids;

    DIR* proc_dir = opendir("/proc");
    if (!proc_dir) {
        spdlog::warn("Cannot open /proc: {}", std::strerror(errno));
        return pids;
    }

    while (struct dirent* entry = readdir(proc_dir)) {
        if (IsNumeric(entry->d_name)) {
            pids.push_back(static_cast<pid_t>(std::stol(entry->d_name)));
        }
    }

    closedir(proc_dir);
    return pids;
}

// Signal a process, or its whole group when it is a group leader
void SignalTarget(pid_t pid, bool group_leader, int sig) {
    if (group_leader && kill(-pid, sig) == 0) {
        return;
    }
    if (kill(pid, sig) != 0 && errno != ESRCH) {
        spdlog::debug("kill({}, {}) failed: {}", pid, sig, std::strerror(errno));
    }
}

// Live members of a process group, including ones started after any
// earlier descendant snapshot
std::vector<pid_t> LiveGroupMembers(pid_t pgid) {
    std::vector<pid_t> members;
    for (pid_t pid : ListPids()) {
        auto entry = ReadProcessEntry(pid);
        if (entry && entry->pgid == pgid && entry->state != 'Z' && entry->state != 'X') {
            members.push_back(pid);
        }
    }
    return members;
}

bool AnyAlive(pid_t pid, bool group_leader, const std::vector<pid_t>& descendants) {
    if (IsProcessAlive(pid)) {
        return true;
    }
    if (group_leader && !LiveGroupMembers(pid).empty()) {
        return true;
    }
    return std::any_of(descendants.begin(), descendants.end(),
                       [](pid_t p) { return IsProcessAlive(p); });
}

} // anonymous namespace

// ============================================================================
// /proc INSPECTION
// ============================================================================

// Read process info from /proc/[pid]/stat
std::optional<ProcessEntry> ReadProcessEntry(pid_t pid) {
    std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
    if (!stat_file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(stat_file, line)) {
        return std::nullopt;
    }

    // Format: pid (comm) state ppid pgrp ...
    // comm may itself contain spaces and parentheses, so split on the last ')'
    size_t start = line.find('(');
    size_t end = line.rfind(')');
    if (start == std::string::npos || end == std::string::npos || end + 2 > line.size()) {
        return std::nullopt;
    }

    ProcessEntry entry;
    entry.pid = pid;
    entry.name = line.substr(start + 1, end - start - 1);

    std::istringstream iss(line.substr(end + 2));
    if (!(iss >> entry.state >> entry.ppid >> entry.pgid)) {
        return std::nullopt;
    }

    return entry;
}

std::vector<pid_t> CollectDescendants(pid_t root) {
    std::multimap<pid_t, pid_t> children;
    for (pid_t pid : ListPids()) {
        auto entry = ReadProcessEntry(pid);
        if (entry && entry->state != 'Z' && entry->state != 'X') {
            children.emplace(entry->ppid, entry->pid);
        }
    }

    std::vector<pid_t> descendants;
    std::vector<pid_t> frontier{root};
    while (!frontier.empty()) {
        std::vector<pid_t> next;
        for (pid_t parent : frontier) {
            auto range = children.equal_range(parent);
            for (auto it = range.first; it != range.second; ++it) {
                descendants.push_back(it->second);
                next.push_back(it->second);
            }
        }
        frontier = std::move(next);
    }

    return descendants;
}

bool IsProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    auto entry = ReadProcessEntry(pid);
    return entry && entry->state != 'Z' && entry->state != 'X';
}

// ============================================================================
// TERMINATION
// ============================================================================

TerminationReport TerminateProcessTree(pid_t pid, std::chrono::milliseconds grace) {
    TerminationReport report;
    if (pid <= 0) {
        spdlog::warn("Refusing to terminate invalid pid {}", pid);
        return report;
    }

    // Snapshot before signalling: once the parent dies its children are
    // reparented and can no longer be found through it
    const std::vector<pid_t> descendants = CollectDescendants(pid);
    // The group outlives its leader while other members remain
    const bool group_leader = getpgid(pid) == pid || kill(-pid, 0) == 0;

    report.found = group_leader || IsProcessAlive(pid) || !descendants.empty();
    report.descendants = descendants.size();
    if (!report.found) {
        spdlog::debug("Process {} already gone", pid);
        return report;
    }

    spdlog::debug("Terminating process tree {} ({} descendants, group leader: {})",
                  pid, descendants.size(), group_leader);

    SignalTarget(pid, group_leader, SIGTERM);
    for (pid_t child : descendants) {
        kill(child, SIGTERM);
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (AnyAlive(pid, group_leader, descendants) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!AnyAlive(pid, group_leader, descendants)) {
        report.exited_gracefully = true;
        return report;
    }

    spdlog::debug("Process tree {} survived SIGTERM, sending SIGKILL", pid);
    report.force_killed = true;
    SignalTarget(pid, group_leader, SIGKILL);

    // Fresh snapshot: anything forked during the grace period, including
    // children of processes that left the group
    std::vector<pid_t> survivors = CollectDescendants(pid);
    for (pid_t child : descendants) {
        if (IsProcessAlive(child)) {
            survivors.push_back(child);
            auto grandchildren = CollectDescendants(child);
            survivors.insert(survivors.end(), grandchildren.begin(), grandchildren.end());
        }
    }
    for (pid_t survivor : survivors) {
        kill(survivor, SIGKILL);
    }

    return report;
}

} // namespace monitors
} // namespace sandrun
