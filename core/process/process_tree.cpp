#include "process_tree.hpp"

#include <signal.h>

#include <cerrno>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "logging/logger.hpp"

namespace vibium {
namespace process {

namespace {

// Parses "pid (comm) state ppid ...". comm may contain spaces and parens,
// so fields are read after the last ')'.
bool read_stat(pid_t pid, char &state, pid_t &ppid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) {
        return false;
    }
    std::istringstream fields(line.substr(close_paren + 1));
    long parent = 0;
    if (!(fields >> state >> parent)) {
        return false;
    }
    ppid = static_cast<pid_t>(parent);
    return true;
}

}  // namespace

std::vector<pid_t> list_descendants(pid_t root) {
    std::vector<pid_t> result;
#ifdef __linux__
    std::unordered_multimap<pid_t, pid_t> children;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::stol(name));
        char state = 0;
        pid_t ppid = 0;
        if (read_stat(pid, state, ppid)) {
            children.emplace(ppid, pid);
        }
    }
    if (ec) {
        LOG_DEBUG("[ProcessTree] Failed to scan /proc: " << ec.message());
        return result;
    }

    std::deque<pid_t> queue{root};
    while (!queue.empty()) {
        pid_t parent = queue.front();
        queue.pop_front();
        auto range = children.equal_range(parent);
        for (auto it = range.first; it != range.second; ++it) {
            result.push_back(it->second);
            queue.push_back(it->second);
        }
    }
#else
    (void)root;
    LOG_DEBUG("[ProcessTree] Descendant enumeration not supported on this platform");
#endif
    return result;
}

bool is_process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) != 0 && errno == ESRCH) {
        return false;
    }
#ifdef __linux__
    char state = 0;
    pid_t ppid = 0;
    if (!read_stat(pid, state, ppid)) {
        return false;
    }
    return state != 'Z' && state != 'X';
#else
    return true;
#endif
}

}  // namespace process
}  // namespace vibium
