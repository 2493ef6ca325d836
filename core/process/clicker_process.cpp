#include "clicker_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <regex>

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "process_registry.hpp"
#include "process_tree.hpp"

namespace vibium {
namespace process {

namespace {

const std::regex &announcement_pattern() {
    static const std::regex pattern("Server listening on ws://localhost:(\\d+)");
    return pattern;
}

// Shell convention: 128 + signal number for signal deaths
int exit_code_from(const siginfo_t &info) {
    if (info.si_code == CLD_EXITED) {
        return info.si_status;
    }
    return 128 + info.si_status;
}

std::string errno_string() { return std::string(strerror(errno)); }

}  // namespace

std::string process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::STARTING:
            return "STARTING";
        case ProcessState::RUNNING:
            return "RUNNING";
        case ProcessState::STOPPING:
            return "STOPPING";
        case ProcessState::STOPPED:
            return "STOPPED";
        case ProcessState::CRASHED:
            return "CRASHED";
    }
    return "UNKNOWN";
}

std::vector<std::string> ClickerProcess::build_args(bool headless, std::optional<int> port) {
    std::vector<std::string> args{"serve"};
    if (port && *port > 0) {
        args.push_back("--port");
        args.push_back(std::to_string(*port));
    }
    if (headless) {
        args.push_back("--headless");
    }
    return args;
}

std::optional<int> ClickerProcess::parse_announcement(const std::string &line) {
    std::smatch match;
    if (!std::regex_search(line, match, announcement_pattern())) {
        return std::nullopt;
    }
    try {
        int port = std::stoi(match[1].str());
        if (port < 1 || port > 65535) {
            return std::nullopt;
        }
        return port;
    } catch (const std::exception &) {
        return std::nullopt;  // digits out of int range
    }
}

std::shared_ptr<ClickerProcess> ClickerProcess::start(const StartOptions &options) {
    binary::BinaryResolver resolver;
    return start(options, resolver);
}

std::shared_ptr<ClickerProcess> ClickerProcess::start(const StartOptions &options,
                                                      const binary::BinaryResolver &resolver) {
    std::string binary_path = resolver.resolve(options.executable_path);
    LOG_DEBUG("[Clicker] Starting clicker from: " << binary_path);

    auto proc =
        std::make_shared<ClickerProcess>(PrivateTag(), binary_path, options.stop_timeout_ms, options.kill_on_parent_death);
    proc->spawn(build_args(options.headless, options.port));

    int port = proc->await_port(options.start_timeout_ms);
    ProcessRegistry::instance().register_process(proc);

    LOG_INFO("[Clicker] Clicker started on port " << port << " (PID=" << proc->pid() << ")");
    return proc;
}

ClickerProcess::ClickerProcess(PrivateTag, const std::string &binary_path, int stop_timeout_ms,
                               bool kill_on_parent_death)
    : binary_path_(binary_path), stop_timeout_ms_(stop_timeout_ms), kill_on_parent_death_(kill_on_parent_death) {}

ClickerProcess::~ClickerProcess() {
    stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reader_stop_ = true;
    }
    cv_.notify_all();

    if (watcher_thread_.joinable()) {
        if (watcher_thread_.get_id() == std::this_thread::get_id()) {
            watcher_thread_.detach();
        } else {
            watcher_thread_.join();
        }
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    reap();

    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

void ClickerProcess::spawn(const std::vector<std::string> &args) {
    int out_pipe[2];
    if (pipe(out_pipe) < 0) {
        throw ProcessCrashedError(-1, "Failed to create output pipe: " + errno_string());
    }
    // dup2 onto stdout/stderr clears the flag in the child
    fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(out_pipe[1], F_SETFD, FD_CLOEXEC);

    // Everything the child needs is built before fork(): only async-signal-safe calls after it
    std::string abs_path = std::filesystem::absolute(binary_path_).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string exec_error = "Failed to exec " + abs_path + "\n";
    const pid_t parent_pid = getpid();
    const bool kill_on_parent_death = kill_on_parent_death_;

    pid_ = fork();
    if (pid_ < 0) {
        std::string error = "Fork failed: " + errno_string();
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw ProcessCrashedError(-1, error);
    }

    if (pid_ == 0) {
        // Child process
#ifdef __linux__
        if (kill_on_parent_death) {
            prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (getppid() != parent_pid) {
                _exit(1);
            }
        }
#else
        (void)kill_on_parent_death;
        (void)parent_pid;
#endif
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        // Combined stdout + stderr
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);

        execv(abs_path.c_str(), argv.data());

        // exec failed: report on the captured stream
        ssize_t ignored = write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(out_pipe[1]);
    output_fd_ = out_pipe[0];

    reader_thread_ = std::thread(&ClickerProcess::read_output_loop, this);
    watcher_thread_ = std::thread(&ClickerProcess::watch_exit_loop, this);

    LOG_DEBUG("[Clicker] Process spawned (PID=" << pid_ << ")");
}

int ClickerProcess::await_port(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready =
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return port_found_ || exited_; });

    // Exit wins over a late announcement: the endpoint is gone either way
    if (ready && exited_) {
        wait_output_drained(lock);
        state_ = ProcessState::CRASHED;
        stopped_ = true;
        int code = exit_code_;
        std::string output = output_;
        lock.unlock();

        LOG_ERROR("[Clicker] Process exited with code " << code << " before announcing its port");
        throw ProcessCrashedError(code, output);
    }

    if (!ready) {
        stopped_ = true;
        state_ = ProcessState::STOPPING;
        lock.unlock();

        LOG_ERROR("[Clicker] No port announcement within " << timeout_ms << "ms - killing process");
        kill_descendants();
        force_terminate();
        wait_for_exit(1000);

        lock.lock();
        state_ = ProcessState::STOPPED;
        throw StartTimeoutError(timeout_ms);
    }

    state_ = ProcessState::RUNNING;
    return port_;
}

void ClickerProcess::read_output_loop() {
    char buf[4096];
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reader_stop_) {
                break;
            }
        }

        struct pollfd pfd;
        pfd.fd = output_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int result = poll(&pfd, 1, 100);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_DEBUG("[Clicker] poll failed on output pipe: " << errno_string());
            break;
        }
        if (result == 0) {
            continue;
        }

        ssize_t n = read(output_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG_DEBUG("[Clicker] read failed on output pipe: " << errno_string());
            break;
        }
        if (n == 0) {
            break;  // EOF
        }

        std::lock_guard<std::mutex> lock(mutex_);
        partial_line_.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = partial_line_.find('\n')) != std::string::npos) {
            std::string line = partial_line_.substr(0, pos);
            partial_line_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            handle_line(line);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!partial_line_.empty()) {
        handle_line(partial_line_);
        partial_line_.clear();
    }
    output_done_ = true;
    cv_.notify_all();
}

// Caller holds mutex_
void ClickerProcess::handle_line(const std::string &line) {
    output_.append(line);
    output_.push_back('\n');
    if (output_.size() > kMaxCapturedOutput) {
        output_.erase(0, output_.size() - kMaxCapturedOutput);
    }

    LOG_TRACE("[clicker] " << line);

    // First match wins; later announcements are ignored
    if (port_found_) {
        return;
    }
    if (auto port = parse_announcement(line)) {
        port_ = *port;
        port_found_ = true;
        cv_.notify_all();
    }
}

void ClickerProcess::watch_exit_loop() {
    siginfo_t info;
    int code = -1;
    while (true) {
        std::memset(&info, 0, sizeof(info));
        // WNOWAIT leaves the zombie in place so the pid cannot be recycled before reap()
        if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == 0) {
            code = exit_code_from(info);
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        LOG_WARN("[Clicker] waitid failed for PID " << pid_ << ": " << errno_string());
        break;
    }

    ExitListener listener;
    std::string output;
    bool crashed = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ == ProcessState::RUNNING && !stopped_) {
            // Crash state is settled before exited_ becomes visible to waiters
            wait_output_drained(lock);
            if (!stopped_) {
                state_ = ProcessState::CRASHED;
                crashed = true;
                listener = exit_listener_;
                output = output_;
            }
        }
        exited_ = true;
        exit_code_ = code;
    }
    cv_.notify_all();

    if (crashed) {
        LOG_WARN("[Clicker] Process on port " << port_ << " exited unexpectedly with code " << code);
        if (listener) {
            listener(code, output);
        }
    } else {
        LOG_DEBUG("[Clicker] Process " << pid_ << " exited with code " << code);
    }
}

void ClickerProcess::wait_output_drained(std::unique_lock<std::mutex> &lock) {
    cv_.wait_for(lock, std::chrono::milliseconds(kOutputDrainMs), [this] { return output_done_; });
}

void ClickerProcess::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        if (state_ == ProcessState::RUNNING || state_ == ProcessState::STARTING) {
            state_ = ProcessState::STOPPING;
        }
    }
    ProcessRegistry::instance().unregister_process(this);

    bool exited = true;
    if (pid_ > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        exited = exited_;
    }

    if (!exited) {
        LOG_DEBUG("[Clicker] Stopping clicker process on port " << port_);

        // Descendants first: the browser and driver are not always taken down with the parent
        kill_descendants();

        kill(pid_, SIGTERM);
        if (!wait_for_exit(stop_timeout_ms_)) {
            LOG_DEBUG("[Clicker] Graceful stop timed out after " << stop_timeout_ms_ << "ms - force killing");
            force_terminate();
            wait_for_exit(1000);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ProcessState::STOPPING) {
        state_ = ProcessState::STOPPED;
    }
}

bool ClickerProcess::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || exited_ || pid_ <= 0) {
        return false;
    }
    return kill(pid_, 0) == 0;
}

ProcessState ClickerProcess::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<int> ClickerProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

std::string ClickerProcess::output() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

std::optional<int> ClickerProcess::wait_for_exit(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return std::nullopt;
    }
    if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return exited_; })) {
        return std::nullopt;
    }
    return exit_code_;
}

void ClickerProcess::on_exit(ExitListener listener) {
    int code = -1;
    std::string output;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ProcessState::CRASHED || stopped_) {
            exit_listener_ = std::move(listener);
            return;
        }
        // Crashed before the listener was attached
        code = exit_code_;
        output = output_;
    }
    if (listener) {
        listener(code, output);
    }
}

void ClickerProcess::kill_descendants() {
    if (pid_ <= 0) {
        return;
    }
    auto descendants = list_descendants(pid_);
    // Deepest first so nothing gets reparented mid-sweep
    for (auto it = descendants.rbegin(); it != descendants.rend(); ++it) {
        LOG_DEBUG("[Clicker] Killing descendant process: " << *it);
        kill(*it, SIGKILL);
    }
}

void ClickerProcess::force_terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0 && !exited_) {
        kill(pid_, SIGKILL);
    }
}

void ClickerProcess::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || !exited_ || reaped_) {
        return;
    }
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    reaped_ = true;
}

}  // namespace process
}  // namespace vibium
