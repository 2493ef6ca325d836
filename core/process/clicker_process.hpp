#pragma once

#include <sys/types.h>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "binary/binary_resolver.hpp"

namespace vibium {
namespace process {

// Captured subprocess output is capped; oldest bytes are dropped first
constexpr size_t kMaxCapturedOutput = 1024u * 1024u;

// Grace period for the output reader to drain after the process exits
constexpr int kOutputDrainMs = 200;

enum class ProcessState { STARTING, RUNNING, STOPPING, STOPPED, CRASHED };

std::string process_state_to_string(ProcessState state);

struct StartOptions {
    bool headless = false;
    std::optional<int> port;      // nullopt or <= 0: clicker picks a free port
    std::string executable_path;  // empty: BinaryResolver search
    int start_timeout_ms = 10000;
    int stop_timeout_ms = 3000;
    // Linux: child gets SIGKILL when the thread that called start() exits.
    // Disable when starting from a short-lived thread.
    bool kill_on_parent_death = true;
};

// ClickerProcess manages the lifecycle of one clicker subprocess
// Responsibilities:
// - Spawn `<binary> serve [--port N] [--headless]` with stdout+stderr on one pipe
// - Wait for the "Server listening on ws://localhost:<port>" announcement
// - Detect exit (crash) independently of the output reader
// - Stop: descendants first, then SIGTERM -> wait -> SIGKILL
class ClickerProcess {
    // Restricts construction to the factory while still allowing make_unique/make_shared
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using ExitListener = std::function<void(int exit_code, const std::string &output)>;

    // Resolve, spawn and wait for the announced port.
    // Throws ResolutionError, ProcessCrashedError or StartTimeoutError.
    static std::shared_ptr<ClickerProcess> start(const StartOptions &options);
    static std::shared_ptr<ClickerProcess> start(const StartOptions &options, const binary::BinaryResolver &resolver);

    // Argument list after the binary path
    static std::vector<std::string> build_args(bool headless, std::optional<int> port);

    // Port from an announcement line, nullopt if the line does not match
    static std::optional<int> parse_announcement(const std::string &line);

    ~ClickerProcess();

    ClickerProcess(const ClickerProcess &) = delete;
    ClickerProcess &operator=(const ClickerProcess &) = delete;

    // Idempotent; a second call is a no-op
    void stop();

    // OS reports the process alive and stop() has not been called
    bool is_running() const;

    int port() const { return port_; }
    pid_t pid() const { return pid_; }
    const std::string &binary_path() const { return binary_path_; }

    ProcessState state() const;
    std::optional<int> exit_code() const;

    // Everything the process has written so far (bounded)
    std::string output() const;

    // Block until the process exits or the timeout elapses
    std::optional<int> wait_for_exit(int timeout_ms);

    // Called once, from the watcher thread, if the process exits while
    // RUNNING and stop() was not called
    void on_exit(ExitListener listener);

public:
    ClickerProcess(PrivateTag, const std::string &binary_path, int stop_timeout_ms, bool kill_on_parent_death);

private:
    void spawn(const std::vector<std::string> &args);
    int await_port(int timeout_ms);

    void read_output_loop();
    void watch_exit_loop();
    void handle_line(const std::string &line);
    void wait_output_drained(std::unique_lock<std::mutex> &lock);

    void kill_descendants();
    void force_terminate();
    void reap();

    std::string binary_path_;
    int stop_timeout_ms_;
    bool kill_on_parent_death_;

    pid_t pid_ = -1;
    int output_fd_ = -1;
    int port_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ProcessState state_ = ProcessState::STARTING;
    bool stopped_ = false;
    bool port_found_ = false;
    bool exited_ = false;
    bool reaped_ = false;
    bool output_done_ = false;
    bool reader_stop_ = false;
    int exit_code_ = -1;
    std::string output_;
    std::string partial_line_;
    ExitListener exit_listener_;

    std::thread reader_thread_;
    std::thread watcher_thread_;
};

}  // namespace process
}  // namespace vibium
