#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

namespace vibium {
namespace process {

class ClickerProcess;

// ProcessRegistry tracks every live clicker process so none outlives the caller.
// The first registration installs a std::atexit hook that stops whatever is
// still registered at program shutdown. Processes unregister themselves in stop().
class ProcessRegistry {
public:
    static ProcessRegistry &instance();

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    void register_process(const std::shared_ptr<ClickerProcess> &process);
    void unregister_process(const ClickerProcess *process);

    // Stop every registered process; safe to call repeatedly
    void stop_all();

    size_t active_count() const;

    bool exit_hook_installed() const;

private:
    ProcessRegistry() = default;

    void ensure_exit_hook();
    static void run_exit_hook();

    mutable std::mutex mutex_;
    std::unordered_map<const ClickerProcess *, std::weak_ptr<ClickerProcess>> processes_;
    bool exit_hook_installed_ = false;
};

}  // namespace process
}  // namespace vibium
