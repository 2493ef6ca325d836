#include "process_registry.hpp"

#include <cstdlib>
#include <exception>
#include <vector>

#include "clicker_process.hpp"
#include "logging/logger.hpp"

namespace vibium {
namespace process {

ProcessRegistry &ProcessRegistry::instance() {
    static ProcessRegistry registry;
    return registry;
}

void ProcessRegistry::register_process(const std::shared_ptr<ClickerProcess> &process) {
    if (!process) {
        return;
    }
    ensure_exit_hook();
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[process.get()] = process;
}

void ProcessRegistry::unregister_process(const ClickerProcess *process) {
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(process);
}

size_t ProcessRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

bool ProcessRegistry::exit_hook_installed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_hook_installed_;
}

void ProcessRegistry::stop_all() {
    // Snapshot under lock; stop() re-enters unregister_process()
    std::vector<std::shared_ptr<ClickerProcess>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[key, weak] : processes_) {
            if (auto process = weak.lock()) {
                live.push_back(std::move(process));
            }
        }
        processes_.clear();
    }

    if (live.empty()) {
        return;
    }

    LOG_INFO("[ProcessRegistry] Stopping " << live.size() << " active clicker process(es)");
    for (auto &process : live) {
        try {
            process->stop();
        } catch (const std::exception &e) {
            LOG_WARN("[ProcessRegistry] Error stopping process " << process->pid() << ": " << e.what());
        }
    }
}

void ProcessRegistry::ensure_exit_hook() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exit_hook_installed_) {
        return;
    }
    // instance() is constructed before this registration, so the hook runs
    // before the registry's static destructor.
    if (std::atexit(&ProcessRegistry::run_exit_hook) != 0) {
        LOG_WARN("[ProcessRegistry] Failed to install exit hook");
        return;
    }
    exit_hook_installed_ = true;
}

void ProcessRegistry::run_exit_hook() {
    LOG_DEBUG("[ProcessRegistry] Program exit detected, cleaning up processes");
    instance().stop_all();
}

}  // namespace process
}  // namespace vibium
