#pragma once

#include <atomic>

namespace vibium {
namespace runtime {

// SIGINT/SIGTERM set a flag; the main loop polls it
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace vibium
