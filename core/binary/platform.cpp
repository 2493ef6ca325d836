#include "platform.hpp"

#include <cstdlib>

#include "errors/errors.hpp"

namespace vibium {
namespace binary {

OS current_os() {
#if defined(_WIN32)
    return OS::WINDOWS;
#elif defined(__APPLE__)
    return OS::DARWIN;
#else
    return OS::LINUX;
#endif
}

Arch current_arch() {
#if defined(__x86_64__) || defined(_M_X64) || defined(__amd64__)
    return Arch::X64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    return Arch::ARM64;
#else
    return Arch::UNSUPPORTED;
#endif
}

std::string os_identifier(OS os) {
    switch (os) {
        case OS::LINUX:
            return "linux";
        case OS::DARWIN:
            return "darwin";
        case OS::WINDOWS:
            return "win32";
    }
    return "linux";
}

std::string platform_identifier() {
    std::string arch;
    switch (current_arch()) {
        case Arch::X64:
            arch = "x64";
            break;
        case Arch::ARM64:
            arch = "arm64";
            break;
        case Arch::UNSUPPORTED:
            throw ResolutionError("", "Unsupported architecture for bundled clicker binaries");
    }
    return os_identifier(current_os()) + "-" + arch;
}

std::string binary_name() { return current_os() == OS::WINDOWS ? "clicker.exe" : "clicker"; }

std::string env_or_empty(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return value;
}

std::filesystem::path cache_dir() {
    std::filesystem::path home = env_or_empty("HOME");
#ifdef _WIN32
    if (home.empty()) {
        home = env_or_empty("USERPROFILE");
    }
#endif

    switch (current_os()) {
        case OS::DARWIN:
            return home / "Library" / "Caches" / "vibium";
        case OS::WINDOWS: {
            std::string local_app_data = env_or_empty("LOCALAPPDATA");
            if (!local_app_data.empty()) {
                return std::filesystem::path(local_app_data) / "vibium";
            }
            return home / "AppData" / "Local" / "vibium";
        }
        case OS::LINUX:
        default: {
            std::string xdg_cache = env_or_empty("XDG_CACHE_HOME");
            if (!xdg_cache.empty()) {
                return std::filesystem::path(xdg_cache) / "vibium";
            }
            return home / ".cache" / "vibium";
        }
    }
}

}  // namespace binary
}  // namespace vibium
