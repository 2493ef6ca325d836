#pragma once

#include <filesystem>
#include <string>

namespace vibium {
namespace binary {

enum class OS { LINUX, DARWIN, WINDOWS };

enum class Arch { X64, ARM64, UNSUPPORTED };

// Compile-time detection of the host
OS current_os();
Arch current_arch();

// "linux", "darwin", "win32"
std::string os_identifier(OS os);

// "<os>-<arch>", e.g. "linux-x64". Throws ResolutionError on an unsupported arch.
std::string platform_identifier();

// "clicker.exe" on Windows, "clicker" elsewhere
std::string binary_name();

// Per-user cache root:
// - Linux:   $XDG_CACHE_HOME/vibium or ~/.cache/vibium
// - macOS:   ~/Library/Caches/vibium
// - Windows: %LOCALAPPDATA%/vibium or ~/AppData/Local/vibium
std::filesystem::path cache_dir();

// Non-empty environment value, or "" when unset/empty
std::string env_or_empty(const char *name);

}  // namespace binary
}  // namespace vibium
