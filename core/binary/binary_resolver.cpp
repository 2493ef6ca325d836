#include "binary_resolver.hpp"

#include <chrono>
#include <sstream>
#include <system_error>
#include <vector>

#include "errors/errors.hpp"
#include "logging/logger.hpp"
#include "platform.hpp"

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#ifndef VIBIUM_BUNDLE_DIR
#define VIBIUM_BUNDLE_DIR ""
#endif

namespace vibium {
namespace binary {

namespace fs = std::filesystem;

namespace {

const char *const kRemediation =
    "Options:\n"
    "  1. Set VIBIUM_CLICKER_PATH environment variable\n"
    "  2. Add clicker to your PATH\n"
    "  3. Build from source: make build-go";

std::string unique_suffix() {
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
#ifdef _WIN32
    return std::to_string(_getpid()) + "." + std::to_string(ms);
#else
    return std::to_string(getpid()) + "." + std::to_string(ms);
#endif
}

}  // namespace

bool is_executable(const fs::path &path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

fs::path default_bundle_dir() { return fs::path(VIBIUM_BUNDLE_DIR); }

BinaryResolver::BinaryResolver() {
    options_.bundle_dir = default_bundle_dir();
}

BinaryResolver::BinaryResolver(ResolverOptions options) : options_(std::move(options)) {}

fs::path BinaryResolver::cache_root() const {
    if (!options_.cache_root.empty()) {
        return options_.cache_root;
    }
    return cache_dir();
}

std::string BinaryResolver::resolve(const std::string &explicit_path) const {
    const std::string name = binary_name();

    // 1. Explicit path
    if (!explicit_path.empty()) {
        if (is_executable(explicit_path)) {
            LOG_DEBUG("[Resolver] Using explicit clicker path: " << explicit_path);
            return explicit_path;
        }
        throw ResolutionError(explicit_path, "Clicker binary not found or not executable at explicit path: " +
                                                 explicit_path);
    }

    // 2. Environment override
    std::string env_path = env_or_empty(kClickerPathEnv);
    if (env_path.empty()) {
        env_path = env_or_empty(kClickerPathAliasEnv);
    }
    if (!env_path.empty()) {
        if (is_executable(env_path)) {
            LOG_DEBUG("[Resolver] Using env var clicker path: " << env_path);
            return env_path;
        }
        LOG_WARN("[Resolver] Environment variable set but binary not found: " << env_path);
    }

    // 3. Bundled binary, extracted to cache
    if (auto bundled = extract_bundled()) {
        LOG_DEBUG("[Resolver] Using bundled clicker: " << *bundled);
        return *bundled;
    }

    // 4. System PATH
    if (auto on_path = find_in_path(name)) {
        LOG_DEBUG("[Resolver] Using clicker from PATH: " << *on_path);
        return *on_path;
    }

    // 5. Cache directory (placed there manually or by another tool)
    fs::path cached = cache_root() / name;
    if (is_executable(cached)) {
        LOG_DEBUG("[Resolver] Using clicker from cache: " << cached.string());
        return cached.string();
    }

    // 6. Local development paths
    std::error_code ec;
    fs::path cwd = options_.working_dir.empty() ? fs::current_path(ec) : options_.working_dir;
    const std::vector<fs::path> local_paths = {
        cwd / "clicker" / "bin" / name,              // repo root
        cwd / ".." / ".." / "clicker" / "bin" / name,  // clients/<lang>/
        cwd / ".." / ".." / ".." / "clicker" / "bin" / name,
    };
    for (const auto &local : local_paths) {
        if (is_executable(local)) {
            std::string absolute = fs::absolute(local, ec).lexically_normal().string();
            LOG_DEBUG("[Resolver] Using local clicker path: " << absolute);
            return absolute;
        }
    }

    throw ResolutionError("", "Could not find clicker binary.", kRemediation);
}

std::optional<std::string> BinaryResolver::extract_bundled() const {
    if (options_.bundle_dir.empty()) {
        return std::nullopt;
    }

    std::string platform;
    try {
        platform = platform_identifier();
    } catch (const ResolutionError &e) {
        LOG_DEBUG("[Resolver] No bundled binary: " << e.what());
        return std::nullopt;
    }

    const std::string name = binary_name();
    fs::path source = options_.bundle_dir / platform / "bin" / name;
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        LOG_DEBUG("[Resolver] No bundled binary at: " << source.string());
        return std::nullopt;
    }

    fs::path target_dir = cache_root() / "clicker" / kClickerVersion;
    fs::path target = target_dir / name;

    // Already extracted: never overwrite a binary that may be running
    if (is_executable(target)) {
        return target.string();
    }

    fs::create_directories(target_dir, ec);
    if (ec) {
        LOG_WARN("[Resolver] Failed to create cache dir " << target_dir.string() << ": " << ec.message());
        return std::nullopt;
    }

    // Write to a temp file, then rename so a concurrent resolve never sees a partial binary
    fs::path temp = target_dir / (name + ".tmp." + unique_suffix());
    if (!fs::copy_file(source, temp, fs::copy_options::overwrite_existing, ec)) {
        LOG_WARN("[Resolver] Failed to extract bundled binary: " << ec.message());
        fs::remove(temp, ec);
        return std::nullopt;
    }

#ifndef _WIN32
    fs::permissions(temp, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        LOG_WARN("[Resolver] Failed to mark extracted binary executable: " << ec.message());
        fs::remove(temp, ec);
        return std::nullopt;
    }
#endif

    fs::rename(temp, target, ec);
    if (ec) {
        LOG_WARN("[Resolver] Failed to move extracted binary into place: " << ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        // Another resolver may have won the race
        if (is_executable(target)) {
            return target.string();
        }
        return std::nullopt;
    }

    if (!is_executable(target)) {
        LOG_WARN("[Resolver] Extracted binary is not executable: " << target.string());
        return std::nullopt;
    }

    LOG_INFO("[Resolver] Extracted clicker binary to: " << target.string());
    return target.string();
}

std::optional<std::string> BinaryResolver::find_in_path(const std::string &name) const {
    std::string path_env = env_or_empty("PATH");
    if (path_env.empty()) {
        return std::nullopt;
    }

#ifdef _WIN32
    const char separator = ';';
#else
    const char separator = ':';
#endif

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, separator)) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) {
            std::error_code ec;
            return fs::absolute(candidate, ec).string();
        }
    }
    return std::nullopt;
}

}  // namespace binary
}  // namespace vibium
