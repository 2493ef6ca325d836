#pragma once

#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>

namespace vibium::tests {

/**
 * Unique scratch directory, removed on destruction.
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("vibium_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path write_file(const std::filesystem::path &relative, const std::string &content) const {
        std::filesystem::path target = path_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target.string(), std::ios::binary | std::ios::trunc);
        out << content;
        out.close();
        return target;
    }

    /**
     * Write a /bin/sh script and mark it executable.
     */
    std::filesystem::path write_script(const std::filesystem::path &relative, const std::string &body) const {
        std::filesystem::path script = write_file(relative, "#!/bin/sh\n" + body);
        std::filesystem::permissions(script,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return script;
    }

private:
    std::filesystem::path path_;
};

/**
 * Sets (or unsets) an environment variable for the current scope.
 */
class ScopedEnv {
public:
    ScopedEnv(const std::string &name, const std::optional<std::string> &value) : name_(name) {
        const char *old = std::getenv(name.c_str());
        if (old != nullptr) {
            old_value_ = std::string(old);
        }
        if (value) {
            setenv(name.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
    }

    ~ScopedEnv() {
        if (old_value_) {
            setenv(name_.c_str(), old_value_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
    std::string name_;
    std::optional<std::string> old_value_;
};

/**
 * Poll a predicate until it holds or the timeout elapses.
 */
template <typename Predicate>
bool wait_until(Predicate predicate, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

}  // namespace vibium::tests
