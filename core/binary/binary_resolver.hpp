#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace vibium {
namespace binary {

// Version of the clicker binary this library ships with; keys the extraction cache
constexpr const char *kClickerVersion = "0.1.2";

// Environment overrides, checked in this order
constexpr const char *kClickerPathEnv = "VIBIUM_CLICKER_PATH";
constexpr const char *kClickerPathAliasEnv = "CLICKER_PATH";

struct ResolverOptions {
    // Root of the installed bundle: <bundle_dir>/<platform>/bin/<binary>.
    // Empty disables the bundled step.
    std::filesystem::path bundle_dir;
    // Base for the development fallback paths. Empty = current working directory.
    std::filesystem::path working_dir;
    // Extraction target root. Empty = platform cache_dir().
    std::filesystem::path cache_root;
};

// Bundle directory chosen at build time (install data dir)
std::filesystem::path default_bundle_dir();

// BinaryResolver locates the clicker executable.
// Search order (first match wins):
//   1. explicit path (must exist and be executable, else ResolutionError)
//   2. VIBIUM_CLICKER_PATH, then CLICKER_PATH
//   3. bundled binary, extracted to <cache>/clicker/<version>/
//   4. PATH
//   5. <cache>/<binary>
//   6. development paths relative to the working directory
class BinaryResolver {
public:
    BinaryResolver();
    explicit BinaryResolver(ResolverOptions options);

    // Throws ResolutionError with remediation text when nothing is found
    std::string resolve(const std::string &explicit_path = "") const;

    const ResolverOptions &options() const { return options_; }

private:
    ResolverOptions options_;

    std::filesystem::path cache_root() const;
    std::optional<std::string> extract_bundled() const;
    std::optional<std::string> find_in_path(const std::string &name) const;
};

// Regular file with the execute permission for this user
bool is_executable(const std::filesystem::path &path);

}  // namespace binary
}  // namespace vibium
