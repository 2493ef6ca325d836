/**
 * binary_resolver_test.cpp - BinaryResolver and platform helper tests
 *
 * Tests:
 * - Explicit path: accepted when executable, ResolutionError naming the path otherwise
 * - Environment overrides and their precedence
 * - Bundled binary extraction into the versioned cache directory
 * - PATH, cache directory and development path fallbacks
 * - Remediation text when nothing is found
 */

#include "binary/binary_resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

#include "binary/platform.hpp"
#include "errors/errors.hpp"
#include "support/test_files.hpp"

using namespace vibium;
using namespace vibium::binary;
using vibium::tests::ScopedEnv;
using vibium::tests::TempDir;

namespace fs = std::filesystem;

class BinaryResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Isolate from the developer's environment; an empty PATH dir finds nothing
        empty_bin_ = scratch_.path() / "empty_bin";
        fs::create_directories(empty_bin_);
        path_env_ = std::make_unique<ScopedEnv>("PATH", empty_bin_.string());
        vibium_env_ = std::make_unique<ScopedEnv>(kClickerPathEnv, std::nullopt);
        alias_env_ = std::make_unique<ScopedEnv>(kClickerPathAliasEnv, std::nullopt);

        options_.bundle_dir = "";
        options_.working_dir = scratch_.path() / "work";
        options_.cache_root = scratch_.path() / "cache";
        fs::create_directories(options_.working_dir);
    }

    void TearDown() override {
        alias_env_.reset();
        vibium_env_.reset();
        path_env_.reset();
    }

    fs::path make_clicker(const fs::path &relative) { return scratch_.write_script(relative, "exit 0\n"); }

    TempDir scratch_;
    fs::path empty_bin_;
    ResolverOptions options_;
    std::unique_ptr<ScopedEnv> path_env_;
    std::unique_ptr<ScopedEnv> vibium_env_;
    std::unique_ptr<ScopedEnv> alias_env_;
};

/******************************************************************************
 * Explicit Path Tests
 ******************************************************************************/

TEST_F(BinaryResolverTest, ExplicitExecutablePathIsReturnedAsIs) {
    fs::path clicker = make_clicker("explicit/clicker");
    BinaryResolver resolver(options_);

    EXPECT_EQ(resolver.resolve(clicker.string()), clicker.string());
}

TEST_F(BinaryResolverTest, ExplicitNonExecutableFileFailsNamingThePath) {
    fs::path plain = scratch_.write_file("explicit/not_executable", "data");
    BinaryResolver resolver(options_);

    try {
        resolver.resolve(plain.string());
        FAIL() << "Expected ResolutionError";
    } catch (const ResolutionError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::RESOLUTION);
        EXPECT_EQ(e.path(), plain.string());
        EXPECT_NE(std::string(e.what()).find(plain.string()), std::string::npos);
    }
}

TEST_F(BinaryResolverTest, ExplicitMissingPathDoesNotFallBack) {
    // A valid binary further down the search must not mask the bad explicit path
    fs::path env_clicker = make_clicker("env/clicker");
    ScopedEnv env(kClickerPathEnv, env_clicker.string());
    BinaryResolver resolver(options_);

    EXPECT_THROW(resolver.resolve((scratch_.path() / "missing").string()), ResolutionError);
}

TEST_F(BinaryResolverTest, ExplicitDirectoryIsRejected) {
    BinaryResolver resolver(options_);
    EXPECT_THROW(resolver.resolve(scratch_.path().string()), ResolutionError);
}

/******************************************************************************
 * Environment Override Tests
 ******************************************************************************/

TEST_F(BinaryResolverTest, VibiumEnvVarWinsOverAlias) {
    fs::path primary = make_clicker("primary/clicker");
    fs::path alias = make_clicker("alias/clicker");
    ScopedEnv env(kClickerPathEnv, primary.string());
    ScopedEnv alias_env(kClickerPathAliasEnv, alias.string());
    BinaryResolver resolver(options_);

    EXPECT_EQ(resolver.resolve(), primary.string());
}

TEST_F(BinaryResolverTest, AliasEnvVarUsedWhenPrimaryUnset) {
    fs::path alias = make_clicker("alias/clicker");
    ScopedEnv alias_env(kClickerPathAliasEnv, alias.string());
    BinaryResolver resolver(options_);

    EXPECT_EQ(resolver.resolve(), alias.string());
}

TEST_F(BinaryResolverTest, EnvVarPointingNowhereFallsThroughToPath) {
    fs::path on_path = make_clicker("empty_bin/" + binary_name());
    ScopedEnv env(kClickerPathEnv, (scratch_.path() / "nope" / "clicker").string());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), on_path);
}

/******************************************************************************
 * Bundled Binary Tests
 ******************************************************************************/

TEST_F(BinaryResolverTest, BundledBinaryIsExtractedIntoVersionedCache) {
    std::string platform;
    try {
        platform = platform_identifier();
    } catch (const ResolutionError &) {
        GTEST_SKIP() << "No bundled binaries for this architecture";
    }

    // Bundle copies are plain files; extraction must add the exec bit
    scratch_.write_file(fs::path("bundle") / platform / "bin" / binary_name(), "#!/bin/sh\nexit 0\n");
    options_.bundle_dir = scratch_.path() / "bundle";
    BinaryResolver resolver(options_);

    fs::path expected = options_.cache_root / "clicker" / kClickerVersion / binary_name();
    EXPECT_EQ(fs::path(resolver.resolve()), expected);
    EXPECT_TRUE(is_executable(expected));

    // No temp files left behind
    size_t entries = 0;
    for (const auto &entry : fs::directory_iterator(expected.parent_path())) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(BinaryResolverTest, AlreadyExtractedBinaryIsNotOverwritten) {
    std::string platform;
    try {
        platform = platform_identifier();
    } catch (const ResolutionError &) {
        GTEST_SKIP() << "No bundled binaries for this architecture";
    }

    scratch_.write_file(fs::path("bundle") / platform / "bin" / binary_name(), "#!/bin/sh\necho new\n");
    options_.bundle_dir = scratch_.path() / "bundle";
    fs::path existing =
        scratch_.write_script(fs::path("cache") / "clicker" / kClickerVersion / binary_name(), "echo old\n");

    BinaryResolver resolver(options_);
    EXPECT_EQ(fs::path(resolver.resolve()), existing);

    std::ifstream in(existing.string());
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("echo old"), std::string::npos);
}

TEST_F(BinaryResolverTest, MissingBundleFallsThrough) {
    options_.bundle_dir = scratch_.path() / "no_bundle_here";
    fs::path on_path = make_clicker("empty_bin/" + binary_name());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), on_path);
}

/******************************************************************************
 * Fallback Search Tests
 ******************************************************************************/

TEST_F(BinaryResolverTest, FindsBinaryOnPath) {
    fs::path other_bin = scratch_.path() / "other_bin";
    fs::create_directories(other_bin);
    fs::path on_path = make_clicker("on_path/" + binary_name());
    ScopedEnv path_env("PATH", other_bin.string() + ":" + on_path.parent_path().string());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), on_path);
}

TEST_F(BinaryResolverTest, NonExecutableOnPathIsSkipped) {
    scratch_.write_file("empty_bin/" + binary_name(), "not executable");
    fs::path cached = make_clicker(fs::path("cache") / binary_name());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), cached);
}

TEST_F(BinaryResolverTest, FindsBinaryInCacheDirectory) {
    fs::path cached = make_clicker(fs::path("cache") / binary_name());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), cached);
}

TEST_F(BinaryResolverTest, FindsBinaryInDevelopmentTree) {
    // <work>/../../clicker/bin/clicker, as seen from a client package two levels down
    options_.working_dir = scratch_.path() / "repo" / "clients" / "cpp";
    fs::create_directories(options_.working_dir);
    fs::path dev = make_clicker(fs::path("repo") / "clicker" / "bin" / binary_name());
    BinaryResolver resolver(options_);

    EXPECT_EQ(fs::path(resolver.resolve()), fs::absolute(dev).lexically_normal());
}

TEST_F(BinaryResolverTest, NothingFoundCarriesRemediation) {
    BinaryResolver resolver(options_);

    try {
        resolver.resolve();
        FAIL() << "Expected ResolutionError";
    } catch (const ResolutionError &e) {
        EXPECT_TRUE(e.path().empty());
        EXPECT_NE(e.remediation().find("VIBIUM_CLICKER_PATH"), std::string::npos);
        EXPECT_NE(e.remediation().find("PATH"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Could not find clicker binary"), std::string::npos);
    }
}

/******************************************************************************
 * Platform Helper Tests
 ******************************************************************************/

TEST(PlatformTest, BinaryNameOnPosix) { EXPECT_EQ(binary_name(), "clicker"); }

TEST(PlatformTest, CacheDirHonorsXdgCacheHome) {
    if (current_os() != OS::LINUX) {
        GTEST_SKIP() << "XDG_CACHE_HOME applies to Linux only";
    }
    ScopedEnv xdg("XDG_CACHE_HOME", "/tmp/vibium-xdg");
    EXPECT_EQ(cache_dir(), fs::path("/tmp/vibium-xdg") / "vibium");
}

TEST(PlatformTest, CacheDirFallsBackToHome) {
    if (current_os() != OS::LINUX) {
        GTEST_SKIP() << "XDG_CACHE_HOME applies to Linux only";
    }
    ScopedEnv xdg("XDG_CACHE_HOME", std::nullopt);
    ScopedEnv home("HOME", "/tmp/vibium-home");
    EXPECT_EQ(cache_dir(), fs::path("/tmp/vibium-home") / ".cache" / "vibium");
}

TEST(PlatformTest, PlatformIdentifierNamesOsAndArch) {
    if (current_arch() == Arch::UNSUPPORTED) {
        EXPECT_THROW(platform_identifier(), ResolutionError);
        return;
    }
    std::string id = platform_identifier();
    EXPECT_EQ(id.rfind(os_identifier(current_os()) + "-", 0), 0u);
}
