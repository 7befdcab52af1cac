// test_build_orchestrator.cpp - Tests for the architecture model and BuildOrchestrator
// Part of fatpack - Framework Packaging Build Tool

#include "core/architecture.hpp"
#include "core/build_orchestrator.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <memory>
#include <set>

namespace fs = std::filesystem;
using namespace fatpack;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { \
        tests_run++; \
        std::cout << "  Testing: " << #name << "... "; \
        try { \
            test_##name(); \
            tests_passed++; \
            std::cout << "PASS\n"; \
        } catch (const std::exception& e) { \
            std::cout << "FAIL: " << e.what() << "\n"; \
        } \
    } while(0)

#define ASSERT(cond) \
    if (!(cond)) { \
        throw std::runtime_error("Assertion failed: " #cond); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    }

// =============================================================================
// Test Fixtures
// =============================================================================

// Stand-in for xcodebuild: records its arguments, fails when a marker exists
static const char* FAKE_TOOLCHAIN = R"SH(#!/bin/sh
echo "$@" > "@DIR@/last_args"
echo "compiling $*"
if [ -f "@DIR@/fail" ]; then
  echo "error: no such module" 1>&2
  exit 65
fi
echo "** BUILD SUCCEEDED **"
)SH";

class TestFixture {
public:
    fs::path test_dir;
    fs::path toolchain;
    fs::path log_dir;

    TestFixture() {
        test_dir = fs::temp_directory_path() / "fatpack_orchestrator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        log_dir = test_dir / "logs";
        fs::create_directories(log_dir);

        toolchain = test_dir / "xcodebuild";
        std::string script = FAKE_TOOLCHAIN;
        std::string dir = test_dir.string();
        for (size_t pos; (pos = script.find("@DIR@")) != std::string::npos; ) {
            script.replace(pos, 5, dir);
        }
        std::ofstream out(toolchain);
        out << script;
        out.close();
        fs::permissions(toolchain, fs::perms::owner_all | fs::perms::group_read |
                                   fs::perms::group_exec);
    }

    ~TestFixture() {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    BuildConfig config() const {
        BuildConfig cfg;
        cfg.project_root = test_dir / "project";
        cfg.toolchain = toolchain.string();
        return cfg;
    }

    void set_failing(bool failing) const {
        if (failing) {
            std::ofstream(test_dir / "fail") << "1";
        } else {
            fs::remove(test_dir / "fail");
        }
    }
};

static std::unique_ptr<TestFixture> fixture;

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

// Value following a flag such as -sdk
static std::string value_after(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

// =============================================================================
// Architecture Model Tests
// =============================================================================

void test_platform_mapping() {
    ASSERT(platform_for(Architecture::ARMV7) == TargetPlatform::DEVICE);
    ASSERT(platform_for(Architecture::ARM64) == TargetPlatform::DEVICE);
    ASSERT(platform_for(Architecture::I386) == TargetPlatform::SIMULATOR);
    ASSERT(platform_for(Architecture::X86_64) == TargetPlatform::SIMULATOR);
    ASSERT(platform_for(Architecture::X86_64H) == TargetPlatform::CATALYST);
}

void test_sdk_and_folder_names() {
    ASSERT_EQ(std::string(sdk_name(TargetPlatform::DEVICE)), "iphoneos");
    ASSERT_EQ(std::string(sdk_name(TargetPlatform::SIMULATOR)), "iphonesimulator");
    ASSERT_EQ(std::string(sdk_name(TargetPlatform::CATALYST)), "macosx");
    ASSERT_EQ(std::string(output_folder_name(TargetPlatform::DEVICE)), "iphoneos");
    ASSERT_EQ(std::string(output_folder_name(TargetPlatform::CATALYST)), "maccatalyst");
}

void test_extra_compiler_flags() {
    auto device = extra_compiler_flags(TargetPlatform::DEVICE);
    ASSERT_EQ(device.size(), 1UL);
    ASSERT_EQ(device[0], std::string("-fembed-bitcode"));
    ASSERT(extra_compiler_flags(TargetPlatform::SIMULATOR).empty());
    ASSERT(extra_compiler_flags(TargetPlatform::CATALYST).empty());
}

void test_parse_architecture() {
    for (Architecture arch : all_architectures()) {
        auto parsed = parse_architecture(architecture_name(arch));
        ASSERT(parsed.has_value());
        ASSERT(*parsed == arch);
    }
    ASSERT(!parse_architecture("ppc").has_value());
    ASSERT(!parse_architecture("").has_value());
}

// =============================================================================
// Grouping Tests
// =============================================================================

void test_group_example() {
    auto groups = group_architectures({Architecture::ARMV7, Architecture::ARM64,
                                       Architecture::X86_64H});
    ASSERT_EQ(groups.size(), 2UL);
    ASSERT(groups[0] == ArchitectureGroup({Architecture::ARMV7, Architecture::ARM64}));
    ASSERT(groups[1] == ArchitectureGroup({Architecture::X86_64H}));
}

void test_group_both_pairs() {
    auto groups = group_architectures({Architecture::X86_64, Architecture::I386,
                                       Architecture::ARM64, Architecture::ARMV7});
    ASSERT_EQ(groups.size(), 2UL);
    ASSERT(groups[0] == ArchitectureGroup({Architecture::ARMV7, Architecture::ARM64}));
    ASSERT(groups[1] == ArchitectureGroup({Architecture::I386, Architecture::X86_64}));
}

void test_group_singletons_without_pair() {
    auto groups = group_architectures({Architecture::ARM64, Architecture::X86_64});
    ASSERT_EQ(groups.size(), 2UL);
    ASSERT(groups[0] == ArchitectureGroup({Architecture::ARM64}));
    ASSERT(groups[1] == ArchitectureGroup({Architecture::X86_64}));
}

void test_group_empty() {
    ASSERT(group_architectures({}).empty());
}

void test_group_covers_every_subset() {
    const auto& all = all_architectures();

    for (unsigned mask = 1; mask < (1u << all.size()); ++mask) {
        std::set<Architecture> requested;
        for (size_t i = 0; i < all.size(); ++i) {
            if (mask & (1u << i)) requested.insert(all[i]);
        }

        auto groups = group_architectures(requested);

        // Exactly the requested set, no duplicates
        std::multiset<Architecture> covered;
        for (const auto& group : groups) {
            ASSERT(!group.empty() && group.size() <= 2);
            covered.insert(group.begin(), group.end());

            // Members of a group share a platform
            for (Architecture arch : group) {
                ASSERT(platform_for(arch) == platform_for(group.front()));
            }
        }
        ASSERT(std::set<Architecture>(covered.begin(), covered.end()) == requested);
        ASSERT_EQ(covered.size(), requested.size());

        // Pairs are used whenever both members are present
        bool has_device_pair = requested.count(Architecture::ARMV7) &&
                               requested.count(Architecture::ARM64);
        bool has_sim_pair = requested.count(Architecture::I386) &&
                            requested.count(Architecture::X86_64);
        size_t pairs = 0;
        for (const auto& group : groups) {
            if (group.size() == 2) pairs++;
        }
        ASSERT_EQ(pairs, static_cast<size_t>(has_device_pair) + static_cast<size_t>(has_sim_pair));

        // Deterministic
        ASSERT(group_architectures(requested) == groups);
    }
}

void test_catalyst_is_always_singleton() {
    std::set<Architecture> everything(all_architectures().begin(), all_architectures().end());
    auto groups = group_architectures(everything);

    size_t catalyst_groups = 0;
    for (const auto& group : groups) {
        if (std::find(group.begin(), group.end(), Architecture::X86_64H) != group.end()) {
            ASSERT_EQ(group.size(), 1UL);
            catalyst_groups++;
        }
    }
    ASSERT_EQ(catalyst_groups, 1UL);
    ASSERT(groups.back() == ArchitectureGroup({Architecture::X86_64H}));
}

void test_group_to_string() {
    ASSERT_EQ(group_to_string({Architecture::ARMV7, Architecture::ARM64}), std::string("armv7 arm64"));
    ASSERT_EQ(group_to_string({Architecture::X86_64H}), std::string("x86_64h"));
}

// =============================================================================
// Naming Tests
// =============================================================================

void test_real_framework_name() {
    ASSERT_EQ(real_framework_name("PromisesObjC"), std::string("FBLPromises"));
    ASSERT_EQ(real_framework_name("Protobuf"), std::string("protobuf"));
    ASSERT_EQ(real_framework_name("FirebaseCore"), std::string("FirebaseCore"));
    // Exact match only
    ASSERT_EQ(real_framework_name("promisesobjc"), std::string("promisesobjc"));
    ASSERT_EQ(real_framework_name("PromisesObjCExtra"), std::string("PromisesObjCExtra"));
}

void test_thin_framework_path() {
    fs::path build_dir = "/work/armv7";
    fs::path device = BuildOrchestrator::thin_framework_path(
        build_dir, "PromisesObjC", {Architecture::ARMV7, Architecture::ARM64});
    ASSERT_EQ(device, fs::path("/work/armv7/Release-iphoneos/PromisesObjC/FBLPromises.framework"));

    fs::path catalyst = BuildOrchestrator::thin_framework_path(
        "/work/x86_64h", "FirebaseCore", {Architecture::X86_64H});
    ASSERT_EQ(catalyst, fs::path("/work/x86_64h/Release-maccatalyst/FirebaseCore/FirebaseCore.framework"));
}

void test_log_file_path() {
    fs::path log = BuildOrchestrator::log_file_path(
        "/logs", "FirebaseCore", {Architecture::I386, Architecture::X86_64});
    ASSERT_EQ(log, fs::path("/logs/FirebaseCore-i386-iphonesimulator.txt"));

    fs::path catalyst = BuildOrchestrator::log_file_path(
        "/logs", "FirebaseCore", {Architecture::X86_64H});
    ASSERT_EQ(catalyst, fs::path("/logs/FirebaseCore-x86_64h-macosx.txt"));
}

// =============================================================================
// Argument Tests
// =============================================================================

void test_arguments_device_pair() {
    BuildOrchestrator orchestrator(fixture->config());
    auto args = orchestrator.build_arguments(
        "FirebaseCore", {Architecture::ARMV7, Architecture::ARM64}, "/work/armv7");

    ASSERT_EQ(args[0], std::string("build"));
    ASSERT_EQ(value_after(args, "-configuration"), std::string("release"));
    ASSERT_EQ(value_after(args, "-scheme"), std::string("FirebaseCore"));
    ASSERT_EQ(value_after(args, "-sdk"), std::string("iphoneos"));
    ASSERT_EQ(value_after(args, "-workspace"),
              (fixture->test_dir / "project" / "FrameworkMaker.xcworkspace").string());
    ASSERT(contains(args, "GCC_GENERATE_DEBUGGING_SYMBOLS=No"));
    ASSERT(contains(args, "ARCHS=armv7 arm64"));
    ASSERT(contains(args, "VALID_ARCHS=armv7 arm64"));
    ASSERT(contains(args, "ONLY_ACTIVE_ARCH=NO"));
    ASSERT(contains(args, "BUILD_LIBRARIES_FOR_DISTRIBUTION=YES"));
    ASSERT(contains(args, "SUPPORTS_MACCATALYST=NO"));
    ASSERT(contains(args, "BUILD_DIR=/work/armv7"));
    ASSERT_EQ(args.back(),
              std::string("OTHER_CFLAGS=$(value) -DFIREBASE_BUILD_ZIP_FILE -fembed-bitcode"));
}

void test_arguments_catalyst() {
    BuildOrchestrator orchestrator(fixture->config());
    auto args = orchestrator.build_arguments("FirebaseCore", {Architecture::X86_64H}, "/work/x86_64h");

    ASSERT(contains(args, "ARCHS=x86_64"));
    ASSERT(contains(args, "VALID_ARCHS=x86_64"));
    ASSERT(contains(args, "SUPPORTS_MACCATALYST=YES"));
    ASSERT_EQ(value_after(args, "-sdk"), std::string("macosx"));
    ASSERT_EQ(args.back(), std::string("OTHER_CFLAGS=$(value) -DFIREBASE_BUILD_ZIP_FILE"));
}

void test_arguments_carthage_flag() {
    BuildConfig cfg = fixture->config();
    cfg.mode = DistributionMode::CARTHAGE;
    BuildOrchestrator orchestrator(cfg);
    auto args = orchestrator.build_arguments("FirebaseCore", {Architecture::X86_64}, "/work/x86_64");

    ASSERT_EQ(value_after(args, "-sdk"), std::string("iphonesimulator"));
    ASSERT_EQ(args.back(), std::string("OTHER_CFLAGS=$(value) -DFIREBASE_BUILD_CARTHAGE"));
}

void test_arguments_are_deterministic() {
    BuildOrchestrator orchestrator(fixture->config());
    ArchitectureGroup group = {Architecture::I386, Architecture::X86_64};
    ASSERT(orchestrator.build_arguments("A", group, "/b") ==
           orchestrator.build_arguments("A", group, "/b"));
}

// =============================================================================
// build_group Tests
// =============================================================================

void test_build_group_success() {
    fixture->set_failing(false);
    BuildOrchestrator orchestrator(fixture->config());

    std::vector<BuildProgress> reports;
    orchestrator.set_progress_callback([&](const BuildProgress& p) { reports.push_back(p); });

    fs::path build_dir = fixture->test_dir / "project" / "arm64";
    auto result = orchestrator.build_group("PromisesObjC", {Architecture::ARM64},
                                           build_dir, fixture->log_dir);

    ASSERT(result.ok());
    ASSERT_EQ(result.location.path,
              build_dir / "Release-iphoneos" / "PromisesObjC" / "FBLPromises.framework");
    ASSERT(result.location.group == ArchitectureGroup({Architecture::ARM64}));

    // Success log is written with the captured output
    fs::path log = fixture->log_dir / "PromisesObjC-arm64-iphoneos.txt";
    ASSERT_EQ(result.location.log_file, log);
    ASSERT(fs::exists(log));
    ASSERT(read_file(log).find("** BUILD SUCCEEDED **") != std::string::npos);

    // The toolchain received the constructed arguments
    std::string last_args = read_file(fixture->test_dir / "last_args");
    ASSERT(last_args.find("-scheme PromisesObjC") != std::string::npos);
    ASSERT(last_args.find("ARCHS=arm64") != std::string::npos);

    ASSERT(!reports.empty());
    ASSERT(reports.front().message.find(fixture->toolchain.string()) != std::string::npos);
}

void test_build_group_failure_writes_log() {
    fixture->set_failing(true);
    BuildOrchestrator orchestrator(fixture->config());

    fs::path build_dir = fixture->test_dir / "project" / "i386";
    auto result = orchestrator.build_group("FirebaseCore",
                                           {Architecture::I386, Architecture::X86_64},
                                           build_dir, fixture->log_dir);
    fixture->set_failing(false);

    ASSERT(!result.ok());
    ASSERT(result.status.error == BuildError::TOOLCHAIN_FAILED);
    ASSERT_EQ(result.status.exit_code, 65);
    ASSERT(result.status.output.find("error: no such module") != std::string::npos);

    fs::path log = fixture->log_dir / "FirebaseCore-i386-iphonesimulator.txt";
    ASSERT_EQ(result.status.log_file, log);
    ASSERT(fs::exists(log));
    ASSERT_EQ(read_file(log), result.status.output);
    ASSERT(result.status.message.find(log.string()) != std::string::npos);
}

void test_build_group_failure_unwritable_log() {
    fixture->set_failing(true);
    BuildOrchestrator orchestrator(fixture->config());

    auto result = orchestrator.build_group("FirebaseCore", {Architecture::ARM64},
                                           fixture->test_dir / "project" / "arm64",
                                           fixture->test_dir / "missing" / "logs");
    fixture->set_failing(false);

    ASSERT(!result.ok());
    ASSERT(result.status.error == BuildError::FILESYSTEM_ERROR);
    ASSERT_EQ(result.status.exit_code, 65);
}

void test_build_group_success_unwritable_log() {
    fixture->set_failing(false);
    BuildOrchestrator orchestrator(fixture->config());

    // Losing the log of a successful build is not an error
    auto result = orchestrator.build_group("FirebaseCore", {Architecture::ARM64},
                                           fixture->test_dir / "project" / "arm64",
                                           fixture->test_dir / "missing" / "logs");
    ASSERT(result.ok());
}

void test_build_group_missing_toolchain() {
    BuildConfig cfg = fixture->config();
    cfg.toolchain = (fixture->test_dir / "no-such-xcodebuild").string();
    BuildOrchestrator orchestrator(cfg);

    fs::path log_dir = fixture->test_dir / "missing_toolchain_logs";
    fs::create_directories(log_dir);

    auto result = orchestrator.build_group("FirebaseCore", {Architecture::ARM64},
                                           fixture->test_dir / "project" / "arm64",
                                           log_dir);
    ASSERT(!result.ok());
    ASSERT(result.status.error == BuildError::SPAWN_FAILED);
    ASSERT(result.status.message.find("no-such-xcodebuild") != std::string::npos);

    // Nothing was run, so no log either
    ASSERT(fs::is_empty(log_dir));
}

void test_build_group_toolchain_not_on_path() {
    // Bare names go through the PATH search; a miss is the exec failure code
    BuildConfig cfg = fixture->config();
    cfg.toolchain = "fatpack-no-such-xcodebuild";
    BuildOrchestrator orchestrator(cfg);
    ASSERT(orchestrator.check_toolchain().ok());

    auto result = orchestrator.build_group("FirebaseCore", {Architecture::ARM64},
                                           fixture->test_dir / "project" / "arm64",
                                           fixture->log_dir);
    ASSERT(!result.ok());
    ASSERT(result.status.error == BuildError::TOOLCHAIN_FAILED);
    ASSERT_EQ(result.status.exit_code, ProcessExecutor::EXEC_FAILED_EXIT_CODE);
}

void test_check_toolchain() {
    ASSERT(BuildOrchestrator(fixture->config()).check_toolchain().ok());

    // A directory is not a toolchain
    BuildConfig cfg = fixture->config();
    cfg.toolchain = fixture->test_dir.string();
    ASSERT(BuildOrchestrator(cfg).check_toolchain().error == BuildError::SPAWN_FAILED);
}

void test_build_group_empty() {
    BuildOrchestrator orchestrator(fixture->config());
    auto result = orchestrator.build_group("FirebaseCore", {}, "/b", fixture->log_dir);
    ASSERT(result.status.error == BuildError::INVALID_REQUEST);
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== BuildOrchestrator Test Suite ===\n\n";

    // Setup
    fixture = std::make_unique<TestFixture>();

    std::cout << "Architecture Model Tests:\n";
    TEST(platform_mapping);
    TEST(sdk_and_folder_names);
    TEST(extra_compiler_flags);
    TEST(parse_architecture);

    std::cout << "\nGrouping Tests:\n";
    TEST(group_example);
    TEST(group_both_pairs);
    TEST(group_singletons_without_pair);
    TEST(group_empty);
    TEST(group_covers_every_subset);
    TEST(catalyst_is_always_singleton);
    TEST(group_to_string);

    std::cout << "\nNaming Tests:\n";
    TEST(real_framework_name);
    TEST(thin_framework_path);
    TEST(log_file_path);

    std::cout << "\nArgument Tests:\n";
    TEST(arguments_device_pair);
    TEST(arguments_catalyst);
    TEST(arguments_carthage_flag);
    TEST(arguments_are_deterministic);

    std::cout << "\nbuild_group Tests:\n";
    TEST(build_group_success);
    TEST(build_group_failure_writes_log);
    TEST(build_group_failure_unwritable_log);
    TEST(build_group_success_unwritable_log);
    TEST(build_group_missing_toolchain);
    TEST(build_group_toolchain_not_on_path);
    TEST(check_toolchain);
    TEST(build_group_empty);

    // Cleanup
    fixture.reset();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << tests_passed << "/" << tests_run << "\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
